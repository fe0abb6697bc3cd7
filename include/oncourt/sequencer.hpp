#pragma once

#include "oncourt/types.hpp"
#include <expected>
#include <vector>

namespace oncourt {

// Attaches game_time_remaining / max_period_time to every event and sorts
// them into processing order: time remaining descending, then period, then
// event number. Overtime periods are sequenced after regulation and after
// each other, since their clocks restart from 5:00.
std::expected<std::vector<Event>, PipelineError> sequence_events(
    std::vector<Event> events);

// Strict weak ordering used by sequence_events. Both events must already
// carry their normalized time.
bool precedes(const Event& a, const Event& b);

} // namespace oncourt
