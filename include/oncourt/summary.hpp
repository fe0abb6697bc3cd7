#pragma once

#include "oncourt/time_bank.hpp"
#include "oncourt/types.hpp"
#include <vector>

namespace oncourt {

// Seconds and stint counts per player, grouped by team (home first).
// Players who never took the court are listed with zero.
std::vector<TeamMinutes> minutes_by_team(
    const IntervalSet& intervals, TeamId home_id, TeamId visitor_id);

// Length of regulation plus every overtime period that was played.
double game_length_secs(int periods_played);

} // namespace oncourt
