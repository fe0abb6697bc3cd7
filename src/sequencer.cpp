#include "oncourt/sequencer.hpp"
#include "oncourt/clock.hpp"
#include <algorithm>
#include <tuple>

namespace oncourt {

bool precedes(const Event& a, const Event& b) {
    return std::make_tuple(clock_block(a.period), -a.game_time_remaining, a.period, a.event_num) <
           std::make_tuple(clock_block(b.period), -b.game_time_remaining, b.period, b.event_num);
}

std::expected<std::vector<Event>, PipelineError> sequence_events(
    std::vector<Event> events) {

    for (auto& e : events) {
        auto reading = normalize_clock(e.clock, e.period);
        if (!reading) {
            auto err = reading.error();
            err.event_num = e.event_num;
            return std::unexpected(std::move(err));
        }
        e.game_time_remaining = reading->game_time_remaining;
        e.max_period_time = reading->max_period_time;
    }

    std::ranges::sort(events, precedes);
    return events;
}

} // namespace oncourt
