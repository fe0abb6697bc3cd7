#pragma once

#include "oncourt/time_bank.hpp"
#include "oncourt/types.hpp"
#include <expected>
#include <vector>

namespace oncourt {

struct GameInput {
    GameInfo game;
    Rosters rosters;
    std::vector<Event> events;
};

struct GameLineups {
    GameInfo game;
    std::vector<Event> events;  // sequenced
    IntervalSet intervals;
    std::vector<LineupRow> rows;
};

// Filters box-score rows down to each side's player ids, in box-score order.
Rosters get_rosters(TeamId home_id, TeamId visitor_id,
                    const std::vector<BoxScoreEntry>& box_score);

// Sequences the events, builds every stint and assigns a lineup to each
// event. Any inconsistency fails the whole game.
std::expected<GameLineups, PipelineError> reconstruct_game(
    const GameInput& input, LogCallback on_log = nullptr);

} // namespace oncourt
