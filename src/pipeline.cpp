#include "oncourt/pipeline.hpp"
#include "oncourt/assignment.hpp"
#include "oncourt/sequencer.hpp"
#include <algorithm>

namespace oncourt {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedClock: return "malformed clock";
        case ErrorKind::UnknownParticipant: return "unknown participant";
        case ErrorKind::LineupSizeMismatch: return "lineup size mismatch";
        case ErrorKind::UnterminatedInterval: return "unterminated interval";
        case ErrorKind::DataUnavailable: return "data unavailable";
        case ErrorKind::MalformedRecord: return "malformed record";
    }
    return "unknown error";
}

Rosters get_rosters(TeamId home_id, TeamId visitor_id,
                    const std::vector<BoxScoreEntry>& box_score) {
    Rosters rosters;
    for (auto& entry : box_score) {
        std::vector<PlayerId>* side = nullptr;
        if (entry.team_id == home_id) side = &rosters.home;
        else if (entry.team_id == visitor_id) side = &rosters.visitor;
        else continue;

        if (!std::ranges::contains(*side, entry.player_id)) {
            side->push_back(entry.player_id);
        }
    }
    return rosters;
}

std::expected<GameLineups, PipelineError> reconstruct_game(
    const GameInput& input, LogCallback on_log) {

    const auto& game = input.game;

    auto events = sequence_events(input.events);
    if (!events) return std::unexpected(events.error());

    auto intervals = build_intervals(*events, game.home_team_id, game.visitor_team_id,
                                     input.rosters, std::move(on_log));
    if (!intervals) return std::unexpected(intervals.error());

    auto rows = assign_lineups(intervals->intervals, *events,
                               game.home_team_id, game.visitor_team_id);
    if (!rows) return std::unexpected(rows.error());

    return GameLineups{
        .game = game,
        .events = std::move(*events),
        .intervals = std::move(*intervals),
        .rows = std::move(*rows),
    };
}

} // namespace oncourt
