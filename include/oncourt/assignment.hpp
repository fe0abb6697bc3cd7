#pragma once

#include "oncourt/types.hpp"
#include <expected>
#include <vector>

namespace oncourt {

constexpr int players_per_side = 5;

// How an event's time is matched against stint boundaries.
enum class BoundaryPolicy {
    ClosingAt,      // time_out == t: the stints a period end just closed
    EnteringAt,     // time_in >= t > time_out: a player leaving at t is gone
    Spanning,       // time_in >= t >= time_out
    IncumbentsOnly, // time_in > t >= time_out
};

BoundaryPolicy policy_for(const Event& event);

bool covers(const SubstitutionInterval& interval, double t, BoundaryPolicy policy);

// Stints of one team that cover event time t. Only stints on the event's
// countdown (see clock_block) are considered, and a period end only takes
// stints of its own period. A live event at a period boundary therefore sees
// the previous period's closers when that period shares the countdown.
std::vector<PlayerId> select_on_court(
    const std::vector<SubstitutionInterval>& team_intervals, const Event& event);

// Tie-break for live events sitting exactly on a substitution: when both the
// outgoing and incoming stint touch t, the player already on the court keeps
// the spot and the stint starting at t is dropped.
std::vector<PlayerId> prefer_incumbents(
    const std::vector<SubstitutionInterval>& team_intervals, const Event& event);

// One row per event, in the order given. Every row must resolve to exactly
// five distinct players per team.
std::expected<std::vector<LineupRow>, PipelineError> assign_lineups(
    const std::vector<SubstitutionInterval>& intervals,
    const std::vector<Event>& events, TeamId home_id, TeamId visitor_id);

} // namespace oncourt
