#include "oncourt/assignment.hpp"
#include "oncourt/clock.hpp"
#include <algorithm>
#include <iterator>
#include <unordered_set>

namespace oncourt {

namespace {

std::vector<PlayerId> collect(const std::vector<SubstitutionInterval>& team_intervals,
                              const Event& event, BoundaryPolicy policy) {
    std::vector<PlayerId> players;
    for (auto& iv : team_intervals) {
        if (clock_block(iv.period) != clock_block(event.period)) continue;
        if (policy == BoundaryPolicy::ClosingAt && iv.period != event.period) continue;
        if (covers(iv, event.game_time_remaining, policy)) {
            players.push_back(iv.player_id);
        }
    }
    return players;
}

std::vector<SubstitutionInterval> for_team(
    const std::vector<SubstitutionInterval>& intervals, TeamId team_id) {
    std::vector<SubstitutionInterval> out;
    std::ranges::copy_if(intervals, std::back_inserter(out),
                         [team_id](const SubstitutionInterval& iv) { return iv.team_id == team_id; });
    return out;
}

bool distinct(const std::vector<PlayerId>& players) {
    std::unordered_set<PlayerId> seen(players.begin(), players.end());
    return seen.size() == players.size();
}

} // namespace

BoundaryPolicy policy_for(const Event& event) {
    if (event.is_period_end()) return BoundaryPolicy::ClosingAt;
    if (event.is_substitution()) return BoundaryPolicy::EnteringAt;
    return BoundaryPolicy::Spanning;
}

bool covers(const SubstitutionInterval& interval, double t, BoundaryPolicy policy) {
    switch (policy) {
        case BoundaryPolicy::ClosingAt:
            return interval.time_out == t;
        case BoundaryPolicy::EnteringAt:
            return interval.time_in >= t && interval.time_out < t;
        case BoundaryPolicy::Spanning:
            return interval.time_in >= t && interval.time_out <= t;
        case BoundaryPolicy::IncumbentsOnly:
            return interval.time_in > t && interval.time_out <= t;
    }
    return false;
}

std::vector<PlayerId> prefer_incumbents(
    const std::vector<SubstitutionInterval>& team_intervals, const Event& event) {
    return collect(team_intervals, event, BoundaryPolicy::IncumbentsOnly);
}

std::vector<PlayerId> select_on_court(
    const std::vector<SubstitutionInterval>& team_intervals, const Event& event) {

    auto policy = policy_for(event);
    auto players = collect(team_intervals, event, policy);
    if (policy != BoundaryPolicy::Spanning || static_cast<int>(players.size()) <= players_per_side) {
        return players;
    }

    auto incumbents = prefer_incumbents(team_intervals, event);
    if (!incumbents.empty()) return incumbents;

    // Opening clock of a countdown (tip-off or an overtime): nobody was on
    // before t, so substitutions logged at that clock have already happened.
    return collect(team_intervals, event, BoundaryPolicy::EnteringAt);
}

std::expected<std::vector<LineupRow>, PipelineError> assign_lineups(
    const std::vector<SubstitutionInterval>& intervals,
    const std::vector<Event>& events, TeamId home_id, TeamId visitor_id) {

    auto home_intervals = for_team(intervals, home_id);
    auto visitor_intervals = for_team(intervals, visitor_id);

    std::vector<LineupRow> rows;
    rows.reserve(events.size());

    for (auto& e : events) {
        LineupRow row{.game_id = e.game_id, .event_num = e.event_num};

        auto fill = [&](TeamId team_id, const std::vector<SubstitutionInterval>& team_intervals,
                        std::array<PlayerId, players_per_side>& slots)
            -> std::expected<void, PipelineError> {
            auto players = select_on_court(team_intervals, e);
            if (static_cast<int>(players.size()) != players_per_side || !distinct(players)) {
                return std::unexpected(PipelineError{
                    .kind = ErrorKind::LineupSizeMismatch,
                    .message = std::to_string(players.size()) + " players on court for team " +
                               std::to_string(team_id) + " at event " +
                               std::to_string(e.event_num),
                    .team_id = team_id,
                    .event_num = e.event_num,
                });
            }
            std::ranges::copy(players, slots.begin());
            return {};
        };

        if (auto ok = fill(home_id, home_intervals, row.home); !ok) {
            return std::unexpected(ok.error());
        }
        if (auto ok = fill(visitor_id, visitor_intervals, row.visitor); !ok) {
            return std::unexpected(ok.error());
        }

        rows.push_back(row);
    }

    return rows;
}

} // namespace oncourt
