#include "oncourt/summary.hpp"
#include "oncourt/clock.hpp"
#include <algorithm>
#include <unordered_map>

namespace oncourt {

std::vector<TeamMinutes> minutes_by_team(
    const IntervalSet& intervals, TeamId home_id, TeamId visitor_id) {

    std::vector<TeamMinutes> result = {{.team_id = home_id}, {.team_id = visitor_id}};
    std::unordered_map<PlayerId, PlayerMinutes> by_player;
    std::vector<PlayerId> order;

    for (auto& iv : intervals.intervals) {
        auto [it, inserted] = by_player.try_emplace(
            iv.player_id, PlayerMinutes{.player_id = iv.player_id, .team_id = iv.team_id});
        if (inserted) order.push_back(iv.player_id);
        it->second.seconds += iv.duration();
        it->second.stints++;
    }

    for (auto& [id, rec] : intervals.records) {
        if (by_player.try_emplace(id, PlayerMinutes{.player_id = id, .team_id = rec.team_id}).second) {
            order.push_back(id);
        }
    }

    for (auto id : order) {
        auto& pm = by_player[id];
        for (auto& team : result) {
            if (team.team_id != pm.team_id) continue;
            team.seconds += pm.seconds;
            team.players.push_back(pm);
        }
    }

    for (auto& team : result) {
        std::ranges::sort(team.players, [](const PlayerMinutes& a, const PlayerMinutes& b) {
            if (a.seconds != b.seconds) return a.seconds > b.seconds;
            return a.player_id < b.player_id;
        });
    }

    return result;
}

double game_length_secs(int periods_played) {
    int regulation = std::min(periods_played, regulation_periods);
    int overtime = std::max(periods_played - regulation_periods, 0);
    return regulation * regulation_period_secs + overtime * overtime_period_secs;
}

} // namespace oncourt
