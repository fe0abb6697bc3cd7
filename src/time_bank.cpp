#include "oncourt/time_bank.hpp"
#include <algorithm>

namespace oncourt {

TimeBank::TimeBank(TeamId home_id, TeamId visitor_id, const Rosters& rosters,
                   LogCallback on_log)
    : on_log_(std::move(on_log)) {

    home_.team_id = home_id;
    home_.label = "home";
    visitor_.team_id = visitor_id;
    visitor_.label = "visitor";

    for (auto id : rosters.home) {
        home_.roster.insert(id);
        if (records_.try_emplace(id, PlayerTimeRecord{.team_id = home_id}).second) {
            order_.push_back(id);
        }
    }
    for (auto id : rosters.visitor) {
        if (home_.roster.contains(id)) continue;
        visitor_.roster.insert(id);
        if (records_.try_emplace(id, PlayerTimeRecord{.team_id = visitor_id}).second) {
            order_.push_back(id);
        }
    }
}

const std::vector<PlayerId>& TimeBank::on_court(TeamId team_id) const {
    return team_id == home_.team_id ? home_.on_court : visitor_.on_court;
}

const PlayerTimeRecord& TimeBank::record(PlayerId player_id) const {
    return records_.at(player_id);
}

std::expected<void, PipelineError> TimeBank::apply(const Event& event) {
    if (event.is_substitution()) return substitute(event);
    if (event.is_period_end()) return end_period(event);
    if (event.is_game_action()) return discover(event);
    return {};
}

std::expected<TimeBank::Side*, PipelineError> TimeBank::side_of(
    PlayerId player_id, const Event& event) {

    if (home_.roster.contains(player_id)) return &home_;
    if (visitor_.roster.contains(player_id)) return &visitor_;
    return std::unexpected(PipelineError{
        .kind = ErrorKind::UnknownParticipant,
        .message = "Player " + std::to_string(player_id) + " in event " +
                   std::to_string(event.event_num) + " is on neither roster",
        .event_num = event.event_num,
        .player_id = player_id,
    });
}

void TimeBank::check_in(PlayerTimeRecord& rec, double at) {
    rec.state = OnCourt{at};
    rec.time_in.push_back(at);
}

void TimeBank::check_out(PlayerTimeRecord& rec, double at, double max_period_time) {
    if (auto* on = std::get_if<OnCourt>(&rec.state)) {
        rec.playing_time += on->since - at;
    } else {
        // Never checked in this period: on since the opening tip.
        rec.playing_time += max_period_time - at;
        rec.time_in.push_back(max_period_time);
    }
    rec.state = OffCourt{};
    rec.time_out.push_back(at);
    rec.periods.push_back(period_);
}

std::expected<void, PipelineError> TimeBank::substitute(const Event& event) {
    const auto& out = event.participants[0];
    const auto& in = event.participants[1];
    if (!out || !in) {
        return std::unexpected(PipelineError{
            .kind = ErrorKind::MalformedRecord,
            .message = "Substitution " + std::to_string(event.event_num) +
                       " does not name both players",
            .event_num = event.event_num,
        });
    }

    Side* side = nullptr;
    if (out->team_id) {
        side = *out->team_id == home_.team_id ? &home_ : &visitor_;
    } else {
        auto found = side_of(out->player_id, event);
        if (!found) return std::unexpected(found.error());
        side = *found;
    }

    for (auto id : {out->player_id, in->player_id}) {
        if (side->roster.contains(id)) continue;
        return std::unexpected(PipelineError{
            .kind = ErrorKind::UnknownParticipant,
            .message = "Player " + std::to_string(id) + " in substitution " +
                       std::to_string(event.event_num) + " is not on the " +
                       side->label + " roster",
            .team_id = side->team_id,
            .event_num = event.event_num,
            .player_id = id,
        });
    }

    auto& lineup = side->on_court;
    if (auto it = std::ranges::find(lineup, out->player_id); it != lineup.end()) {
        lineup.erase(it);
    }
    if (!std::ranges::contains(lineup, in->player_id)) {
        lineup.push_back(in->player_id);
    }

    if (on_log_) {
        on_log_("Subbing " + std::string(side->label) + ": " +
                std::to_string(in->player_id) + " in for " +
                std::to_string(out->player_id));
    }

    check_out(records_.at(out->player_id), event.game_time_remaining, event.max_period_time);
    check_in(records_.at(in->player_id), event.game_time_remaining);
    return {};
}

std::expected<void, PipelineError> TimeBank::end_period(const Event& event) {
    for (auto* side : {&home_, &visitor_}) {
        for (auto id : side->on_court) {
            check_out(records_.at(id), event.game_time_remaining, event.max_period_time);
        }
        side->on_court.clear();
    }

    if (on_log_) on_log_("End of period " + std::to_string(period_));
    ++period_;
    return {};
}

std::expected<void, PipelineError> TimeBank::discover(const Event& event) {
    for (auto& p : event.participants) {
        if (!p) continue;

        auto side = side_of(p->player_id, event);
        if (!side) return std::unexpected(side.error());

        auto& lineup = (*side)->on_court;
        if (std::ranges::contains(lineup, p->player_id)) continue;

        lineup.push_back(p->player_id);
        check_in(records_.at(p->player_id), event.max_period_time);
    }
    return {};
}

std::expected<IntervalSet, PipelineError> TimeBank::finish() const {
    IntervalSet result;
    result.records = records_;

    for (auto id : order_) {
        auto& rec = records_.at(id);
        if (rec.on_court() || rec.time_in.size() != rec.time_out.size()) {
            return std::unexpected(PipelineError{
                .kind = ErrorKind::UnterminatedInterval,
                .message = "Player " + std::to_string(id) + " has " +
                           std::to_string(rec.time_in.size()) + " check-ins but " +
                           std::to_string(rec.time_out.size()) +
                           " check-outs; the log is missing a closing period end",
                .team_id = rec.team_id,
                .player_id = id,
            });
        }

        for (size_t i = 0; i < rec.time_in.size(); ++i) {
            result.intervals.push_back({
                .player_id = id,
                .team_id = rec.team_id,
                .time_in = rec.time_in[i],
                .time_out = rec.time_out[i],
                .period = rec.periods[i],
            });
        }
    }

    return result;
}

std::expected<IntervalSet, PipelineError> build_intervals(
    const std::vector<Event>& events, TeamId home_id, TeamId visitor_id,
    const Rosters& rosters, LogCallback on_log) {

    TimeBank bank(home_id, visitor_id, rosters, std::move(on_log));
    for (auto& e : events) {
        auto applied = bank.apply(e);
        if (!applied) return std::unexpected(applied.error());
    }
    return bank.finish();
}

} // namespace oncourt
