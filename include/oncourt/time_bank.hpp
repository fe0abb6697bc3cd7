#pragma once

#include "oncourt/types.hpp"
#include <expected>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

namespace oncourt {

struct OffCourt {};

struct OnCourt {
    double since = 0.0;
};

using CourtState = std::variant<OffCourt, OnCourt>;

struct PlayerTimeRecord {
    TeamId team_id = 0;
    double playing_time = 0.0;
    CourtState state = OffCourt{};
    std::vector<double> time_in;
    std::vector<double> time_out;
    std::vector<int> periods;

    bool on_court() const { return std::holds_alternative<OnCourt>(state); }
};

struct IntervalSet {
    std::vector<SubstitutionInterval> intervals;
    std::unordered_map<PlayerId, PlayerTimeRecord> records;
};

// Single forward pass over sequenced events that tracks who is on the court
// and banks each player's time between check-in and check-out.
class TimeBank {
public:
    TimeBank(TeamId home_id, TeamId visitor_id, const Rosters& rosters,
             LogCallback on_log = nullptr);

    std::expected<void, PipelineError> apply(const Event& event);

    // Flushes every record to intervals. Fails if anyone is still checked in.
    std::expected<IntervalSet, PipelineError> finish() const;

    const std::vector<PlayerId>& on_court(TeamId team_id) const;
    const PlayerTimeRecord& record(PlayerId player_id) const;
    int period() const { return period_; }

private:
    struct Side {
        TeamId team_id = 0;
        std::unordered_set<PlayerId> roster;
        std::vector<PlayerId> on_court;
        const char* label = "";
    };

    std::expected<void, PipelineError> substitute(const Event& event);
    std::expected<void, PipelineError> end_period(const Event& event);
    std::expected<void, PipelineError> discover(const Event& event);

    std::expected<Side*, PipelineError> side_of(PlayerId player_id, const Event& event);
    void check_in(PlayerTimeRecord& rec, double at);
    void check_out(PlayerTimeRecord& rec, double at, double max_period_time);

    Side home_;
    Side visitor_;
    std::vector<PlayerId> order_;
    std::unordered_map<PlayerId, PlayerTimeRecord> records_;
    int period_ = 1;
    LogCallback on_log_;
};

// Runs a TimeBank over already sequenced events.
std::expected<IntervalSet, PipelineError> build_intervals(
    const std::vector<Event>& events, TeamId home_id, TeamId visitor_id,
    const Rosters& rosters, LogCallback on_log = nullptr);

} // namespace oncourt
