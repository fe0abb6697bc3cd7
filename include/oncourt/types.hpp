#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace oncourt {

using PlayerId = std::int64_t;
using TeamId = std::int64_t;
using GameId = std::int64_t;

// Play-by-play message codes. Codes outside this list are carried through
// untouched and treated as administrative events.
enum class EventType : int {
    MadeShot = 1,
    MissedShot = 2,
    FreeThrow = 3,
    Rebound = 4,
    Turnover = 5,
    Foul = 6,
    Violation = 7,
    Substitution = 8,
    Timeout = 9,
    JumpBall = 10,
    Ejection = 11,
    PeriodStart = 12,
    PeriodEnd = 13,
};

// Codes at or below this one are live game actions whose participants must
// be on the court.
constexpr int last_game_action_code = static_cast<int>(EventType::Turnover);

struct Participant {
    PlayerId player_id = 0;
    std::optional<TeamId> team_id;
};

struct Event {
    GameId game_id = 0;
    std::int64_t event_num = 0;
    int period = 1;
    std::string clock;
    EventType type = EventType::MadeShot;
    std::array<std::optional<Participant>, 3> participants;

    // Filled in by the sequencer.
    double game_time_remaining = 0.0;
    double max_period_time = 0.0;

    bool is_substitution() const { return type == EventType::Substitution; }
    bool is_period_end() const { return type == EventType::PeriodEnd; }
    bool is_game_action() const {
        return static_cast<int>(type) <= last_game_action_code;
    }
};

struct ClockReading {
    double game_time_remaining = 0.0;
    double max_period_time = 0.0;
};

struct BoxScoreEntry {
    PlayerId player_id = 0;
    TeamId team_id = 0;
};

struct GameInfo {
    GameId game_id = 0;
    TeamId home_team_id = 0;
    TeamId visitor_team_id = 0;
};

struct Rosters {
    std::vector<PlayerId> home;
    std::vector<PlayerId> visitor;
};

struct SubstitutionInterval {
    PlayerId player_id = 0;
    TeamId team_id = 0;
    double time_in = 0.0;
    double time_out = 0.0;
    int period = 1;

    double duration() const { return time_in - time_out; }

    bool operator==(const SubstitutionInterval&) const = default;
};

struct LineupRow {
    GameId game_id = 0;
    std::int64_t event_num = 0;
    std::array<PlayerId, 5> home{};
    std::array<PlayerId, 5> visitor{};

    bool operator==(const LineupRow&) const = default;
};

// Analytics output types

struct PlayerMinutes {
    PlayerId player_id = 0;
    TeamId team_id = 0;
    double seconds = 0.0;
    int stints = 0;

    double minutes() const { return seconds / 60.0; }
};

struct TeamMinutes {
    TeamId team_id = 0;
    double seconds = 0.0;
    std::vector<PlayerMinutes> players;
};

enum class ErrorKind {
    MalformedClock,
    UnknownParticipant,
    LineupSizeMismatch,
    UnterminatedInterval,
    DataUnavailable,
    MalformedRecord,
};

struct PipelineError {
    ErrorKind kind = ErrorKind::MalformedRecord;
    std::string message;
    std::optional<TeamId> team_id;
    std::optional<std::int64_t> event_num;
    std::optional<PlayerId> player_id;
};

std::string_view to_string(ErrorKind kind);

using LogCallback = std::function<void(const std::string& line)>;

} // namespace oncourt
