#include "oncourt/records.hpp"
#include <charconv>
#include <cmath>
#include <limits>
#include <string>

namespace oncourt {

namespace {

// Stats exports carry ids as ints, floats (when the column had nulls) or
// zero-padded strings.
std::optional<std::int64_t> safe_int64(const nlohmann::json& j, const std::string& key) {
    if (!j.contains(key)) return std::nullopt;
    auto& v = j[key];

    std::int64_t id = 0;
    if (v.is_number_unsigned()) {
        auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) return std::nullopt;
        id = static_cast<std::int64_t>(u);
    } else if (v.is_number_integer()) {
        id = v.get<std::int64_t>();
    } else if (v.is_number_float()) {
        constexpr double limit = 9223372036854775808.0; // 2^63
        double d = v.get<double>();
        if (!std::isfinite(d) || d != std::floor(d) || d < -limit || d >= limit) return std::nullopt;
        id = static_cast<std::int64_t>(d);
    } else if (v.is_string()) {
        auto s = v.get<std::string>();
        auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), id);
        if (s.empty() || ec != std::errc{} || end != s.data() + s.size()) return std::nullopt;
    } else {
        return std::nullopt;
    }
    return id;
}

// Null, empty and 0 all mean "no id".
std::optional<std::int64_t> safe_id(const nlohmann::json& j, const std::string& key) {
    auto id = safe_int64(j, key);
    if (id && *id == 0) return std::nullopt;
    return id;
}

// Small counters (period, event type). Anything outside int range or with a
// fractional part is rejected rather than truncated.
std::optional<int> safe_int(const nlohmann::json& j, const std::string& key) {
    auto v = safe_int64(j, key);
    if (!v || *v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(*v);
}

PipelineError missing(const std::string& record, const std::string& key,
                      std::optional<std::int64_t> event_num = std::nullopt) {
    return PipelineError{
        .kind = ErrorKind::MalformedRecord,
        .message = record + " record has no usable \"" + key + "\"",
        .event_num = event_num,
    };
}

template <typename T, typename Parse>
std::expected<std::vector<T>, PipelineError> parse_rows(
    const nlohmann::json& j, const std::string& what, Parse parse) {
    if (!j.is_array()) {
        return std::unexpected(PipelineError{
            .kind = ErrorKind::MalformedRecord,
            .message = "Expected array of " + what + " rows",
        });
    }

    std::vector<T> rows;
    rows.reserve(j.size());
    for (auto& row : j) {
        auto parsed = parse(row);
        if (!parsed) return std::unexpected(parsed.error());
        rows.push_back(std::move(*parsed));
    }
    return rows;
}

} // namespace

std::expected<Event, PipelineError> parse_event(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::unexpected(PipelineError{
            .kind = ErrorKind::MalformedRecord,
            .message = "Play-by-play row is not an object",
        });
    }

    Event e;
    auto event_num = safe_int64(j, "eventnum");
    if (!event_num) return std::unexpected(missing("Play-by-play", "eventnum"));
    e.event_num = *event_num;

    auto game_id = safe_id(j, "game_id");
    if (!game_id) return std::unexpected(missing("Play-by-play", "game_id", e.event_num));
    e.game_id = *game_id;

    auto period = safe_int(j, "period");
    if (!period) return std::unexpected(missing("Play-by-play", "period", e.event_num));
    e.period = *period;

    auto msg_type = safe_int(j, "eventmsgtype");
    if (!msg_type) return std::unexpected(missing("Play-by-play", "eventmsgtype", e.event_num));
    e.type = static_cast<EventType>(*msg_type);

    if (!j.contains("pctimestring") || !j["pctimestring"].is_string()) {
        return std::unexpected(missing("Play-by-play", "pctimestring", e.event_num));
    }
    e.clock = j["pctimestring"].get<std::string>();

    for (int i = 0; i < 3; ++i) {
        auto prefix = "player" + std::to_string(i + 1);
        auto player_id = safe_id(j, prefix + "_id");
        if (!player_id) continue;
        e.participants[i] = Participant{
            .player_id = *player_id,
            .team_id = safe_id(j, prefix + "_team_id"),
        };
    }

    return e;
}

std::expected<BoxScoreEntry, PipelineError> parse_box_score_entry(const nlohmann::json& j) {
    auto player_id = safe_id(j, "player_id");
    if (!player_id) return std::unexpected(missing("Box score", "player_id"));
    auto team_id = safe_id(j, "team_id");
    if (!team_id) return std::unexpected(missing("Box score", "team_id"));
    return BoxScoreEntry{.player_id = *player_id, .team_id = *team_id};
}

std::expected<GameInfo, PipelineError> parse_game(const nlohmann::json& j) {
    // Exported as a one-row table or as a bare object.
    if (j.is_array()) {
        if (j.size() != 1) {
            return std::unexpected(PipelineError{
                .kind = ErrorKind::MalformedRecord,
                .message = "Expected exactly one game row, found " + std::to_string(j.size()),
            });
        }
        return parse_game(j.front());
    }

    auto game_id = safe_id(j, "game_id");
    if (!game_id) return std::unexpected(missing("Game", "game_id"));
    auto home = safe_id(j, "home_team_id");
    if (!home) return std::unexpected(missing("Game", "home_team_id"));
    auto visitor = safe_id(j, "visitor_team_id");
    if (!visitor) return std::unexpected(missing("Game", "visitor_team_id"));

    return GameInfo{.game_id = *game_id, .home_team_id = *home, .visitor_team_id = *visitor};
}

std::expected<std::vector<Event>, PipelineError> parse_events(const nlohmann::json& j) {
    return parse_rows<Event>(j, "play-by-play", parse_event);
}

std::expected<std::vector<BoxScoreEntry>, PipelineError> parse_box_score(const nlohmann::json& j) {
    return parse_rows<BoxScoreEntry>(j, "box score", parse_box_score_entry);
}

nlohmann::json to_json(const LineupRow& row) {
    nlohmann::json j = {
        {"game_id", row.game_id},
        {"eventnum", row.event_num},
    };
    for (int i = 0; i < 5; ++i) {
        j["home_player_" + std::to_string(i + 1)] = row.home[i];
        j["visitor_player_" + std::to_string(i + 1)] = row.visitor[i];
    }
    return j;
}

nlohmann::json to_json(const SubstitutionInterval& interval) {
    return {
        {"player_id", interval.player_id},
        {"team_id", interval.team_id},
        {"time_in", interval.time_in},
        {"time_out", interval.time_out},
        {"period", interval.period},
    };
}

nlohmann::json to_json(const GameLineups& result) {
    auto rows = nlohmann::json::array();
    for (auto& r : result.rows) rows.push_back(to_json(r));

    auto intervals = nlohmann::json::array();
    for (auto& iv : result.intervals.intervals) intervals.push_back(to_json(iv));

    return {
        {"game_id", result.game.game_id},
        {"home_team_id", result.game.home_team_id},
        {"visitor_team_id", result.game.visitor_team_id},
        {"lineups", std::move(rows)},
        {"intervals", std::move(intervals)},
    };
}

} // namespace oncourt
