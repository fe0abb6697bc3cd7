#include "oncourt/game_store.hpp"
#include "oncourt/records.hpp"
#include <fstream>
#include <system_error>

namespace oncourt {

GameStore::GameStore(std::filesystem::path base_dir) : base_dir_(std::move(base_dir)) {}

std::filesystem::path GameStore::game_dir(GameId game_id) const {
    return base_dir_ / "games" / std::to_string(game_id);
}

std::expected<std::vector<Event>, PipelineError> GameStore::load_pbp(GameId game_id) const {
    auto data = read_json(game_dir(game_id) / "pbp.json");
    if (!data) return std::unexpected(data.error());
    return parse_events(*data);
}

std::expected<std::vector<BoxScoreEntry>, PipelineError> GameStore::load_box_score(
    GameId game_id) const {
    auto data = read_json(game_dir(game_id) / "box_score.json");
    if (!data) return std::unexpected(data.error());
    return parse_box_score(*data);
}

std::expected<GameInfo, PipelineError> GameStore::load_game(GameId game_id) const {
    auto data = read_json(game_dir(game_id) / "game.json");
    if (!data) return std::unexpected(data.error());
    return parse_game(*data);
}

std::expected<GameInput, PipelineError> GameStore::load_input(GameId game_id) const {
    auto game = load_game(game_id);
    if (!game) return std::unexpected(game.error());

    auto box_score = load_box_score(game_id);
    if (!box_score) return std::unexpected(box_score.error());

    auto events = load_pbp(game_id);
    if (!events) return std::unexpected(events.error());

    return GameInput{
        .game = *game,
        .rosters = get_rosters(game->home_team_id, game->visitor_team_id, *box_score),
        .events = std::move(*events),
    };
}

std::expected<void, PipelineError> GameStore::store_lineups(const GameLineups& result) {
    std::error_code ec;
    std::filesystem::create_directories(base_dir_ / "lineups", ec);
    if (ec) {
        return std::unexpected(PipelineError{
            .kind = ErrorKind::DataUnavailable,
            .message = "Cannot create " + (base_dir_ / "lineups").string() + ": " + ec.message(),
        });
    }
    return write_json(base_dir_ / "lineups" / (std::to_string(result.game.game_id) + ".json"),
                      to_json(result));
}

std::expected<nlohmann::json, PipelineError> GameStore::read_json(
    const std::filesystem::path& path) const {

    if (!std::filesystem::exists(path)) {
        return std::unexpected(PipelineError{
            .kind = ErrorKind::DataUnavailable,
            .message = "No such file: " + path.string(),
        });
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(PipelineError{
            .kind = ErrorKind::DataUnavailable,
            .message = "Cannot open " + path.string(),
        });
    }

    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(PipelineError{
            .kind = ErrorKind::MalformedRecord,
            .message = "JSON parse error in " + path.string() + ": " + e.what(),
        });
    }
}

std::expected<void, PipelineError> GameStore::write_json(
    const std::filesystem::path& path, const nlohmann::json& data) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        return std::unexpected(PipelineError{
            .kind = ErrorKind::DataUnavailable,
            .message = "Cannot write " + path.string(),
        });
    }
    file << data.dump(2);
    return {};
}

} // namespace oncourt
