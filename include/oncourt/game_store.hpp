#pragma once

#include "oncourt/pipeline.hpp"
#include "oncourt/types.hpp"
#include <expected>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace oncourt {

// Stored per-game tables under <base_dir>/games/<game_id>/ and reconstructed
// lineups under <base_dir>/lineups/.
class GameStore {
public:
    explicit GameStore(std::filesystem::path base_dir = "data");

    std::expected<std::vector<Event>, PipelineError> load_pbp(GameId game_id) const;
    std::expected<std::vector<BoxScoreEntry>, PipelineError> load_box_score(GameId game_id) const;
    std::expected<GameInfo, PipelineError> load_game(GameId game_id) const;

    // Game metadata, rosters and events in one go.
    std::expected<GameInput, PipelineError> load_input(GameId game_id) const;

    std::expected<void, PipelineError> store_lineups(const GameLineups& result);

    const std::filesystem::path& base_dir() const { return base_dir_; }

private:
    std::filesystem::path base_dir_;

    std::filesystem::path game_dir(GameId game_id) const;
    std::expected<nlohmann::json, PipelineError> read_json(const std::filesystem::path& path) const;
    std::expected<void, PipelineError> write_json(const std::filesystem::path& path,
                                                  const nlohmann::json& data) const;
};

} // namespace oncourt
