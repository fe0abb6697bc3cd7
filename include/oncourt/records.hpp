#pragma once

#include "oncourt/pipeline.hpp"
#include "oncourt/types.hpp"
#include <expected>
#include <nlohmann/json.hpp>
#include <vector>

namespace oncourt {

std::expected<Event, PipelineError> parse_event(const nlohmann::json& j);
std::expected<BoxScoreEntry, PipelineError> parse_box_score_entry(const nlohmann::json& j);
std::expected<GameInfo, PipelineError> parse_game(const nlohmann::json& j);

std::expected<std::vector<Event>, PipelineError> parse_events(const nlohmann::json& j);
std::expected<std::vector<BoxScoreEntry>, PipelineError> parse_box_score(const nlohmann::json& j);

nlohmann::json to_json(const LineupRow& row);
nlohmann::json to_json(const SubstitutionInterval& interval);
nlohmann::json to_json(const GameLineups& result);

} // namespace oncourt
