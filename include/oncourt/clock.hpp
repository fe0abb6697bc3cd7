#pragma once

#include "oncourt/types.hpp"
#include <expected>
#include <string_view>

namespace oncourt {

constexpr int regulation_periods = 4;
constexpr double regulation_period_secs = 10 * 60;
constexpr double overtime_period_secs = 5 * 60;

// Converts a "M:SS" (or "M:SS.f") period clock into seconds remaining.
// Regulation readings count the full periods still to come; overtime
// readings only cover the overtime period itself.
std::expected<ClockReading, PipelineError> normalize_clock(
    std::string_view clock, int period);

// Regulation periods share one countdown; every overtime restarts its own.
// Times are only comparable between periods of the same block.
constexpr int clock_block(int period) {
    return period > regulation_periods ? period : 0;
}

} // namespace oncourt
