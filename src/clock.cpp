#include "oncourt/clock.hpp"
#include <charconv>
#include <cmath>
#include <string>

namespace oncourt {

namespace {

PipelineError malformed(std::string_view clock, int period, const std::string& why) {
    return PipelineError{
        .kind = ErrorKind::MalformedClock,
        .message = "Bad clock \"" + std::string(clock) + "\" in period " +
                   std::to_string(period) + ": " + why,
    };
}

std::string_view trim(std::string_view sv) {
    auto start = sv.find_first_not_of(" \t");
    if (start == std::string_view::npos) return {};
    auto end = sv.find_last_not_of(" \t");
    return sv.substr(start, end - start + 1);
}

} // namespace

std::expected<ClockReading, PipelineError> normalize_clock(
    std::string_view clock, int period) {

    if (period < 1) return std::unexpected(malformed(clock, period, "period must be positive"));

    auto text = trim(clock);
    auto colon = text.find(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == text.size()) {
        return std::unexpected(malformed(clock, period, "expected minutes:seconds"));
    }

    auto min_part = text.substr(0, colon);
    auto sec_part = text.substr(colon + 1);

    int minutes = 0;
    auto [min_end, min_ec] = std::from_chars(min_part.data(), min_part.data() + min_part.size(), minutes);
    if (min_ec != std::errc{} || min_end != min_part.data() + min_part.size() || minutes < 0) {
        return std::unexpected(malformed(clock, period, "minutes are not a whole number"));
    }

    double seconds = 0.0;
    auto [sec_end, sec_ec] = std::from_chars(sec_part.data(), sec_part.data() + sec_part.size(),
                                             seconds, std::chars_format::fixed);
    if (sec_ec != std::errc{} || sec_end != sec_part.data() + sec_part.size() ||
        !std::isfinite(seconds) || seconds < 0.0) {
        return std::unexpected(malformed(clock, period, "seconds are not a number"));
    }

    double left_in_period = minutes * 60.0 + seconds;

    if (period <= regulation_periods) {
        return ClockReading{
            .game_time_remaining = regulation_period_secs * (regulation_periods - period) + left_in_period,
            .max_period_time = regulation_period_secs * (regulation_periods + 1 - period),
        };
    }

    return ClockReading{
        .game_time_remaining = left_in_period,
        .max_period_time = overtime_period_secs,
    };
}

} // namespace oncourt
