// include/eldritch/core/Time.h
#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace eldritch {

using SystemClock = std::chrono::system_clock;
using TimePoint   = SystemClock::time_point;
using Seconds     = std::chrono::seconds;

// Injectable time source. Every component that stamps times takes one of these
// (or an explicit `now`) so tests can drive expiration deterministically.
using Clock = std::function<TimePoint()>;

[[nodiscard]] Clock SystemClockSource();

[[nodiscard]] constexpr Seconds Minutes(long long m) noexcept { return Seconds(m * 60); }
[[nodiscard]] constexpr Seconds Hours(long long h) noexcept { return Seconds(h * 3600); }

// UTC, microsecond precision: "2024-05-01T12:30:00.000000Z".
[[nodiscard]] std::string FormatIso8601(TimePoint t);

// Accepts the format above, with or without the fractional part and the
// trailing 'Z'. Returns nullopt on malformed input.
[[nodiscard]] std::optional<TimePoint> ParseIso8601(std::string_view text);

// Formats a duration as "H:MM:SS".
[[nodiscard]] std::string FormatDurationHMS(Seconds d);

} // namespace eldritch
