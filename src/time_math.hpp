#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Canonical UTC form with milliseconds, e.g. 2025-10-19T15:04:05.000Z.
std::string formatIso8601(TimePoint tp);

// Accepts YYYY-MM-DD[T ]HH:MM:SS with an optional fraction and an optional
// zone designator (Z, +HH:MM, +HHMM, -HH:MM, -HHMM). No designator means
// UTC.
std::optional<TimePoint> parseIso8601(std::string_view s);

// "XdYh" from one day up, "XhYm" from one hour up, "Xm" below that.
std::string formatDuration(std::chrono::seconds d);

// Countdown from now until the timestamp. Empty for an empty or unparsable
// timestamp, "0 min" once it has passed.
std::string timeUntil(std::string_view timestamp, TimePoint now);

// "5m ago" style age of a timestamp. Empty for an empty or unparsable
// timestamp.
std::string timeSince(std::string_view timestamp, TimePoint now);
