#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace engram::util {

/*
  Time utilities. All clock reads go through Now().

  Stored timestamps are RFC3339 strings in UTC ("2024-05-01T12:00:00.123Z")
  plus unix seconds for TTL scans.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t     ToUnixMillis(TimePoint tp);
std::int64_t ToUnixSeconds(TimePoint tp);
TimePoint    FromUnixSeconds(std::int64_t seconds);

std::string ToIso8601(TimePoint tp);

// Accepts RFC3339 with or without a zone designator (no designator = UTC).
std::optional<TimePoint> ParseIso8601(std::string_view text);

} // namespace engram::util
