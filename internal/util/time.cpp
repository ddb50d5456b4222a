#include "internal/util/time.hpp"

#include <google/protobuf/timestamp.pb.h>
#include <google/protobuf/util/time_util.h>

#include <cstdio>
#include <ctime>

namespace engram::util {

using google::protobuf::util::TimeUtil;

namespace {

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

bool HasZoneDesignator(std::string_view text) {
  if (text.empty()) return false;
  if (text.back() == 'Z' || text.back() == 'z') return true;

  // "+hh:mm" / "-hh:mm" after the time part
  const auto t_pos = text.find_first_of("Tt ");
  if (t_pos == std::string_view::npos) return false;
  return text.find_first_of("+-", t_pos) != std::string_view::npos;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::int64_t ToUnixSeconds(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixSeconds(std::int64_t seconds) {
  return TimePoint{} + std::chrono::seconds(seconds);
}

std::string ToIso8601(TimePoint tp) {
  // fixed millisecond width keeps the strings lexicographically sortable
  const auto   ms      = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  std::int64_t seconds = ms / 1000;
  std::int64_t millis  = ms % 1000;
  if (millis < 0) {
    millis += 1000;
    seconds -= 1;
  }

  const std::time_t t = static_cast<std::time_t>(seconds);
  std::tm           utc{};
  gmtime_r(&t, &utc);

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                utc.tm_min, utc.tm_sec, static_cast<int>(millis));
  return buffer;
}

std::optional<TimePoint> ParseIso8601(std::string_view text) {
  if (text.empty()) return std::nullopt;

  std::string value(text);
  if (value.size() > 10 && value[10] == ' ') value[10] = 'T';
  if (!HasZoneDesignator(value)) value += "Z";

  google::protobuf::Timestamp ts;
  if (!TimeUtil::FromString(value, &ts)) {
    return std::nullopt;
  }
  return FromProto(ts);
}

} // namespace engram::util
