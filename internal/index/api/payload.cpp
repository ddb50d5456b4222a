#include "internal/index/api/payload.hpp"

#include <cstdlib>

namespace engram::index {

namespace {

const PayloadValue* Find(const Payload& payload, std::string_view key) {
  auto it = payload.find(std::string(key));
  return it == payload.end() ? nullptr : &it->second;
}

} // namespace

bool Matches(const Payload& payload, const Filter& filter) {
  for (const auto& condition : filter) {
    const auto* value = Find(payload, condition.key);
    if (!value || *value != condition.value) return false;
  }
  return true;
}

std::optional<std::string> GetString(const Payload& payload, std::string_view key) {
  const auto* value = Find(payload, key);
  if (!value) return std::nullopt;
  if (const auto* s = std::get_if<std::string>(value)) return *s;
  return std::nullopt;
}

std::optional<std::int64_t> GetInt(const Payload& payload, std::string_view key) {
  const auto* value = Find(payload, key);
  if (!value) return std::nullopt;
  if (const auto* i = std::get_if<std::int64_t>(value)) return *i;
  if (const auto* d = std::get_if<double>(value)) return static_cast<std::int64_t>(*d);
  return std::nullopt;
}

std::optional<double> GetNumber(const Payload& payload, std::string_view key) {
  const auto* value = Find(payload, key);
  if (!value) return std::nullopt;
  if (const auto* d = std::get_if<double>(value)) return *d;
  if (const auto* i = std::get_if<std::int64_t>(value)) return static_cast<double>(*i);
  if (const auto* s = std::get_if<std::string>(value)) {
    if (s->empty()) return std::nullopt;
    char*        end    = nullptr;
    const double parsed = std::strtod(s->c_str(), &end);
    if (end && *end == '\0') return parsed;
  }
  return std::nullopt;
}

std::optional<bool> GetBool(const Payload& payload, std::string_view key) {
  const auto* value = Find(payload, key);
  if (!value) return std::nullopt;
  if (const auto* b = std::get_if<bool>(value)) return *b;
  return std::nullopt;
}

std::string StringOr(const Payload& payload, std::string_view key, std::string fallback) {
  auto value = GetString(payload, key);
  return value ? *value : std::move(fallback);
}

} // namespace engram::index
