#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace engram::index {

// Scalar payload value; lists are encoded to JSON strings by the caller.
using PayloadValue = std::variant<std::string, std::int64_t, double, bool>;
using Payload      = std::map<std::string, PayloadValue>;

struct Condition {
  std::string  key;
  PayloadValue value;
};

// Conjunction of equality conditions. Empty matches everything.
using Filter = std::vector<Condition>;

struct Record {
  std::string        id;
  std::vector<float> vector;
  std::string        document;
  Payload            payload;
};

// `distance` is cosine distance in [0, 2]; lower is closer.
struct Hit {
  Record record;
  double distance = 0.0;
};

bool Matches(const Payload& payload, const Filter& filter);

std::optional<std::string>  GetString(const Payload& payload, std::string_view key);
std::optional<std::int64_t> GetInt(const Payload& payload, std::string_view key);
// Accepts integer or floating values; strings holding a number are parsed.
std::optional<double> GetNumber(const Payload& payload, std::string_view key);
std::optional<bool>   GetBool(const Payload& payload, std::string_view key);

std::string StringOr(const Payload& payload, std::string_view key, std::string fallback = {});

} // namespace engram::index
