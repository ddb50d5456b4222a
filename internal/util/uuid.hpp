#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace engram::util {

/*
  UUID helpers

  Entry ids are RFC4122 version 4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Shorthand for ToString(GenerateUUID()).
std::string NewId();

// "<prefix>" followed by `hex_chars` random lowercase hex digits.
std::string NewShortId(const std::string& prefix, std::size_t hex_chars = 12);

} // namespace engram::util
