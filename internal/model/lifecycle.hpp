#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace engram::model {

enum class EntryStatus : std::uint8_t {
  kActive     = 1,
  kSuperseded = 2,
  kDeleted    = 3,
};

constexpr bool IsTerminal(EntryStatus status) {
  return status == EntryStatus::kSuperseded || status == EntryStatus::kDeleted;
}

constexpr bool CanTransition(EntryStatus from, EntryStatus to) {
  if (from == to) {
    return true;
  }
  switch (from) {
    case EntryStatus::kActive:
      return to == EntryStatus::kSuperseded || to == EntryStatus::kDeleted;
    case EntryStatus::kSuperseded:
    case EntryStatus::kDeleted:
      return false;
  }
  return false;
}

// File chunks may leave the trash; nothing else leaves a terminal state.
constexpr bool CanRestore(EntryStatus from) {
  return from == EntryStatus::kDeleted;
}

constexpr std::string_view ToString(EntryStatus status) {
  switch (status) {
    case EntryStatus::kActive:
      return "active";
    case EntryStatus::kSuperseded:
      return "superseded";
    case EntryStatus::kDeleted:
      return "deleted";
  }
  return "active";
}

constexpr std::optional<EntryStatus> ParseStatus(std::string_view text) {
  if (text == "active") return EntryStatus::kActive;
  if (text == "superseded") return EntryStatus::kSuperseded;
  if (text == "deleted") return EntryStatus::kDeleted;
  return std::nullopt;
}

} // namespace engram::model
