#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/index/api/payload.hpp"
#include "internal/model/lifecycle.hpp"

namespace engram::model {

inline constexpr std::size_t kMaxExtensionFields     = 32;
inline constexpr std::size_t kMaxExtensionKeyBytes   = 64;
inline constexpr std::size_t kMaxExtensionValueBytes = 4096;

struct Contradiction {
  std::string id;
  std::string text;
  double      similarity = 0.0;
  std::string learning_key;
};

/*
  Typed metadata carried by every fact, file chunk and learning.

  Fields that do not apply to an entry kind stay empty and are not
  written to the index payload. Caller-supplied keys the store does not
  know about go to `extensions` (bounded, string-valued).
*/
struct EntryMetadata {
  std::string workspace_id;
  std::string agent_name;
  std::string model_name;
  std::string category;
  std::string source;

  EntryStatus   status  = EntryStatus::kActive;
  std::uint32_t version = 1;
  std::string   learning_key;

  std::string           priority;
  std::optional<double> importance;
  std::optional<double> reliability;
  std::optional<double> frequency;

  std::string  created_at;
  std::int64_t created_at_unix = 0;
  std::string  updated_at;

  // file chunks
  std::string                 file_id;
  std::string                 file_name;
  std::string                 folder;
  std::optional<std::int64_t> chunk_index;
  bool                        pinned = false;

  // versioning / soft delete
  std::string previous_version_id;
  std::string superseded_by;
  std::string superseded_at;
  std::string deleted_at;

  bool                     conflict_detected = false;
  std::vector<std::string> contradiction_ids;

  std::map<std::string, std::string> extensions;
};

struct KnowledgeEntry {
  std::string        id;
  std::string        text;
  std::vector<float> embedding;
  EntryMetadata      metadata;
};

// Throws util::InvalidArgument when scalars leave [0, 1] or extensions exceed their bounds.
void ValidateMetadata(const EntryMetadata& metadata);

index::Payload ToPayload(const EntryMetadata& metadata);
EntryMetadata  MetadataFromPayload(const index::Payload& payload);

KnowledgeEntry FromRecord(const index::Record& record);

} // namespace engram::model
