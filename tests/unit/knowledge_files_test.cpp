#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/knowledge/knowledge_store.hpp"
#include "internal/util/errors.hpp"
#include "support/store_fixture.hpp"

namespace {

using engram::knowledge::FileChunkInput;
using engram::knowledge::FileSummary;
using engram::knowledge::SearchRequest;
using engram::model::Collection;
using engram::model::EntryStatus;
using engram::testing::MakeStoreFixture;
using engram::testing::StoreFixture;

FileChunkInput Chunk(const std::string& file_name, const std::string& file_id, std::int64_t index, const std::string& workspace = {}) {
  FileChunkInput input;
  input.file_name    = file_name;
  input.file_id      = file_id;
  input.chunk_index  = index;
  input.folder       = "docs";
  input.workspace_id = workspace;
  return input;
}

// Two chunks of guide.md (file-1) and one of notes.txt (file-2).
void Seed(StoreFixture& f) {
  f.store->AddFileChunk("Install the agent with the setup script", Chunk("guide.md", "file-1", 0));
  f.store->AddFileChunk("Configure the agent through engramd.yaml", Chunk("guide.md", "file-1", 1));
  f.store->AddFileChunk("Meeting notes from the planning session", Chunk("notes.txt", "file-2", 0));
}

const FileSummary* FindFile(const std::vector<FileSummary>& files, const std::string& file_id) {
  for (const auto& file : files) {
    if (file.file_id == file_id) return &file;
  }
  return nullptr;
}

bool HasEvent(StoreFixture& f, const std::string& type) {
  for (const auto& event : f.store->ListAuditLogs(100)) {
    if (event.event_type == type) return true;
  }
  return false;
}

void TestAddFileChunkValidation() {
  auto f = MakeStoreFixture();

  bool threw = false;
  try {
    f.store->AddFileChunk("  ", Chunk("guide.md", "", 0));
  } catch (const engram::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.store->AddFileChunk("some text", Chunk(" ", "", 0));
  } catch (const engram::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  const auto id    = f.store->AddFileChunk("some text", Chunk(" guide.md ", "", 3, "team-a"));
  auto       entry = f.store->GetEntry(Collection::kFiles, id);
  assert(entry.has_value());
  assert(entry->metadata.file_id.size() == 36);
  assert(entry->metadata.file_name == "guide.md");
  assert(entry->metadata.chunk_index == std::int64_t{3});
  assert(entry->metadata.workspace_id == "team-a");
  assert(entry->metadata.priority == "normal");
  assert(HasEvent(f, "file_chunk_added"));
}

void TestListFiles() {
  auto f = MakeStoreFixture();
  Seed(f);
  f.store->AddFileChunk("Other team document", Chunk("other.md", "file-3", 0, "team-b"));

  auto files = f.store->ListFiles();
  assert(files.size() == 3);
  assert(files[0].file_name == "guide.md");
  assert(files[0].chunk_count == 2);
  assert(files[0].folder == "docs");
  assert(files[0].status == "active");
  assert(files[1].file_name == "notes.txt");
  assert(files[2].file_name == "other.md");

  auto team_b = f.store->ListFiles("team-b");
  assert(team_b.size() == 1 && team_b.front().file_id == "file-3");
}

void TestSoftDeleteAndRestore() {
  auto f = MakeStoreFixture();
  Seed(f);

  assert(f.store->SoftDeleteFile("file-1") == 2);
  assert(f.store->SoftDeleteFile("file-1") == 0);
  assert(f.store->ListFiles().size() == 1);

  auto with_deleted = f.store->ListFiles({}, true);
  assert(with_deleted.size() == 2);
  assert(FindFile(with_deleted, "file-1")->status == "deleted");

  for (const auto& entry : f.store->ListEntries(Collection::kFiles, {{"file_id", std::string("file-1")}})) {
    assert(entry.metadata.status == EntryStatus::kDeleted);
    assert(!entry.metadata.deleted_at.empty());
  }

  // search never surfaces trashed chunks
  SearchRequest request;
  request.query = "Install the agent with the setup script";
  request.top_k = 10;
  for (const auto& result : f.store->SearchFacts(request)) assert(result.metadata.file_id != "file-1");

  assert(f.store->RestoreFile("file-1") == 2);
  assert(f.store->RestoreFile("file-1") == 0);
  assert(FindFile(f.store->ListFiles(), "file-1")->status == "active");

  assert(HasEvent(f, "file_soft_deleted"));
  assert(HasEvent(f, "file_restored"));

  bool threw = false;
  try {
    f.store->SoftDeleteFile("  ");
  } catch (const engram::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestPinMoveRename() {
  auto f = MakeStoreFixture();
  Seed(f);

  assert(f.store->PinFile("file-2") == 1);
  auto pinned = f.store->ListEntries(Collection::kFiles, {{"file_id", std::string("file-2")}});
  assert(pinned.front().metadata.pinned);
  assert(pinned.front().metadata.priority == "pinned");
  assert(FindFile(f.store->ListFiles(), "file-2")->pinned);

  assert(f.store->PinFile("file-2", false) == 1);
  auto unpinned = f.store->ListEntries(Collection::kFiles, {{"file_id", std::string("file-2")}});
  assert(!unpinned.front().metadata.pinned);
  assert(unpinned.front().metadata.priority == "normal");

  assert(f.store->MoveFile("file-1", " archive/2024 ") == 2);
  assert(FindFile(f.store->ListFiles(), "file-1")->folder == "archive/2024");

  assert(f.store->RenameFile("file-1", "install-guide.md") == 2);
  assert(FindFile(f.store->ListFiles(), "file-1")->file_name == "install-guide.md");
  assert(f.store->RenameFile("file-1", "   ") == 0);
  assert(f.store->RenameFile("no-such-file", "x.md") == 0);

  // trashed files can still be reorganised, but not pinned
  f.store->SoftDeleteFile("file-2");
  assert(f.store->PinFile("file-2") == 0);
  assert(f.store->MoveFile("file-2", "trash") == 1);

  assert(HasEvent(f, "file_pinned"));
  assert(HasEvent(f, "file_unpinned"));
  assert(HasEvent(f, "file_moved"));
  assert(HasEvent(f, "file_renamed"));
}

void TestHardDelete() {
  auto f = MakeStoreFixture();
  Seed(f);
  f.store->AddFileChunk("Same name elsewhere", Chunk("notes.txt", "file-4", 0, "team-b"));

  f.store->SoftDeleteFile("file-1");
  assert(f.store->DeleteFile("file-1") == 2);
  assert(f.store->DeleteFile("file-1") == 0);
  assert(f.store->ListEntries(Collection::kFiles, {{"file_id", std::string("file-1")}}).empty());

  assert(f.store->DeleteFileByName("notes.txt", "team-b") == 1);
  assert(f.store->DeleteFileByName("notes.txt") == 1);
  assert(f.store->GetCollectionStats().files == 0);
  assert(HasEvent(f, "file_deleted"));

  bool threw = false;
  try {
    f.store->DeleteFileByName(" ");
  } catch (const engram::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestFileEventsCarryWorkspace() {
  auto f = MakeStoreFixture();
  Seed(f);
  f.store->AddFileChunk("Quarterly plan", Chunk("plan.md", "file-3", 0, "team-a"));

  assert(f.store->MoveFile("file-3", "archive") == 1);
  assert(f.store->DeleteFileByName("plan.md", "team-a") == 1);

  const auto events = f.store->ListAuditLogs(100, "team-a");
  assert(events.size() == 3);
  std::vector<std::string> types;
  for (const auto& event : events) {
    assert(event.workspace_id == "team-a");
    types.push_back(event.event_type);
  }
  std::sort(types.begin(), types.end());
  assert((types == std::vector<std::string>{"file_chunk_added", "file_deleted", "file_moved"}));
  for (const auto& event : events) {
    if (event.event_type == "file_moved") assert(event.entry_id == "file-3");
  }

  assert(f.store->ListAuditLogs(100, "team-b").empty());
}

void TestFileWritesFailLoudly() {
  auto f = MakeStoreFixture();
  Seed(f);

  f.index->fail_writes = true;
  bool threw           = false;
  try {
    f.store->SoftDeleteFile("file-1");
  } catch (const engram::util::IndexError&) {
    threw = true;
  }
  assert(threw);
  f.index->fail_writes = false;
  assert(FindFile(f.store->ListFiles(), "file-1")->status == "active");

  f.index->fail_reads = true;
  assert(f.store->ListFiles().empty());
  f.index->fail_reads = false;
}

} // namespace

int main() {
  TestAddFileChunkValidation();
  TestListFiles();
  TestSoftDeleteAndRestore();
  TestPinMoveRename();
  TestHardDelete();
  TestFileEventsCarryWorkspace();
  TestFileWritesFailLoudly();

  std::cout << "engram_unit_knowledge_files: pass" << std::endl;
  return 0;
}
