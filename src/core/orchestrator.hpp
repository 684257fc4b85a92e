// core/orchestrator.hpp - Per-game link, restore and unlink batches
#pragma once

#include "entry.hpp"
#include "linker.hpp"
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace saveli {

struct BatchOptions {
  fs::path storage_root;
  bool dry_run = false;
  std::function<bool(const std::string &)> is_ignored;
};

enum class EntryStatus { Done, Ignored, Failed };

struct EntryOutcome {
  std::string id;
  std::string title;
  EntryStatus status = EntryStatus::Done;
  std::vector<LinkError> errors;
};

struct BatchReport {
  std::vector<EntryOutcome> outcomes;

  size_t count(EntryStatus status) const;
};

std::vector<const Entry *>
entries_with_movable_saves(const std::vector<Entry> &entries);
std::vector<const Entry *>
entries_with_moved_saves(const std::vector<Entry> &entries,
                         const fs::path &storage_root);

EntryOutcome link_entry(const Entry &entry, const BatchOptions &opts);
EntryOutcome restore_entry(const Entry &entry, const BatchOptions &opts);
EntryOutcome unlink_entry(const Entry &entry, const BatchOptions &opts);

BatchReport link_all(const std::vector<Entry> &entries,
                     const BatchOptions &opts);
BatchReport restore_all(const std::vector<Entry> &entries,
                        const BatchOptions &opts);
BatchReport unlink_all(const std::vector<Entry> &entries,
                       const BatchOptions &opts);

} // namespace saveli
