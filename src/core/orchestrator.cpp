// core/orchestrator.cpp - Per-game link, restore and unlink batches
#include "orchestrator.hpp"
#include "../utils.hpp"

namespace saveli {

size_t BatchReport::count(EntryStatus status) const {
  size_t n = 0;
  for (const auto &outcome : outcomes) {
    if (outcome.status == status) {
      ++n;
    }
  }
  return n;
}

// Helper: a save path is movable when real data sits at its original location
static bool is_movable(const SavePath &save) {
  return path_present(save.resolved) && !is_link(save.resolved);
}

std::vector<const Entry *>
entries_with_movable_saves(const std::vector<Entry> &entries) {
  std::vector<const Entry *> result;
  for (const auto &entry : entries) {
    if (entry.id.empty()) {
      continue;
    }
    for (const auto &save : entry.saves) {
      if (is_movable(save)) {
        result.push_back(&entry);
        break;
      }
    }
  }
  return result;
}

std::vector<const Entry *>
entries_with_moved_saves(const std::vector<Entry> &entries,
                         const fs::path &storage_root) {
  std::vector<const Entry *> result;
  for (const auto &entry : entries) {
    if (entry.id.empty()) {
      continue;
    }
    std::error_code ec;
    if (fs::exists(storage_root / entry.id, ec)) {
      result.push_back(&entry);
    } else if (ec) {
      LOG_WARN("Skipping " + entry.title + ": " + ec.message());
    }
  }
  return result;
}

static EntryOutcome make_outcome(const Entry &entry) {
  EntryOutcome outcome;
  outcome.id = entry.id;
  outcome.title = entry.title;
  return outcome;
}

static void record(EntryOutcome &outcome, const LinkError &err) {
  LOG_WARN(outcome.title + ": " + err.message());
  outcome.errors.push_back(err);
  outcome.status = EntryStatus::Failed;
}

// Helper: make sure the directory holding an original save location exists
static bool ensure_parent(const fs::path &path, EntryOutcome &outcome) {
  fs::path parent = path.parent_path();
  if (parent.empty()) {
    return true;
  }
  std::error_code ec;
  if (fs::exists(parent, ec)) {
    return true;
  }
  if (!ec) {
    fs::create_directories(parent, ec);
  }
  if (ec) {
    record(outcome, LinkError{LinkError::Kind::Io, parent, path, ec});
    return false;
  }
  return true;
}

EntryOutcome link_entry(const Entry &entry, const BatchOptions &opts) {
  EntryOutcome outcome = make_outcome(entry);
  fs::path game_storage = opts.storage_root / entry.id;

  if (!opts.dry_run) {
    std::error_code ec;
    fs::create_directories(game_storage, ec);
    if (ec) {
      record(outcome, LinkError{LinkError::Kind::Io, game_storage, {}, ec});
      return outcome;
    }
  }

  for (const auto &save : entry.saves) {
    fs::path dest = game_storage / save.id;
    LOG_INFO("Linking " + entry.title + "'s " + save.resolved.string() +
             " to " + dest.string());

    if (opts.dry_run) {
      continue;
    }

    if (auto err = relocate_and_link(save.resolved, dest)) {
      record(outcome, *err);
    }
  }

  return outcome;
}

EntryOutcome restore_entry(const Entry &entry, const BatchOptions &opts) {
  EntryOutcome outcome = make_outcome(entry);
  fs::path game_storage = opts.storage_root / entry.id;

  for (const auto &save : entry.saves) {
    fs::path dest = game_storage / save.id;
    LOG_INFO("Restoring " + entry.title + "'s " + save.resolved.string() +
             " from " + dest.string());

    if (opts.dry_run) {
      continue;
    }

    if (!ensure_parent(save.resolved, outcome)) {
      continue;
    }
    if (auto err = create_link(save.resolved, dest)) {
      record(outcome, *err);
    }
  }

  return outcome;
}

EntryOutcome unlink_entry(const Entry &entry, const BatchOptions &opts) {
  EntryOutcome outcome = make_outcome(entry);
  fs::path game_storage = opts.storage_root / entry.id;

  for (const auto &save : entry.saves) {
    fs::path stored = game_storage / save.id;
    LOG_INFO("Unlinking " + entry.title + "'s " + save.resolved.string() +
             " from " + stored.string());

    if (opts.dry_run) {
      continue;
    }

    if (!path_present(stored)) {
      // Never relocated, unless our link is still dangling at the original
      std::error_code ec;
      fs::path current = fs::read_symlink(save.resolved, ec);
      if (!ec && current.lexically_normal() == stored.lexically_normal()) {
        record(outcome, LinkError{LinkError::Kind::SourceNotFound, stored,
                                  save.resolved, {}});
      } else {
        LOG_DEBUG("Nothing stored for " + save.resolved.string());
      }
      continue;
    }
    if (!ensure_parent(save.resolved, outcome)) {
      continue;
    }

    // Only our own link is removed, real data at the original path stays
    LOG_DEBUG("Removing link " + save.resolved.string());
    if (auto err = remove_link(save.resolved, stored)) {
      record(outcome, *err);
      continue;
    }

    LOG_DEBUG("Moving " + stored.string() + " to " + save.resolved.string());
    if (auto err = move_item(stored, save.resolved)) {
      record(outcome, *err);
      if (auto relink = create_link(save.resolved, stored)) {
        LOG_ERROR("Could not re-link " + save.resolved.string() + ": " +
                  relink->message());
      }
    }
  }

  // Non-recursive: anything still stored keeps the directory
  if (!opts.dry_run) {
    LOG_DEBUG("Removing " + game_storage.string());
    std::error_code ec;
    fs::remove(game_storage, ec);
    if (ec) {
      LOG_WARN("Keeping " + game_storage.string() + ": " + ec.message());
    }
  }

  return outcome;
}

template <typename Op>
static BatchReport run_batch(const std::vector<const Entry *> &selected,
                             const BatchOptions &opts, Op op) {
  BatchReport report;
  for (const Entry *entry : selected) {
    if (opts.is_ignored && opts.is_ignored(entry->id)) {
      LOG_INFO(entry->title + " is ignored, skipping");
      EntryOutcome outcome = make_outcome(*entry);
      outcome.status = EntryStatus::Ignored;
      report.outcomes.push_back(outcome);
      continue;
    }
    try {
      report.outcomes.push_back(op(*entry, opts));
    } catch (const fs::filesystem_error &e) {
      EntryOutcome outcome = make_outcome(*entry);
      record(outcome, LinkError{LinkError::Kind::Io, e.path1(), e.path2(),
                                e.code()});
      report.outcomes.push_back(outcome);
    } catch (const std::exception &e) {
      LOG_WARN(entry->title + ": " + e.what());
      EntryOutcome outcome = make_outcome(*entry);
      record(outcome,
             LinkError{LinkError::Kind::Io, opts.storage_root / entry->id, {},
                       std::make_error_code(std::errc::io_error)});
      report.outcomes.push_back(outcome);
    }
  }
  return report;
}

BatchReport link_all(const std::vector<Entry> &entries,
                     const BatchOptions &opts) {
  auto movable = entries_with_movable_saves(entries);
  LOG_INFO("Found " + std::to_string(movable.size()) +
           " games with saves in their standard locations");
  return run_batch(movable, opts, link_entry);
}

BatchReport restore_all(const std::vector<Entry> &entries,
                        const BatchOptions &opts) {
  auto restorable = entries_with_moved_saves(entries, opts.storage_root);
  LOG_INFO("Found " + std::to_string(restorable.size()) +
           " games with saves moved to " + opts.storage_root.string());
  return run_batch(restorable, opts, restore_entry);
}

BatchReport unlink_all(const std::vector<Entry> &entries,
                       const BatchOptions &opts) {
  auto restorable = entries_with_moved_saves(entries, opts.storage_root);
  LOG_INFO("Found " + std::to_string(restorable.size()) +
           " games with moved saves");
  return run_batch(restorable, opts, unlink_entry);
}

} // namespace saveli
