// conf/config.hpp - User settings management
#pragma once

#include <filesystem>
#include <set>
#include <string>

namespace fs = std::filesystem;

namespace saveli {

struct Settings {
  fs::path storage_path;
  std::set<std::string> ignored;
  bool verbose = false;
  fs::path log_file;
  bool dry_run = false; // command line only, never persisted

  static fs::path default_path();
  static Settings load_default();
  static Settings from_file(const fs::path &path);
  bool save_to_file(const fs::path &path) const;

  void merge_with_cli(bool verbose_override, bool dry_run_override);

  bool is_ignored(const std::string &id) const;
  // Both return false when the set was already in the requested state.
  bool ignore(const std::string &id);
  bool heed(const std::string &id);
};

} // namespace saveli
