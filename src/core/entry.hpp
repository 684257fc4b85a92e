// core/entry.hpp - Catalog entries (games and their save paths)
#pragma once

#include "json.hpp"
#include "path_resolver.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace saveli {

struct SavePath {
  std::string id;
  std::string raw; // persisted template, e.g. "$HOME/.factorio/saves"
  fs::path resolved; // derived by resolve(), never persisted

  std::optional<PathError> resolve();
};

struct Entry {
  std::string title;
  std::string id;
  bool custom = false;
  std::vector<SavePath> saves;

  // Resolves every save path, stopping at the first failure.
  std::optional<PathError> resolve();

  static Entry from_json(const json::Value &value);
  json::Value to_json() const;
};

// Identity is the id alone.
bool operator==(const Entry &a, const Entry &b);
bool operator!=(const Entry &a, const Entry &b);

// id ascending, custom before bundled, then title.
bool operator<(const Entry &a, const Entry &b);

} // namespace saveli
