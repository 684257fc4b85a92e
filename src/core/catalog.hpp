// core/catalog.hpp - Versioned game catalog
#pragma once

#include "entry.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace saveli {

class CatalogError : public std::runtime_error {
public:
  enum class Kind {
    Io,          // catalog file could not be read or written
    Parse,       // malformed JSON or unexpected document shape
    TooNew,      // stored version is newer than CATALOG_VERSION
    InvalidPath, // a save path did not resolve to an absolute path
  };

  CatalogError(Kind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}
  Kind kind() const { return kind_; }

private:
  Kind kind_;
};

class Catalog {
public:
  // Loads storage_root/catalog.json, seeding it from the bundled catalog when
  // it does not exist yet.
  static Catalog open(const fs::path &storage_root);
  static Catalog load_from(const fs::path &path);
  static Catalog load(const std::string &data);

  bool save() const;

  const Entry *find(const std::string &id) const;
  std::vector<const Entry *> search(const std::string &keyword) const;

  // Upserts a custom entry and persists the catalog.
  bool add(Entry entry);

  const std::vector<Entry> &entries() const { return entries_; }
  int version() const { return version_; }
  const fs::path &path() const { return path_; }
  void set_path(const fs::path &path) { path_ = path; }

  std::string to_json() const;

private:
  Catalog() = default;

  int version_ = 0;
  std::vector<Entry> entries_;
  fs::path path_;
};

} // namespace saveli
