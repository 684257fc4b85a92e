// core/catalog.cpp - Versioned game catalog implementation
#include "catalog.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "default_catalog.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>

namespace saveli {

Catalog Catalog::open(const fs::path &storage_root) {
  fs::path catalog_path = storage_root / CATALOG_FILE_NAME;

  if (fs::exists(catalog_path)) {
    return load_from(catalog_path);
  }

  LOG_INFO("No catalog at " + catalog_path.string() +
           ", seeding it from the bundled catalog");
  Catalog catalog = load(default_catalog_json());
  catalog.path_ = catalog_path;
  if (!catalog.save()) {
    throw CatalogError(CatalogError::Kind::Io,
                       "Unable to write " + catalog_path.string());
  }
  return catalog;
}

Catalog Catalog::load_from(const fs::path &path) {
  std::string data;
  if (!read_file(path, data)) {
    throw CatalogError(CatalogError::Kind::Io,
                       "Unable to read " + path.string());
  }

  Catalog catalog = load(data);
  catalog.path_ = path;
  LOG_INFO("Loaded " + std::to_string(catalog.entries_.size()) +
           " game entries from " + path.string());
  return catalog;
}

Catalog Catalog::load(const std::string &data) {
  Catalog catalog;

  try {
    json::Value root = json::parse(data);
    const json::Value &version_value = root.at("version");
    // Compared before narrowing so huge versions still count as too new
    double raw_version = version_value.as_double();
    if (raw_version > CATALOG_VERSION &&
        std::floor(raw_version) == raw_version) {
      throw CatalogError(CatalogError::Kind::TooNew,
                         "The database version (" + json::dump(version_value) +
                             ") is too new, up to version " +
                             std::to_string(CATALOG_VERSION) +
                             " is supported");
    }
    int64_t version = version_value.as_int();
    if (version < 0) {
      throw json::Error("Negative catalog version");
    }
    catalog.version_ = static_cast<int>(version);

    for (const auto &item : root.at("games").items()) {
      catalog.entries_.push_back(Entry::from_json(item));
    }
  } catch (const json::Error &e) {
    throw CatalogError(CatalogError::Kind::Parse,
                       std::string("Malformed catalog: ") + e.what());
  }

  // The ordering puts customisations first, so unique() keeps them.
  std::sort(catalog.entries_.begin(), catalog.entries_.end());
  catalog.entries_.erase(
      std::unique(catalog.entries_.begin(), catalog.entries_.end()),
      catalog.entries_.end());

  for (auto &entry : catalog.entries_) {
    if (auto err = entry.resolve()) {
      throw CatalogError(CatalogError::Kind::InvalidPath,
                         entry.id + ": " + err->message());
    }
  }

  return catalog;
}

std::string Catalog::to_json() const {
  json::Value root = json::Value::object();
  root["version"] = json::Value(CATALOG_VERSION);

  json::Value games = json::Value::array();
  for (const auto &entry : entries_) {
    games.push_back(entry.to_json());
  }
  root["games"] = games;

  return json::dump(root, 2) + "\n";
}

bool Catalog::save() const {
  if (path_.empty()) {
    LOG_ERROR("Catalog has no storage location");
    return false;
  }

  LOG_DEBUG("Saving " + path_.string());
  if (path_.has_parent_path()) {
    ensure_dir_exists(path_.parent_path());
  }

  std::ofstream file(path_, std::ios::trunc);
  if (!file.is_open()) {
    LOG_ERROR("Failed to save catalog to " + path_.string());
    return false;
  }

  file << to_json();
  file.flush();
  if (!file) {
    LOG_ERROR("Failed to write catalog to " + path_.string());
    return false;
  }
  return true;
}

const Entry *Catalog::find(const std::string &id) const {
  for (const auto &entry : entries_) {
    if (entry.id == id) {
      return &entry;
    }
  }
  return nullptr;
}

std::vector<const Entry *> Catalog::search(const std::string &keyword) const {
  if (keyword.empty()) {
    throw std::invalid_argument("The keyword must not be empty");
  }

  std::vector<const Entry *> matches;
  for (const auto &entry : entries_) {
    if (entry.id.find(keyword) != std::string::npos ||
        entry.title.find(keyword) != std::string::npos) {
      matches.push_back(&entry);
    }
  }
  return matches;
}

bool Catalog::add(Entry entry) {
  entry.custom = true;

  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [&entry](const Entry &e) {
                                  return e == entry && e.custom;
                                }),
                 entries_.end());
  entries_.push_back(std::move(entry));
  std::stable_sort(entries_.begin(), entries_.end());

  return save();
}

} // namespace saveli
