// conf/config.cpp - User settings implementation
#include "config.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace saveli {

fs::path Settings::default_path() {
  const char *xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && *xdg && fs::path(xdg).is_absolute()) {
    return fs::path(xdg) / APP_DIR_NAME / SETTINGS_FILE_NAME;
  }

  const char *home = std::getenv("HOME");
  if (home && *home) {
    return fs::path(home) / ".config" / APP_DIR_NAME / SETTINGS_FILE_NAME;
  }

  return fs::path(SETTINGS_FILE_NAME);
}

Settings Settings::load_default() {
  Settings settings;
  fs::path default_path = Settings::default_path();
  if (fs::exists(default_path)) {
    try {
      return from_file(default_path);
    } catch (const std::exception &e) {
      LOG_WARN("Failed to load settings from " + default_path.string() + ": " +
               e.what() + ", using defaults");
    }
  }
  return settings;
}

Settings Settings::from_file(const fs::path &path) {
  Settings settings;

  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open settings file " + path.string());
  }

  std::string line;
  while (std::getline(file, line)) {
    if (line.empty() || line[0] == '#')
      continue;

    auto eq_pos = line.find('=');
    if (eq_pos != std::string::npos) {
      std::string key = line.substr(0, eq_pos);
      std::string value = line.substr(eq_pos + 1);

      key.erase(0, key.find_first_not_of(" \t"));
      key.erase(key.find_last_not_of(" \t") + 1);
      value.erase(0, value.find_first_not_of(" \t\""));
      value.erase(value.find_last_not_of(" \t\"\r") + 1);

      if (key == "storage_path")
        settings.storage_path = value;
      else if (key == "verbose")
        settings.verbose = (value == "true");
      else if (key == "log_file")
        settings.log_file = value;
      else if (key == "ignored") {
        std::stringstream ss(value);
        std::string id;
        while (std::getline(ss, id, ',')) {
          id = trim(id);
          if (!id.empty()) {
            settings.ignored.insert(id);
          }
        }
      }
    }
  }

  return settings;
}

bool Settings::save_to_file(const fs::path &path) const {
  if (path.has_parent_path() && !ensure_dir_exists(path.parent_path())) {
    return false;
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    return false;
  }

  file << "# Saveli Settings\n";
  file << "storage_path = \"" << storage_path.string() << "\"\n";
  file << "verbose = " << (verbose ? "true" : "false") << "\n";
  if (!log_file.empty()) {
    file << "log_file = \"" << log_file.string() << "\"\n";
  }

  if (!ignored.empty()) {
    file << "ignored = \"";
    size_t i = 0;
    for (const auto &id : ignored) {
      file << id;
      if (++i < ignored.size())
        file << ",";
    }
    file << "\"\n";
  }

  file.flush();
  return static_cast<bool>(file);
}

void Settings::merge_with_cli(bool verbose_override, bool dry_run_override) {
  if (verbose_override) {
    verbose = true;
  }
  if (dry_run_override) {
    dry_run = true;
  }
}

bool Settings::is_ignored(const std::string &id) const {
  return ignored.find(id) != ignored.end();
}

bool Settings::ignore(const std::string &id) {
  return ignored.insert(id).second;
}

bool Settings::heed(const std::string &id) { return ignored.erase(id) > 0; }

} // namespace saveli
