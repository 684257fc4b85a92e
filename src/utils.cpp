// utils.cpp - Utility functions implementation
#include "utils.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unistd.h>
#include <vector>

namespace saveli {

// Logger implementation
Logger &Logger::getInstance() {
  static Logger instance;
  return instance;
}

void Logger::init(bool verbose, const fs::path &log_path) {
  verbose_ = verbose;
  log_file_.reset();

  if (!log_path.empty()) {
    if (log_path.has_parent_path()) {
      std::error_code ec;
      fs::create_directories(log_path.parent_path(), ec);
    }
    log_file_ = std::make_unique<std::ofstream>(log_path, std::ios::app);
  }
}

void Logger::log(const std::string &level, const std::string &message) {
  // Skip DEBUG messages if not in verbose mode
  if (level == "DEBUG" && !verbose_) {
    return;
  }

  auto now = std::time(nullptr);
  char time_buf[64];
  std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S",
                std::localtime(&now));

  std::string log_line =
      std::string("[") + time_buf + "] [" + level + "] " + message + "\n";

  if (log_file_ && log_file_->is_open()) {
    *log_file_ << log_line;
    log_file_->flush();
  }

  std::cerr << log_line;
}

std::string trim(const std::string &s) {
  const char *ws = " \t\r\n\f\v";
  auto start = s.find_first_not_of(ws);
  if (start == std::string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(ws);
  return s.substr(start, end - start + 1);
}

// File system utilities
bool ensure_dir_exists(const fs::path &path) {
  try {
    if (!fs::exists(path)) {
      fs::create_directories(path);
    }
    return true;
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to create directory " + path.string() + ": " + e.what());
    return false;
  }
}

// Unlike fs::exists, a dangling link counts as present.
bool path_present(const fs::path &path) {
  std::error_code ec;
  return fs::exists(fs::symlink_status(path, ec));
}

bool is_link(const fs::path &path) {
  std::error_code ec;
  return fs::is_symlink(fs::symlink_status(path, ec));
}

static bool copy_entry(const fs::path &src, const fs::path &dst,
                       std::error_code &ec) {
  auto st = fs::symlink_status(src, ec);
  if (ec) {
    return false;
  }

  if (fs::is_symlink(st)) {
    auto link_target = fs::read_symlink(src, ec);
    if (ec) {
      return false;
    }
    fs::create_symlink(link_target, dst, ec);
    return !ec;
  }

  if (fs::is_directory(st)) {
    fs::create_directory(dst, ec);
    if (ec) {
      return false;
    }
    for (fs::directory_iterator it(src, ec), end; !ec && it != end;
         it.increment(ec)) {
      if (!copy_entry(it->path(), dst / it->path().filename(), ec)) {
        return false;
      }
    }
    if (ec) {
      return false;
    }
    fs::permissions(dst, st.permissions(), ec);
    return !ec;
  }

  fs::copy_file(src, dst, fs::copy_options::none, ec);
  if (ec) {
    return false;
  }
  fs::permissions(dst, st.permissions(), ec);
  return !ec;
}

bool copy_tree(const fs::path &src, const fs::path &dst, std::error_code &ec) {
  ec.clear();
  if (path_present(dst)) {
    ec = std::make_error_code(std::errc::file_exists);
    return false;
  }
  if (!copy_entry(src, dst, ec)) {
    LOG_DEBUG("copy_tree failed at " + src.string() + ": " + ec.message());
    return false;
  }
  return true;
}

bool read_file(const fs::path &path, std::string &out) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return false;
  }
  std::stringstream ss;
  ss << file.rdbuf();
  out = ss.str();
  return !file.bad();
}

// Temp directory
fs::path make_temp_dir(const std::string &prefix) {
  std::error_code ec;
  fs::path base = fs::temp_directory_path(ec);
  if (ec) {
    base = "/tmp";
  }

  std::string tmpl = (base / (prefix + "XXXXXX")).string();
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');

  if (mkdtemp(buf.data()) == nullptr) {
    LOG_ERROR("Failed to create temp dir under " + base.string() + ": " +
              strerror(errno));
    return fs::path();
  }
  return fs::path(buf.data());
}

void cleanup_temp_dir(const fs::path &temp_dir) {
  try {
    if (path_present(temp_dir)) {
      fs::remove_all(temp_dir);
    }
  } catch (const std::exception &e) {
    LOG_WARN("Failed to clean up temp dir " + temp_dir.string() + ": " +
             e.what());
  }
}

} // namespace saveli
