// utils.hpp - Utility functions
#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace saveli {

// Logging
class Logger {
public:
  static Logger &getInstance();
  void init(bool verbose, const fs::path &log_path);
  void log(const std::string &level, const std::string &message);

private:
  Logger() = default;
  bool verbose_ = false;
  std::unique_ptr<std::ofstream> log_file_;
};

#define LOG_INFO(msg) Logger::getInstance().log("INFO", msg)
#define LOG_WARN(msg) Logger::getInstance().log("WARN", msg)
#define LOG_ERROR(msg) Logger::getInstance().log("ERROR", msg)
#define LOG_DEBUG(msg) Logger::getInstance().log("DEBUG", msg)

// String utilities
std::string trim(const std::string &s);

// File system utilities
bool ensure_dir_exists(const fs::path &path);
bool path_present(const fs::path &path);
bool is_link(const fs::path &path);
bool copy_tree(const fs::path &src, const fs::path &dst, std::error_code &ec);
bool read_file(const fs::path &path, std::string &out);

// Temp directory
fs::path make_temp_dir(const std::string &prefix);
void cleanup_temp_dir(const fs::path &temp_dir);

} // namespace saveli
