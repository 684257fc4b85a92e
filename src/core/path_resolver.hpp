// core/path_resolver.hpp - Save path template expansion
#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace saveli {

struct PathError {
  enum class Kind {
    Relative, // expansion produced a relative (or empty) path
  };

  Kind kind;
  std::string raw;
  std::string expanded;

  std::string message() const;
};

// Expands $NAME and ${NAME}. Undefined variables expand to "".
std::string expand_env(const std::string &input);

// Trims, expands and validates a save path template. On success `resolved`
// holds an absolute path.
std::optional<PathError> resolve_save_path(const std::string &raw,
                                           fs::path &resolved);

} // namespace saveli
