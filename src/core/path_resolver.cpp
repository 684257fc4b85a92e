// core/path_resolver.cpp - Save path template expansion implementation
#include "path_resolver.hpp"
#include "../utils.hpp"
#include <cstdlib>

namespace saveli {

std::string PathError::message() const {
  switch (kind) {
  case Kind::Relative:
    return "Found relative path: \"" + expanded + "\" (from \"" + raw + "\")";
  }
  return "Invalid save path: " + raw;
}

static bool is_name_start(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
}

static bool is_name_char(char c) {
  return is_name_start(c) || (c >= '0' && c <= '9');
}

static std::string lookup_env(const std::string &name) {
  const char *value = std::getenv(name.c_str());
  return value ? std::string(value) : std::string();
}

std::string expand_env(const std::string &input) {
  std::string out;
  out.reserve(input.size());

  size_t i = 0;
  while (i < input.size()) {
    char c = input[i];
    if (c != '$' || i + 1 >= input.size()) {
      out += c;
      ++i;
      continue;
    }

    char next = input[i + 1];
    if (next == '{') {
      auto close = input.find('}', i + 2);
      if (close == std::string::npos) {
        // Unterminated, keep the rest verbatim
        out.append(input, i, std::string::npos);
        break;
      }
      std::string name = input.substr(i + 2, close - (i + 2));
      bool valid = !name.empty() && is_name_start(name[0]);
      for (char nc : name) {
        valid = valid && is_name_char(nc);
      }
      if (!valid) {
        out.append(input, i, close - i + 1);
      } else {
        out += lookup_env(name);
      }
      i = close + 1;
    } else if (is_name_start(next)) {
      size_t end = i + 1;
      while (end < input.size() && is_name_char(input[end])) {
        ++end;
      }
      out += lookup_env(input.substr(i + 1, end - (i + 1)));
      i = end;
    } else {
      out += c;
      ++i;
    }
  }

  return out;
}

std::optional<PathError> resolve_save_path(const std::string &raw,
                                           fs::path &resolved) {
  std::string trimmed = trim(raw);
  if (trimmed.empty() || trimmed[0] != '$') {
    LOG_WARN("The path doesn't start with a variable: " + trimmed);
  }

  std::string expanded = expand_env(trimmed);
  fs::path candidate(expanded);
  if (candidate.empty() || candidate.is_relative()) {
    return PathError{PathError::Kind::Relative, trimmed, expanded};
  }

  candidate = candidate.lexically_normal();
  // "/a/b/" names the same location as "/a/b"; links need the latter
  if (!candidate.has_filename() && candidate != candidate.root_path()) {
    candidate = candidate.parent_path();
  }
  resolved = candidate;
  return std::nullopt;
}

} // namespace saveli
