// core/linker.hpp - Link engine: move data and install links
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace saveli {

struct LinkError {
  enum class Kind {
    // create_link
    DestinationMissing, // link target does not exist
    AlreadyLinked,      // source is a link to some other target
    SourceExists,       // source is real data
    LinkFailed,         // OS refused to create the link
    // move_item
    MoveFailed,
    // relocate_and_link
    SourceNotFound,
    DestinationExists,
    // verify_link_capability
    PermissionDenied,
    // any other filesystem failure, e.g. creating a parent directory
    Io,
  };

  Kind kind;
  fs::path source;
  fs::path target; // for AlreadyLinked, the link's actual target
  std::error_code code;

  std::string message() const;
};

// std::nullopt on success.
using LinkResult = std::optional<LinkError>;

const char *link_error_kind_name(LinkError::Kind kind);

// Creates a link at `source` pointing to `target`. Succeeds without changes
// when `source` already links to `target`.
LinkResult create_link(const fs::path &source, const fs::path &target);

// rename(), falling back to copy-then-delete across devices.
LinkResult move_item(const fs::path &source, const fs::path &destination);

// Moves `source` to `destination` and leaves a link behind.
LinkResult relocate_and_link(const fs::path &source,
                             const fs::path &destination);

// Removes `source` only if it links to `expected_target`. A missing source is
// not an error.
LinkResult remove_link(const fs::path &source, const fs::path &expected_target);

// Probes whether this process may create links at all.
LinkResult verify_link_capability();

} // namespace saveli
