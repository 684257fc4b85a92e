// core/linker.cpp - Link engine implementation
#include "linker.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <cerrno>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace saveli {

const char *link_error_kind_name(LinkError::Kind kind) {
  switch (kind) {
  case LinkError::Kind::DestinationMissing:
    return "destination-missing";
  case LinkError::Kind::AlreadyLinked:
    return "already-linked";
  case LinkError::Kind::SourceExists:
    return "source-exists";
  case LinkError::Kind::LinkFailed:
    return "link-failed";
  case LinkError::Kind::MoveFailed:
    return "move-failed";
  case LinkError::Kind::SourceNotFound:
    return "source-not-found";
  case LinkError::Kind::DestinationExists:
    return "destination-exists";
  case LinkError::Kind::PermissionDenied:
    return "permission-denied";
  case LinkError::Kind::Io:
    return "io";
  }
  return "unknown";
}

std::string LinkError::message() const {
  std::string msg;
  switch (kind) {
  case Kind::DestinationMissing:
    msg = "No file or directory exists at " + target.string();
    break;
  case Kind::AlreadyLinked:
    msg = source.string() + " is already a link to " + target.string();
    break;
  case Kind::SourceExists:
    msg = "A file or directory already exists at " + source.string();
    break;
  case Kind::LinkFailed:
    msg = "Failed to link " + source.string() + " to " + target.string();
    break;
  case Kind::MoveFailed:
    msg = "Failed to move " + source.string() + " to " + target.string();
    break;
  case Kind::SourceNotFound:
    msg = "No file or directory exists at " + source.string();
    break;
  case Kind::DestinationExists:
    msg = "A file or directory already exists at " + target.string();
    break;
  case Kind::PermissionDenied:
    msg = "This process is not permitted to create links";
    break;
  case Kind::Io:
    msg = "Filesystem error at " + source.string();
    break;
  }
  if (code) {
    msg += ": " + code.message();
  }
  return msg;
}

// The only platform specific primitive. Windows needs to know whether the
// target is a directory, POSIX does not care.
#ifdef _WIN32
static std::error_code os_symlink(const fs::path &source,
                                  const fs::path &target) {
  std::error_code ec;
  if (fs::is_directory(target, ec)) {
    fs::create_directory_symlink(target, source, ec);
  } else {
    fs::create_symlink(target, source, ec);
  }
  return ec;
}
#else
static std::error_code os_symlink(const fs::path &source,
                                  const fs::path &target) {
  if (::symlink(target.c_str(), source.c_str()) != 0) {
    return std::error_code(errno, std::generic_category());
  }
  return std::error_code();
}
#endif

static bool same_path(const fs::path &a, const fs::path &b) {
  return a.lexically_normal() == b.lexically_normal();
}

LinkResult create_link(const fs::path &source, const fs::path &target) {
  std::error_code exists_ec;
  bool target_exists = fs::exists(target, exists_ec);
  if (exists_ec) {
    return LinkError{LinkError::Kind::Io, target, source, exists_ec};
  }
  if (!target_exists) {
    return LinkError{LinkError::Kind::DestinationMissing, source, target, {}};
  }

  std::error_code link_ec = os_symlink(source, target);
  if (!link_ec) {
    return std::nullopt;
  }

  // The OS error alone is ambiguous (Windows reports a directory over a file
  // as permission denied), so look at what is actually there.
  std::error_code ec;
  auto st = fs::symlink_status(source, ec);
  if (!ec && fs::is_symlink(st)) {
    fs::path current = fs::read_symlink(source, ec);
    if (!ec) {
      if (same_path(current, target)) {
        LOG_DEBUG(source.string() + " already links to " + target.string());
        return std::nullopt;
      }
      return LinkError{LinkError::Kind::AlreadyLinked, source, current, {}};
    }
  }
  if (!ec && (fs::is_directory(st) || fs::is_regular_file(st))) {
    return LinkError{LinkError::Kind::SourceExists, source, target, {}};
  }

  return LinkError{LinkError::Kind::LinkFailed, source, target, link_ec};
}

LinkResult move_item(const fs::path &source, const fs::path &destination) {
  if (path_present(destination)) {
    return LinkError{LinkError::Kind::MoveFailed, source, destination,
                     std::make_error_code(std::errc::file_exists)};
  }

  std::error_code ec;
  fs::rename(source, destination, ec);
  if (!ec) {
    return std::nullopt;
  }

  LOG_DEBUG("rename " + source.string() + " failed (" + ec.message() +
            "), falling back to copy");

  std::error_code copy_ec;
  if (!copy_tree(source, destination, copy_ec)) {
    // Source is untouched, drop whatever part of the copy was made
    std::error_code cleanup_ec;
    fs::remove_all(destination, cleanup_ec);
    if (cleanup_ec) {
      LOG_WARN("Failed to clean up partial copy at " + destination.string() +
               ": " + cleanup_ec.message());
    }
    return LinkError{LinkError::Kind::MoveFailed, source, destination,
                     copy_ec};
  }

  std::error_code remove_ec;
  fs::remove_all(source, remove_ec);
  if (remove_ec) {
    LOG_WARN("Copied " + source.string() + " to " + destination.string() +
             " but could not remove the original");
    return LinkError{LinkError::Kind::MoveFailed, source, destination,
                     remove_ec};
  }

  return std::nullopt;
}

LinkResult relocate_and_link(const fs::path &source,
                             const fs::path &destination) {
  std::error_code exists_ec;
  bool source_exists = fs::exists(source, exists_ec);
  if (exists_ec) {
    return LinkError{LinkError::Kind::Io, source, destination, exists_ec};
  }
  if (!source_exists) {
    return LinkError{LinkError::Kind::SourceNotFound, source, destination, {}};
  }

  if (path_present(destination)) {
    if (is_link(source)) {
      std::error_code ec;
      fs::path current = fs::read_symlink(source, ec);
      if (!ec && same_path(current, destination)) {
        LOG_DEBUG(source.string() + " is already relocated");
        return std::nullopt;
      }
    }
    return LinkError{LinkError::Kind::DestinationExists, source, destination,
                     {}};
  }

  // Moving someone else's link into storage would leave the real data behind
  if (is_link(source)) {
    std::error_code ec;
    fs::path current = fs::read_symlink(source, ec);
    return LinkError{LinkError::Kind::AlreadyLinked, source, current, ec};
  }

  LOG_DEBUG("Moving " + source.string() + " to " + destination.string());
  if (auto err = move_item(source, destination)) {
    return err;
  }

  LOG_DEBUG("Creating a link from " + source.string() + " to " +
            destination.string());
  if (auto err = create_link(source, destination)) {
    LOG_WARN("Linking failed, moving " + destination.string() + " back");
    if (auto rollback = move_item(destination, source)) {
      LOG_ERROR("Data left at " + destination.string() + ": " +
                rollback->message());
    }
    return err;
  }

  return std::nullopt;
}

LinkResult remove_link(const fs::path &source,
                       const fs::path &expected_target) {
  std::error_code ec;
  auto st = fs::symlink_status(source, ec);
  if (st.type() == fs::file_type::not_found) {
    return std::nullopt;
  }
  if (ec) {
    return LinkError{LinkError::Kind::Io, source, expected_target, ec};
  }

  if (!fs::is_symlink(st)) {
    return LinkError{LinkError::Kind::SourceExists, source, expected_target,
                     {}};
  }

  fs::path current = fs::read_symlink(source, ec);
  if (ec) {
    return LinkError{LinkError::Kind::LinkFailed, source, expected_target, ec};
  }
  if (!same_path(current, expected_target)) {
    return LinkError{LinkError::Kind::AlreadyLinked, source, current, {}};
  }

  fs::remove(source, ec);
  if (ec) {
    return LinkError{LinkError::Kind::LinkFailed, source, expected_target, ec};
  }
  return std::nullopt;
}

LinkResult verify_link_capability() {
  fs::path probe = make_temp_dir(PROBE_DIR_PREFIX);
  if (probe.empty()) {
    return LinkError{LinkError::Kind::PermissionDenied, fs::path(), fs::path(),
                     std::make_error_code(std::errc::io_error)};
  }

  fs::path target = probe / "target";
  fs::path link = probe / "link";

  std::error_code ec;
  fs::create_directory(target, ec);
  if (!ec) {
    ec = os_symlink(link, target);
  }
  cleanup_temp_dir(probe);

  if (ec) {
    return LinkError{LinkError::Kind::PermissionDenied, link, target, ec};
  }
  return std::nullopt;
}

} // namespace saveli
