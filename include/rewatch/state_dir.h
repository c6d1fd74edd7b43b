#pragma once

#include <rewatch/log.h>

#include <filesystem>
#include <system_error>
#include <utility>

namespace rewatch {

/// Hands out per-resource directories under a root, creating them on demand.
class state_dir_t {
  std::filesystem::path root_;

public:
  explicit state_dir_t(std::filesystem::path root) : root_{std::move(root)} {}

  const std::filesystem::path &root() const { return root_; }

  /// Throws std::filesystem::filesystem_error if the directory cannot be
  /// created.
  std::filesystem::path operator()(const std::filesystem::path &name) const {
    REWATCH_ASSERT(name.is_relative());

    auto path = root_ / name;
    auto ec = std::error_code{};
    std::filesystem::create_directories(path, ec);
    if (ec)
      throw std::filesystem::filesystem_error{"cannot create state directory",
                                              path, ec};

    log::debug("state directory {}", path.string());
    return path;
  }
};

} // namespace rewatch
