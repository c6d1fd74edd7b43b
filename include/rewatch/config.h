#pragma once

#include <rewatch/log.h>
#include <rewatch/state_dir.h>

#include <cstdlib>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace rewatch {

struct config_t {
  std::filesystem::path state_root = std::filesystem::current_path() / "var";
  log::level_t log_level = log::level_t::info;

  using lookup_t = std::function<std::optional<std::string>(const char *)>;

  static std::optional<std::string> getenv(const char *name) {
    if (auto value = std::getenv(name))
      return value;
    return std::nullopt;
  }

  /// Reads REWATCH_STATE_DIR and REWATCH_LOG_LEVEL; unset variables keep
  /// their defaults.
  static config_t from_env(const lookup_t &lookup = getenv) {
    auto config = config_t{};

    if (auto root = lookup("REWATCH_STATE_DIR"); root and not root->empty())
      config.state_root = *root;

    if (auto name = lookup("REWATCH_LOG_LEVEL"); name and not name->empty()) {
      auto level = log::parse_level(*name);
      if (not level)
        throw std::invalid_argument{"REWATCH_LOG_LEVEL: unknown level '" +
                                    *name + "'"};
      config.log_level = *level;
    }

    return config;
  }

  void apply() const { log::threshold = log_level; }

  auto state_dir() const { return state_dir_t{state_root}; }
};

} // namespace rewatch
