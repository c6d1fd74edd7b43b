#pragma once

#include <fmt/core.h>

#include <cstdio>
#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#define FWD(x) std::forward<decltype(x)>(x)

namespace rewatch::log {

enum class level_t {
  debug,
  info,
  warning,
  error,
};

inline auto to_string(const level_t level) -> std::string_view {
  switch (level) {
  case level_t::debug:
    return "debug";
  case level_t::info:
    return "info";
  case level_t::warning:
    return "warning";
  case level_t::error:
    return "error";
  }
  return "unknown";
}

inline auto parse_level(std::string_view name) -> std::optional<level_t> {
  for (auto level :
       {level_t::debug, level_t::info, level_t::warning, level_t::error}) {
    if (to_string(level) == name)
      return level;
  }
  return std::nullopt;
}

using sink_t = std::function<void(level_t, std::string_view)>;

inline void default_sink(const level_t level, std::string_view message) {
  fmt::print(stderr, "rewatch [{}] {}\n", to_string(level), message);
}

inline auto threshold = level_t::info;
inline auto sink = sink_t{default_sink};

inline auto enabled(const level_t level) { return level >= threshold; }

template <typename... Args>
void write(const level_t level, fmt::format_string<Args...> format,
           Args &&...args) {
  if (not enabled(level) or not sink)
    return;

  sink(level, fmt::format(format, FWD(args)...));
}

template <typename... Args>
void debug(fmt::format_string<Args...> format, Args &&...args) {
  write(level_t::debug, format, FWD(args)...);
}

template <typename... Args>
void info(fmt::format_string<Args...> format, Args &&...args) {
  write(level_t::info, format, FWD(args)...);
}

template <typename... Args>
void warning(fmt::format_string<Args...> format, Args &&...args) {
  write(level_t::warning, format, FWD(args)...);
}

template <typename... Args>
void error(fmt::format_string<Args...> format, Args &&...args) {
  write(level_t::error, format, FWD(args)...);
}

} // namespace rewatch::log

namespace rewatch::detail {

[[noreturn]] inline void assertion_failed(const char *expression,
                                          const char *file, int line) {
  // Bypass the threshold: an invariant violation is always reported.
  if (log::sink)
    log::sink(log::level_t::error,
              fmt::format("assertion failed: {} ({}:{})", expression, file,
                          line));
  std::abort();
}

} // namespace rewatch::detail

// Invariant check that stays enabled in release builds.
#define REWATCH_ASSERT(expression)                                             \
  ((expression) ? (void)0                                                      \
                : ::rewatch::detail::assertion_failed(#expression, __FILE__,   \
                                                      __LINE__))
