#pragma once

#include <rewatch/input.h>
#include <rewatch/log.h>
#include <rewatch/scheduler.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <string>
#include <utility>
#include <vector>

namespace rewatch {

inline auto describe(const watches_t &watches) {
  auto names = std::vector<std::string>{};
  names.reserve(watches.size());
  for (auto &w : watches)
    names.push_back(w->describe());

  return fmt::format("[{}]", fmt::join(names, "; "));
}

inline constexpr auto default_trace = [](const auto &result,
                                         const watches_t &watches) {
  log::info("Evaluation complete:\n  Result: {}\n  Watching: {}", result,
            describe(watches));
};

namespace engine {

/// Evaluates `evaluate` forever, re-running it whenever one of the inputs it
/// consulted may have changed.
///
/// `evaluate` is called with a `get` function for reading inputs. Anything it
/// throws propagates out of the returned task.
template <typename F, typename Trace = decltype(default_trace)>
task<void> run(F evaluate, Trace trace = default_trace) {
  auto old_watches = watches_t{};

  for (;;) {
    log::info("Evaluating...");
    auto snapshot = execute(evaluate);

    // Only now, so that inputs still in use stay subscribed.
    for (auto &w : old_watches)
      w->release();

    trace(snapshot.value, snapshot.watches);

    log::info("Waiting for inputs to change...");
    auto changes = std::vector<future>{};
    changes.reserve(snapshot.watches.size());
    for (auto &w : snapshot.watches)
      changes.push_back(w->changed());

    co_await first_of(changes);

    old_watches = std::move(snapshot.watches);
  }
}

} // namespace engine

} // namespace rewatch
