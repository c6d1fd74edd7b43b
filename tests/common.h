#pragma once

#include <rewatch/rewatch.h>

#include <boost/ut.hpp>

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace boost::ut;
using namespace std::string_literals;

using rewatch::future;
using rewatch::output;
using rewatch::promise;
using rewatch::scheduler;
using rewatch::task;
using rewatch::unwatch_t;
using rewatch::var;

#define CONCAT2(a, b) a##b
#define CONCAT(a, b) CONCAT2(a, b)
#define _ CONCAT(placeholder_, __LINE__)

// Instrumented resource driver for monitors.
struct driver_t {
  int watches = 0;
  int unwatches = 0;
  int live = 0;
  int max_live = 0;
  int reads = 0;

  // Results handed out by successive reads; once exhausted, reads return the
  // read count.
  std::vector<output<int>> results;

  // If set, the next read (or unwatch) waits for it.
  std::optional<future> read_gate;
  std::optional<future> unwatch_gate;

  rewatch::refresh_t refresh;

  void refresh_now() const { refresh(); }
};

inline auto make_monitor(std::shared_ptr<driver_t> d,
                         std::string description = "counter") {
  return rewatch::monitor<int>{
      [d]() -> task<output<int>> {
        ++d->reads;
        if (auto gate = std::exchange(d->read_gate, std::nullopt))
          co_await *gate;

        if (d->reads <= int(d->results.size()))
          co_return d->results[d->reads - 1];
        co_return output<int>{d->reads};
      },
      [d](rewatch::refresh_t refresh) -> task<unwatch_t> {
        ++d->watches;
        d->max_live = std::max(d->max_live, ++d->live);
        d->refresh = std::move(refresh);

        co_return [d]() -> task<void> {
          ++d->unwatches;
          if (auto gate = std::exchange(d->unwatch_gate, std::nullopt))
            co_await *gate;
          --d->live;
        };
      },
      std::move(description)};
}

// Captures log lines for the duration of a test.
struct log_capture {
  std::vector<std::string> lines;
  rewatch::log::sink_t previous_sink;
  rewatch::log::level_t previous_threshold;

  log_capture()
      : previous_sink{std::exchange(
            rewatch::log::sink,
            [this](auto, std::string_view line) { lines.emplace_back(line); })},
        previous_threshold{rewatch::log::threshold} {}

  log_capture(const log_capture &) = delete;

  ~log_capture() {
    rewatch::log::sink = std::move(previous_sink);
    rewatch::log::threshold = previous_threshold;
  }
};
