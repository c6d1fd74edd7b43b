#pragma once

#include <rewatch/output.h>
#include <rewatch/scheduler.h>

#include <concepts>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace rewatch {

/// Handle on one observation of an input.
struct watch_t {
  virtual ~watch_t() = default;

  virtual std::string describe() const = 0;

  /// Resolves once, the first time the observed value may have changed.
  /// Repeated calls return the same future. Keep the watch alive while
  /// waiting: dropping it may abandon the wait.
  virtual future changed() = 0;

  /// Empty if the wait cannot be aborted proactively.
  virtual std::function<void()> cancel() const { return {}; }

  /// Must be called exactly once, when the consumer is done with the watch.
  virtual void release() = 0;
};

using watch_ptr = std::shared_ptr<watch_t>;
using watches_t = std::vector<watch_ptr>;

template <typename T> struct snapshot_t {
  output<T> value;
  watches_t watches;
};

template <typename> constexpr auto is_snapshot = false;

template <typename T> constexpr auto is_snapshot<snapshot_t<T>> = true;

template <typename I>
concept watchable = requires(const I &i) {
  requires is_snapshot<std::remove_cvref_t<decltype(i.get())>>;
};

template <watchable I>
using snapshot_of_t =
    std::remove_cvref_t<decltype(std::declval<const I &>().get())>;

template <typename> constexpr auto is_output = false;

template <typename T> constexpr auto is_output<output<T>> = true;

/// Type-erased watchable computation.
template <typename T> class input {
  std::function<snapshot_t<T>()> f;

  struct from_fn_t {};

  input(from_fn_t, std::function<snapshot_t<T>()> fn) : f{std::move(fn)} {}

public:
  template <watchable I>
    requires(not std::same_as<std::remove_cvref_t<I>, input> and
             std::same_as<snapshot_of_t<I>, snapshot_t<T>>)
  explicit(false) input(I i) : f{[i = std::move(i)] { return i.get(); }} {}

  static auto of_fn(std::invocable auto fn) {
    return input{from_fn_t{}, std::move(fn)};
  }

  snapshot_t<T> get() const { return f(); }
};

/// Runs an evaluation function, handing it a `get` that records the watches
/// of every input it consults.
template <typename F> auto execute(F &evaluate) {
  auto watches = watches_t{};

  auto get = [&watches](const watchable auto &in) {
    auto snapshot = in.get();
    watches.insert(watches.end(),
                   std::make_move_iterator(snapshot.watches.begin()),
                   std::make_move_iterator(snapshot.watches.end()));
    return std::move(snapshot.value);
  };

  using result_t =
      std::remove_cvref_t<std::invoke_result_t<F &, decltype(get) &>>;

  if constexpr (is_output<result_t>) {
    auto result = evaluate(get);
    return snapshot_t<typename result_t::value_type>{std::move(result),
                                                     std::move(watches)};
  } else {
    auto result = output<result_t>{evaluate(get)};
    return snapshot_t<result_t>{std::move(result), std::move(watches)};
  }
}

} // namespace rewatch
