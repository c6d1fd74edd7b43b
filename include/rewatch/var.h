#pragma once

#include <rewatch/input.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace rewatch {

/// Mutable cell that can be used as an input. Copies refer to the same cell.
///
/// Writers are not synchronized against each other; concurrent set()/update()
/// calls must be serialized by the caller.
template <typename T, typename Equal = std::equal_to<T>> class var {
public:
  struct state_t {
    std::string name;
    output<T> current;
    condition cond;
  };

  std::shared_ptr<state_t> state;

private:
  class watch final : public watch_t {
    std::shared_ptr<state_t> state;
    output<T> seen;
    promise done;

    // Declared last: its frame refers to the members above.
    std::optional<task<void>> waiter;

    task<void> wait_for_change() {
      // Writers broadcast on every set(), so wakeups with an equal value are
      // expected and simply waited out.
      while (equal(state->current, seen, Equal{}))
        co_await state->cond.wait();

      done.set();
    }

  public:
    watch(std::shared_ptr<state_t> s, output<T> v)
        : state{std::move(s)}, seen{std::move(v)} {}

    std::string describe() const override { return state->name; }

    future changed() override {
      if (not waiter) {
        waiter.emplace(wait_for_change());
        waiter->start();
      }
      return done.get_future();
    }

    void release() override {}
  };

public:
  var(std::string name, output<T> initial)
      : state{std::make_shared<state_t>(std::move(name), std::move(initial))} {
  }

  const std::string &name() const { return state->name; }
  const output<T> &current() const { return state->current; }

  snapshot_t<T> get() const {
    return {state->current,
            {std::make_shared<watch>(state, state->current)}};
  }

  void set(output<T> value) {
    state->current = std::move(value);
    state->cond.broadcast();
  }

  template <std::invocable<const output<T> &> F> void update(F f) {
    set(f(state->current));
  }
};

} // namespace rewatch
