#pragma once

#include <rewatch/input.h>

#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace rewatch {

using refresh_t = std::function<void()>;
using unwatch_t = std::function<task<void>()>;

/// Turns an external resource into a cached, shared input.
///
/// However many consumers hold a watch on it, a monitor has at most one
/// background task, which installs the resource's change notification
/// (`watch`), reads the resource whenever it is notified (`read`), and
/// uninstalls the notification once the last watch has been released.
template <typename T> class monitor {
public:
  using read_t = std::function<task<output<T>>()>;
  using install_t = std::function<task<unwatch_t>(refresh_t)>;

  struct state_t {
    read_t read;
    install_t watch;
    std::string description;

    output<T> value = pending;
    int ref_count = 0;
    bool need_refresh = true;
    bool active = false;
    condition internal; // maybe time to leave the idle state
    condition external; // new value available for consumers
  };

  std::shared_ptr<state_t> state;

private:
  class watch final : public watch_t {
    std::shared_ptr<state_t> state;
    future next;
    bool released = false;

  public:
    watch(std::shared_ptr<state_t> s, future f)
        : state{std::move(s)}, next{std::move(f)} {}

    std::string describe() const override { return state->description; }

    future changed() override { return next; }

    void release() override {
      REWATCH_ASSERT(not released);
      released = true;

      REWATCH_ASSERT(state->ref_count > 0);
      if (--state->ref_count == 0)
        state->internal.broadcast();
    }
  };

  // Safe to call from any thread, at any time: once the monitor or its
  // scheduler is gone it does nothing.
  static refresh_t make_refresh(const std::shared_ptr<state_t> &t) {
    return [mailbox = scheduler::current().mailbox(),
            weak = std::weak_ptr{t}] {
      auto loop = mailbox.lock();
      if (not loop)
        return;

      auto mark_stale = [weak] {
        if (auto t = weak.lock()) {
          t->need_refresh = true;
          t->internal.broadcast();
        }
      };

      if (loop->on_owner_thread())
        mark_stale();
      else
        loop->post(mark_stale);
    };
  }

  // Leaves the state inactive however the task ends, including when its
  // frame is destroyed along with the scheduler.
  struct deactivate_on_exit {
    state_t &t;

    ~deactivate_on_exit() {
      t.active = false;

      // Don't serve the old value if we get activated again: it could be
      // quite stale by then.
      t.value = pending;
    }
  };

  static task<void> run(std::shared_ptr<state_t> t) {
    auto deactivate = deactivate_on_exit{*t};

    for (;;) {
      log::debug("{}: installing", t->description);
      auto unwatch = co_await t->watch(make_refresh(t));

      while (t->ref_count > 0) {
        t->need_refresh = false;
        log::debug("{}: reading", t->description);
        t->value = co_await t->read();
        t->external.broadcast();

        while (t->ref_count > 0 and not t->need_refresh)
          co_await t->internal.wait();
      }

      log::debug("{}: uninstalling", t->description);
      co_await unwatch();

      // Somebody subscribed again while we were uninstalling.
      if (t->ref_count > 0)
        continue;

      REWATCH_ASSERT(t->active);
      co_return;
    }
  }

public:
  monitor(read_t read, install_t watch, std::string description)
      : state{std::make_shared<state_t>(std::move(read), std::move(watch),
                                        std::move(description))} {}

  snapshot_t<T> get() const {
    ++state->ref_count;
    if (not state->active) {
      state->active = true;
      scheduler::current().spawn(run(state));
    } // else the running task checks ref_count before it exits

    auto w = std::make_shared<watch>(state, state->external.wait());
    return {state->value, {std::move(w)}};
  }
};

} // namespace rewatch
