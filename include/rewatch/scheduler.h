#pragma once

#include <rewatch/log.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <deque>
#include <exception>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace rewatch {

template <typename T = void> class task;

namespace detail {

// The part of a scheduler that other threads, and callbacks that may outlive
// the scheduler, are allowed to reach.
struct mailbox {
  const std::thread::id owner = std::this_thread::get_id();

  std::mutex mutex;
  std::condition_variable wakeup;
  std::deque<std::function<void()>> posted;

  auto on_owner_thread() const { return std::this_thread::get_id() == owner; }

  void post(std::function<void()> work) {
    {
      auto lock = std::lock_guard{mutex};
      posted.push_back(std::move(work));
    }
    wakeup.notify_one();
  }
};

struct future_state {
  bool ready = false;
  std::vector<std::function<void()>> callbacks;

  void on_ready(std::function<void()> callback) {
    if (ready) {
      callback();
      return;
    }
    callbacks.push_back(std::move(callback));
  }

  void fulfill() {
    REWATCH_ASSERT(not ready);
    ready = true;

    // copy, because a callback might register new ones
    auto pending_callbacks = std::exchange(callbacks, {});
    for (auto &callback : pending_callbacks)
      callback();
  }
};

struct final_awaiter {
  bool await_ready() const noexcept { return false; }

  template <typename Promise>
  std::coroutine_handle<>
  await_suspend(std::coroutine_handle<Promise> h) const noexcept {
    if (auto continuation = h.promise().continuation)
      return continuation;
    return std::noop_coroutine();
  }

  void await_resume() const noexcept {}
};

struct promise_base {
  std::coroutine_handle<> continuation;
  std::exception_ptr error;

  std::suspend_always initial_suspend() const noexcept { return {}; }
  final_awaiter final_suspend() const noexcept { return {}; }
  void unhandled_exception() noexcept { error = std::current_exception(); }

  void rethrow_if_failed() const {
    if (error)
      std::rethrow_exception(error);
  }
};

template <typename T> struct task_promise : promise_base {
  std::optional<T> value;

  task<T> get_return_object();

  void return_value(T v) { value.emplace(std::move(v)); }

  T result() {
    rethrow_if_failed();
    return std::move(*value);
  }
};

template <> struct task_promise<void> : promise_base {
  task<void> get_return_object();

  void return_void() const noexcept {}

  void result() const { rethrow_if_failed(); }
};

} // namespace detail

/// Lazily started coroutine. Awaiting it starts it and resumes the awaiter
/// when it finishes, rethrowing anything it threw.
template <typename T> class [[nodiscard]] task {
public:
  using promise_type = detail::task_promise<T>;
  using handle_t = std::coroutine_handle<promise_type>;

private:
  handle_t handle;

  void destroy() {
    if (handle)
      std::exchange(handle, {}).destroy();
  }

public:
  task() = default;
  explicit task(handle_t h) : handle{h} {}

  task(const task &) = delete;
  task &operator=(const task &) = delete;

  task(task &&other) noexcept : handle{std::exchange(other.handle, {})} {}
  task &operator=(task &&other) noexcept {
    if (this != &other) {
      destroy();
      handle = std::exchange(other.handle, {});
    }
    return *this;
  }

  // Destroying a suspended task destroys its frame; whatever it was waiting
  // for will not resume it.
  ~task() { destroy(); }

  auto valid() const { return static_cast<bool>(handle); }
  auto done() const { return handle and handle.done(); }

  /// Runs the task until its first suspension point, without an awaiter.
  void start() {
    REWATCH_ASSERT(handle and not handle.done());
    handle.resume();
  }

  /// Only meaningful once done(); rethrows the task's exception.
  decltype(auto) result() {
    REWATCH_ASSERT(done());
    return handle.promise().result();
  }

  auto operator co_await() const noexcept {
    struct awaiter {
      handle_t h;

      bool await_ready() const noexcept { return h.done(); }

      std::coroutine_handle<>
      await_suspend(std::coroutine_handle<> awaiting) const noexcept {
        h.promise().continuation = awaiting;
        return h;
      }

      decltype(auto) await_resume() const { return h.promise().result(); }
    };

    REWATCH_ASSERT(handle);
    return awaiter{handle};
  }
};

template <typename T> task<T> detail::task_promise<T>::get_return_object() {
  return task<T>{std::coroutine_handle<task_promise>::from_promise(*this)};
}

inline task<void> detail::task_promise<void>::get_return_object() {
  return task<void>{std::coroutine_handle<task_promise>::from_promise(*this)};
}

/// Single-threaded cooperative event loop.
///
/// Constructing a scheduler makes it the current one for the constructing
/// thread, until it is destroyed. Everything except post() must be called
/// from that thread.
class scheduler {
public:
  using clock_t = std::chrono::steady_clock;

private:
  static inline thread_local scheduler *current_ = nullptr;

  scheduler *previous;
  std::shared_ptr<detail::mailbox> box = std::make_shared<detail::mailbox>();

  std::deque<std::function<void()>> ready;
  std::multimap<clock_t::time_point, std::function<void()>> timers;
  std::list<task<void>> detached;

  void take_posted() {
    auto lock = std::lock_guard{box->mutex};
    for (auto &work : box->posted)
      ready.push_back(std::move(work));
    box->posted.clear();
  }

  void take_due_timers() {
    const auto now = clock_t::now();
    while (not timers.empty() and timers.begin()->first <= now) {
      ready.push_back(std::move(timers.begin()->second));
      timers.erase(timers.begin());
    }
  }

  // Detached tasks have no awaiter, so their failures are raised here.
  void reap() {
    for (auto it = detached.begin(); it != detached.end();) {
      if (not it->done()) {
        ++it;
        continue;
      }

      auto finished = std::move(*it);
      it = detached.erase(it);
      finished.result();
    }
  }

  void wait_for_work() {
    auto lock = std::unique_lock{box->mutex};
    auto has_posts = [this] { return not box->posted.empty(); };
    if (has_posts())
      return;

    if (timers.empty())
      box->wakeup.wait(lock, has_posts);
    else
      box->wakeup.wait_until(lock, timers.begin()->first, has_posts);
  }

public:
  scheduler() : previous{std::exchange(current_, this)} {}

  scheduler(const scheduler &) = delete;
  scheduler &operator=(const scheduler &) = delete;

  ~scheduler() {
    detached.clear();
    current_ = previous;
  }

  static scheduler &current() {
    REWATCH_ASSERT(current_ != nullptr);
    return *current_;
  }

  auto on_loop_thread() const { return box->on_owner_thread(); }

  /// For callbacks that may outlive the scheduler: expires with it. Work
  /// posted to the mailbox runs on the next poll().
  std::weak_ptr<detail::mailbox> mailbox() const { return box; }

  /// Queues work for the next poll().
  void schedule(std::function<void()> work) { ready.push_back(std::move(work)); }

  /// Thread-safe version of schedule().
  void post(std::function<void()> work) { box->post(std::move(work)); }

  void call_at(clock_t::time_point deadline, std::function<void()> work) {
    timers.emplace(deadline, std::move(work));
  }

  /// Starts the task immediately and keeps it alive until it finishes.
  void spawn(task<void> t) {
    auto &entry = detached.emplace_back(std::move(t));
    entry.start();
  }

  auto detached_count() const { return detached.size(); }

  /// Runs everything that is ready right now. Returns false if there was
  /// nothing to do.
  bool poll() {
    take_posted();
    take_due_timers();

    if (ready.empty()) {
      reap();
      return false;
    }

    auto batch = std::exchange(ready, {});
    for (auto &work : batch)
      work();

    reap();
    return true;
  }

  void run_until_idle() {
    while (poll()) {
    }
  }

  template <typename T> T run(task<T> t) {
    t.start();
    while (not t.done()) {
      if (not poll())
        wait_for_work();
    }
    return t.result();
  }
};

class future;
inline future first_of(const std::vector<future> &futures);

/// One-shot notification that any number of coroutines can await.
class future {
  std::shared_ptr<detail::future_state> state;

  friend class promise;
  friend class condition;
  friend future first_of(const std::vector<future> &);

  explicit future(std::shared_ptr<detail::future_state> s)
      : state{std::move(s)} {}

public:
  auto ready() const { return state->ready; }

  /// Invokes the callback once the future resolves (immediately if it
  /// already has).
  void on_ready(std::function<void()> callback) const {
    state->on_ready(std::move(callback));
  }

  auto operator co_await() const {
    struct awaiter {
      std::shared_ptr<detail::future_state> state;
      std::shared_ptr<bool> alive = std::make_shared<bool>(true);

      bool await_ready() const noexcept { return state->ready; }

      void await_suspend(std::coroutine_handle<> h) const {
        auto *sched = &scheduler::current();
        state->on_ready([sched, h, alive = std::weak_ptr{alive}] {
          sched->schedule([h, alive] {
            // The awaiting frame may have been destroyed in the meantime.
            if (not alive.expired())
              h.resume();
          });
        });
      }

      void await_resume() const noexcept {}
    };

    return awaiter{state};
  }
};

class promise {
  std::shared_ptr<detail::future_state> state =
      std::make_shared<detail::future_state>();

public:
  future get_future() const { return future{state}; }
  auto is_set() const { return state->ready; }
  void set() const { state->fulfill(); }
};

/// Waiters are registered when wait() is called, not when the returned
/// future is awaited. Waiters that nobody references any more are dropped.
class condition {
  std::vector<std::weak_ptr<detail::future_state>> waiters;

public:
  [[nodiscard]] future wait() {
    std::erase_if(waiters, [](auto &w) { return w.expired(); });

    auto state = std::make_shared<detail::future_state>();
    waiters.push_back(state);
    return future{std::move(state)};
  }

  void broadcast() {
    auto woken = std::exchange(waiters, {});
    for (auto &waiter : woken) {
      if (auto state = waiter.lock())
        state->fulfill();
    }
  }

  auto waiting() const {
    return std::ranges::count_if(waiters,
                                 [](auto &w) { return not w.expired(); });
  }
};

/// Resolves as soon as any of the futures does. The others are left alone;
/// they do not keep the result alive.
inline future first_of(const std::vector<future> &futures) {
  if (futures.empty())
    throw std::invalid_argument{
        "first_of: an empty list of futures would never resolve"};

  auto combined = std::make_shared<detail::future_state>();
  for (auto &f : futures) {
    f.on_ready([weak = std::weak_ptr{combined}] {
      if (auto state = weak.lock(); state and not state->ready)
        state->fulfill();
    });
  }

  return future{std::move(combined)};
}

inline future sleep_until(scheduler::clock_t::time_point deadline) {
  auto p = promise{};
  scheduler::current().call_at(deadline, [p] { p.set(); });
  return p.get_future();
}

inline future sleep_for(scheduler::clock_t::duration duration) {
  return sleep_until(scheduler::clock_t::now() + duration);
}

} // namespace rewatch
