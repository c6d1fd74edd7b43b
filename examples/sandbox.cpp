#include <rewatch/rewatch.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>

using namespace rewatch;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

// Polls the file's modification time; the contents are the value.
auto watch_file(fs::path path) {
  auto read = [path]() -> task<output<std::string>> {
    auto in = std::ifstream{path};
    if (not in)
      co_return error(path.string() + ": cannot open");

    auto contents = std::ostringstream{};
    contents << in.rdbuf();
    co_return contents.str();
  };

  auto install = [path](refresh_t refresh) -> task<unwatch_t> {
    auto stopped = std::make_shared<bool>(false);

    scheduler::current().spawn(
        [](fs::path path, refresh_t refresh,
           std::shared_ptr<bool> stopped) -> task<void> {
          auto ec = std::error_code{};
          auto last = fs::last_write_time(path, ec);

          while (not *stopped) {
            co_await sleep_for(500ms);

            auto now = fs::last_write_time(path, ec);
            if (now != last) {
              last = now;
              refresh();
            }
          }
        }(path, std::move(refresh), stopped));

    co_return [stopped]() -> task<void> {
      *stopped = true;
      co_return;
    };
  };

  return monitor<std::string>{read, install, path.string()};
}

int main() {
  auto config = config_t::from_env();
  config.apply();

  scheduler sched;

  auto path = config.state_dir()("sandbox") / "message.txt";
  std::ofstream{path} << "hello";

  auto message = watch_file(path);
  auto shout = var<bool>{"shout", false};

  // Flip the var a couple of times, and touch the file in between.
  sched.call_at(scheduler::clock_t::now() + 1s, [shout]() mutable {
    shout.set(true);
  });
  sched.call_at(scheduler::clock_t::now() + 2s,
                [path] { std::ofstream{path} << "hello again"; });
  sched.call_at(scheduler::clock_t::now() + 3s, [shout]() mutable {
    shout.update([](const output<bool> &o) { return output<bool>{not o.value()}; });
  });

  sched.run(engine::run([=](auto get) -> output<std::string> {
    auto text = get(message);
    if (not text.is_ok())
      return text;

    if (get(shout).value())
      return text.value() + "!";
    return text.value();
  }));
}
