#include "common.h"

#include <fmt/format.h>

using rewatch::pending;

static suite<"output"> _ = [] {
  "states"_test = [] {
    auto p = output<int>{};
    expect(p.is_pending());
    expect(not p.is_ok());
    expect(not p.is_error());

    auto ok = output<int>{42};
    expect(ok.is_ok());
    expect(ok.value() == 42_i);

    auto failed = output<int>{rewatch::error("boom")};
    expect(failed.is_error());
    expect(that % failed.message() == "boom"s);

    expect(throws([&] { [[maybe_unused]] auto &v = failed.value(); }))
        << "an error has no value";
  };

  "equality"_test = [] {
    expect(output<int>{1} == output<int>{1});
    expect(output<int>{1} != output<int>{2});
    expect(output<int>{pending} == output<int>{});
    expect(output<int>{} != output<int>{0});
    expect(output<int>{rewatch::error("x")} != output<int>{pending});
    expect(output<int>{rewatch::error("x")} != output<int>{0});
  };

  "error_equality_compares_messages"_test = [] {
    auto a = output<int>{rewatch::error("disk full")};
    auto b = output<int>{rewatch::error("disk full")};
    auto c = output<int>{rewatch::error("permission denied")};

    expect(a == b) << "the same diagnostic is not a change";
    expect(a != c) << "a new diagnostic is a change";
  };

  "custom_equality"_test = [] {
    auto same_parity = [](int lhs, int rhs) { return lhs % 2 == rhs % 2; };

    expect(equal(output<int>{1}, output<int>{3}, same_parity));
    expect(not equal(output<int>{1}, output<int>{2}, same_parity));
    expect(equal(output<int>{}, output<int>{}, same_parity));
  };

  "formatting"_test = [] {
    struct opaque {};

    expect(that % fmt::format("{}", output<int>{42}) == "Ok: 42"s);
    expect(that % fmt::format("{}", output<int>{}) == "(pending)"s);
    expect(that % fmt::format("{}", output<int>{rewatch::error("boom")}) ==
           "FAILED: boom"s);
    expect(that % fmt::format("{}", output<opaque>{opaque{}}) == "Ok"s);
  };
};

int main() {}
