#pragma once

#include <fmt/format.h>

#include <concepts>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace rewatch {

/// Marker for a value that has not been computed yet.
struct pending_t {
  bool operator==(const pending_t &) const = default;
};

inline constexpr auto pending = pending_t{};

struct error_t {
  std::string message;

  bool operator==(const error_t &) const = default;
};

inline auto error(std::string message) { return error_t{std::move(message)}; }

/// Tri-state result of evaluating an input: a value, an error message, or
/// pending.
template <typename T> class output {
  std::variant<pending_t, T, error_t> state;

public:
  using value_type = T;

  output() = default;
  output(pending_t) {}
  output(error_t e) : state{std::in_place_index<2>, std::move(e)} {}

  explicit(false) output(std::convertible_to<T> auto value)
    requires(not std::same_as<std::remove_cvref_t<decltype(value)>, output>)
      : state{std::in_place_index<1>, T(std::move(value))} {}

  auto is_pending() const { return state.index() == 0; }
  auto is_ok() const { return state.index() == 1; }
  auto is_error() const { return state.index() == 2; }

  /// Throws std::bad_variant_access unless is_ok().
  const T &value() const { return std::get<1>(state); }

  /// Throws std::bad_variant_access unless is_error().
  const std::string &message() const { return std::get<2>(state).message; }

  template <typename Equal = std::equal_to<T>>
  friend auto equal(const output &lhs, const output &rhs, Equal eq = {}) {
    if (lhs.state.index() != rhs.state.index())
      return false;

    if (lhs.is_ok())
      return bool(eq(lhs.value(), rhs.value()));

    // Two errors are only the same if they say the same thing, so a new
    // diagnostic counts as a change.
    if (lhs.is_error())
      return lhs.message() == rhs.message();

    return true;
  }

  friend auto operator==(const output &lhs, const output &rhs)
    requires std::equality_comparable<T>
  {
    return equal(lhs, rhs);
  }
};

} // namespace rewatch

template <typename T> struct fmt::formatter<rewatch::output<T>> {
  constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const rewatch::output<T> &o, FormatContext &ctx) const {
    if (o.is_pending())
      return fmt::format_to(ctx.out(), "(pending)");
    if (o.is_error())
      return fmt::format_to(ctx.out(), "FAILED: {}", o.message());

    if constexpr (fmt::is_formattable<T>::value)
      return fmt::format_to(ctx.out(), "Ok: {}", o.value());
    else
      return fmt::format_to(ctx.out(), "Ok");
  }
};
