#pragma once

#include <concepts>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include <fmt/format.h>

#include "vg/core/result.hpp"
#include "vg/oracle/test_manager.hpp"
#include "vg/oracle/value.hpp"
#include "vg/oracle/variable.hpp"

namespace vg::oracle {

namespace detail {

template <typename value_t>
[[nodiscard]] auto describe_value(const value_t &value) -> std::string {
  return boxed_value::of(value).describe();
}

template <typename pointer_t>
[[nodiscard]] auto is_null(const pointer_t &pointer) -> bool {
  if constexpr (core::is_optional_v<pointer_t>) {
    return !pointer.has_value();
  } else {
    return pointer == nullptr;
  }
}

} // namespace detail

template <typename value_t>
  requires std::equality_comparable<value_t>
[[nodiscard]] auto assert_are_equal(test_manager &manager,
                                    const value_t &expected,
                                    const value_t &actual,
                                    const std::string_view context)
    -> core::result<void> {
  return manager.assert_that(
      expected == actual,
      fmt::format("expected '{}', actual '{}' ({})",
                  detail::describe_value(expected),
                  detail::describe_value(actual), context));
}

// Checks `actual` against a bound variable, or binds the variable to it.
template <typename value_t>
[[nodiscard]] auto assert_bind(test_manager &manager,
                               variable<value_t> &bound, const value_t &actual,
                               const std::string_view context)
    -> core::result<void> {
  if (!bound.is_bound()) {
    return bound.bind(actual);
  }
  auto current = bound.value();
  if (current.has_error()) {
    return current.error();
  }
  return assert_are_equal(
      manager, *current, actual,
      fmt::format("{}; expected value originates from previous binding",
                  context));
}

// Both bound: values must agree. One bound: its value is copied to the
// other. Neither bound: nothing happens.
template <typename value_t>
[[nodiscard]] auto assert_bind(test_manager &manager, variable<value_t> &lhs,
                               variable<value_t> &rhs,
                               const std::string_view context)
    -> core::result<void> {
  if (lhs.is_bound() && rhs.is_bound()) {
    auto left = lhs.value();
    auto right = rhs.value();
    if (left.has_error()) {
      return left.error();
    }
    if (right.has_error()) {
      return right.error();
    }
    return assert_are_equal(
        manager, *left, *right,
        fmt::format("{}; values originate from previous binding", context));
  }
  if (lhs.is_bound()) {
    auto left = lhs.value();
    if (left.has_error()) {
      return left.error();
    }
    return rhs.bind(*left);
  }
  if (rhs.is_bound()) {
    auto right = rhs.value();
    if (right.has_error()) {
      return right.error();
    }
    return lhs.bind(*right);
  }
  return {};
}

template <typename pointer_t>
[[nodiscard]] auto assert_not_null(test_manager &manager,
                                   const pointer_t &actual,
                                   const std::string_view context)
    -> core::result<void> {
  return manager.assert_that(
      !detail::is_null(actual),
      fmt::format("expected non-null value ({})", context));
}

} // namespace vg::oracle
