#pragma once

#include <concepts>
#include <optional>
#include <ostream>
#include <type_traits>
#include <utility>

#include "vg/core/contract.hpp"
#include "vg/core/error.hpp"
#include "vg/core/type_utils.hpp"

namespace vg::core {

namespace detail {

template <typename error_u>
concept error_like = std::convertible_to<error_u, error_code>;

} // namespace detail

// Value or error_code. Every fallible engine operation returns one; the
// engine throws nothing of its own.
template <typename value_t> class result {
public:
  using value_type = value_t;
  using error_type = error_code;

  static_assert(!std::is_reference_v<value_t>,
                "result value type cannot be a reference");

  template <typename value_u = value_t>
    requires std::convertible_to<value_u, value_t> &&
             (!detail::error_like<value_u>) &&
             (!std::same_as<remove_cvref_t<value_u>, result>)
  constexpr result(value_u &&value) noexcept(
      std::is_nothrow_constructible_v<value_t, value_u &&>)
      : value_(std::forward<value_u>(value)) {}

  // A failed result must carry a failing code.
  template <detail::error_like error_u>
    requires(!std::convertible_to<error_u, value_t>)
  constexpr result(error_u &&error) noexcept
      : error_(std::forward<error_u>(error)) {
    vg_precondition(error_.failed());
  }

  result(const result &) = default;
  result(result &&) noexcept = default;
  auto operator=(const result &) -> result & = default;
  auto operator=(result &&) noexcept -> result & = default;
  ~result() = default;

  template <typename value_u = value_t>
    requires std::constructible_from<value_t, value_u &&>
  [[nodiscard]] static constexpr auto success(value_u &&value) -> result {
    return result(value_t(std::forward<value_u>(value)));
  }

  [[nodiscard]] static constexpr auto failure(const error_code error)
      -> result {
    return result(error);
  }

  [[nodiscard]] constexpr auto has_value() const noexcept -> bool {
    return value_.has_value();
  }

  [[nodiscard]] constexpr auto has_error() const noexcept -> bool {
    return !value_.has_value();
  }

  [[nodiscard]] constexpr explicit operator bool() const noexcept {
    return has_value();
  }

  [[nodiscard]] constexpr auto value() & -> value_t & {
    vg_precondition(has_value());
    return *value_;
  }

  [[nodiscard]] constexpr auto value() const & -> const value_t & {
    vg_precondition(has_value());
    return *value_;
  }

  [[nodiscard]] constexpr auto value() && -> value_t {
    vg_precondition(has_value());
    return std::move(*value_);
  }

  [[nodiscard]] constexpr auto operator->() noexcept -> value_t * {
    return value_.has_value() ? &*value_ : nullptr;
  }

  [[nodiscard]] constexpr auto operator->() const noexcept -> const value_t * {
    return value_.has_value() ? &*value_ : nullptr;
  }

  [[nodiscard]] constexpr auto operator*() & -> value_t & { return value(); }

  [[nodiscard]] constexpr auto operator*() const & -> const value_t & {
    return value();
  }

  // errc::ok on success.
  [[nodiscard]] constexpr auto error() const noexcept -> error_code {
    return error_;
  }

  template <typename fallback_t>
    requires std::convertible_to<fallback_t, value_t>
  [[nodiscard]] constexpr auto
  value_or(fallback_t &&fallback) const & -> value_t {
    if (value_.has_value()) {
      return *value_;
    }
    return static_cast<value_t>(std::forward<fallback_t>(fallback));
  }

private:
  std::optional<value_t> value_{};
  error_code error_{};
};

template <> class result<void> {
public:
  using value_type = void;
  using error_type = error_code;

  constexpr result() noexcept = default;

  template <detail::error_like error_u>
    requires(!std::same_as<remove_cvref_t<error_u>, result>)
  constexpr result(error_u &&error) noexcept
      : error_(std::forward<error_u>(error)) {}

  [[nodiscard]] static constexpr auto success() noexcept -> result {
    return result{};
  }

  [[nodiscard]] static constexpr auto failure(const error_code error)
      -> result {
    return result(error);
  }

  [[nodiscard]] constexpr auto has_value() const noexcept -> bool {
    return !error_.failed();
  }

  [[nodiscard]] constexpr auto has_error() const noexcept -> bool {
    return error_.failed();
  }

  [[nodiscard]] constexpr explicit operator bool() const noexcept {
    return has_value();
  }

  constexpr void value() const { vg_precondition(has_value()); }

  [[nodiscard]] constexpr auto error() const noexcept -> error_code {
    return error_;
  }

private:
  error_code error_{};
};

template <typename char_t, typename traits_t, typename value_t>
auto operator<<(std::basic_ostream<char_t, traits_t> &stream,
                const result<value_t> &item)
    -> std::basic_ostream<char_t, traits_t> & {
  if (item.has_error()) {
    stream << "error:" << item.error();
  } else if constexpr (std::is_void_v<value_t>) {
    stream << "value:void";
  } else {
    stream << "value:" << *item;
  }
  return stream;
}

} // namespace vg::core
