#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace vg::core {

enum class errc : std::uint16_t {
  ok = 0U,
  invalid_argument,
  contract_violation,
  invalid_state,
  not_bound,
  already_bound,
  timeout,
  queue_full,
  not_found,
  type_mismatch,
  incompatible_checker,
  transaction_failed,
  test_failure,
  not_supported,
  internal_error,
};

enum class error_kind : std::uint8_t {
  success,
  usage,
  lookup,
  type,
  resource,
  timeout,
  check,
  verdict,
  internal,
};

[[nodiscard]] constexpr auto classify(const errc code) noexcept -> error_kind {
  switch (code) {
  case errc::ok:
    return error_kind::success;
  case errc::invalid_argument:
  case errc::contract_violation:
  case errc::invalid_state:
  case errc::not_bound:
  case errc::already_bound:
    return error_kind::usage;
  case errc::not_found:
    return error_kind::lookup;
  case errc::type_mismatch:
  case errc::incompatible_checker:
  case errc::not_supported:
    return error_kind::type;
  case errc::queue_full:
    return error_kind::resource;
  case errc::timeout:
    return error_kind::timeout;
  case errc::transaction_failed:
    return error_kind::check;
  case errc::test_failure:
    return error_kind::verdict;
  case errc::internal_error:
    return error_kind::internal;
  }

  return error_kind::internal;
}

[[nodiscard]] constexpr auto to_string(const errc code) noexcept
    -> std::string_view {
  switch (code) {
  case errc::ok:
    return "ok";
  case errc::invalid_argument:
    return "invalid_argument";
  case errc::contract_violation:
    return "contract_violation";
  case errc::invalid_state:
    return "invalid_state";
  case errc::not_bound:
    return "not_bound";
  case errc::already_bound:
    return "already_bound";
  case errc::timeout:
    return "timeout";
  case errc::queue_full:
    return "queue_full";
  case errc::not_found:
    return "not_found";
  case errc::type_mismatch:
    return "type_mismatch";
  case errc::incompatible_checker:
    return "incompatible_checker";
  case errc::transaction_failed:
    return "transaction_failed";
  case errc::test_failure:
    return "test_failure";
  case errc::not_supported:
    return "not_supported";
  case errc::internal_error:
    return "internal_error";
  }

  return "unknown";
}

template <typename char_t, typename traits_t>
auto operator<<(std::basic_ostream<char_t, traits_t> &stream, const errc code)
    -> std::basic_ostream<char_t, traits_t> & {
  stream << to_string(code);
  return stream;
}

namespace detail {

[[nodiscard]] constexpr auto is_known_errc_value(const int value) noexcept
    -> bool {
  return value >= static_cast<int>(errc::ok) &&
         value <= static_cast<int>(errc::internal_error);
}

} // namespace detail

class error_code {
public:
  constexpr error_code() noexcept = default;
  constexpr error_code(const errc code) noexcept : code_(code) {}

  [[nodiscard]] constexpr auto code() const noexcept -> errc { return code_; }

  [[nodiscard]] constexpr auto value() const noexcept -> int {
    return static_cast<int>(static_cast<std::uint16_t>(code_));
  }

  [[nodiscard]] constexpr auto kind() const noexcept -> error_kind {
    return detail::is_known_errc_value(value()) ? classify(code_)
                                                : error_kind::internal;
  }

  [[nodiscard]] constexpr auto failed() const noexcept -> bool {
    return code_ != errc::ok;
  }

  [[nodiscard]] constexpr explicit operator bool() const noexcept {
    return failed();
  }

  [[nodiscard]] auto message() const -> std::string {
    return std::string{vg::core::to_string(code_)};
  }

  [[nodiscard]] friend constexpr auto operator==(const error_code &lhs,
                                                 const error_code &rhs) noexcept
      -> bool {
    return lhs.code_ == rhs.code_;
  }

  [[nodiscard]] friend constexpr auto operator==(const error_code &lhs,
                                                 const errc rhs) noexcept
      -> bool {
    return lhs.code_ == rhs;
  }

private:
  errc code_{errc::ok};
};

[[nodiscard]] constexpr auto make_error(const errc value) noexcept
    -> error_code {
  return error_code{value};
}

[[nodiscard]] constexpr auto classify(const error_code code) noexcept
    -> error_kind {
  return code.kind();
}

[[nodiscard]] constexpr auto is_timeout(const error_code code) noexcept
    -> bool {
  return code == errc::timeout;
}

// True for the in-attempt abort signal raised by a failed transactional check.
[[nodiscard]] constexpr auto is_check_failure(const error_code code) noexcept
    -> bool {
  return classify(code) == error_kind::check;
}

// True for programming errors that must surface immediately and never retry.
[[nodiscard]] constexpr auto is_usage_error(const error_code code) noexcept
    -> bool {
  const auto kind = classify(code);
  return kind == error_kind::usage || kind == error_kind::lookup ||
         kind == error_kind::type;
}

template <typename char_t, typename traits_t>
auto operator<<(std::basic_ostream<char_t, traits_t> &stream,
                const error_code code)
    -> std::basic_ostream<char_t, traits_t> & {
  stream << to_string(code.code());
  return stream;
}

} // namespace vg::core

namespace std {

template <> struct hash<vg::core::error_code> {
  [[nodiscard]] auto operator()(const vg::core::error_code code) const noexcept
      -> std::size_t {
    return static_cast<std::size_t>(code.value());
  }
};

} // namespace std
