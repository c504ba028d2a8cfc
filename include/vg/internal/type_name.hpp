#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace vg::internal {

namespace detail {

template <typename t>
[[nodiscard]] constexpr auto function_signature() noexcept
    -> std::string_view {
#if defined(__clang__) || defined(__GNUC__)
  return __PRETTY_FUNCTION__;
#elif defined(_MSC_VER)
  return __FUNCSIG__;
#else
  return {};
#endif
}

// Where the type name sits inside function_signature<t>(), measured once on a
// known type so no compiler-specific text is spelled out here.
struct signature_layout {
  std::size_t prefix{0U};
  std::size_t suffix{0U};
  bool known{false};
};

inline constexpr std::string_view known_name = "double";

[[nodiscard]] constexpr auto measure_layout() noexcept -> signature_layout {
  constexpr std::string_view sample = function_signature<double>();
  constexpr auto at = sample.find(known_name);
  if constexpr (at == std::string_view::npos) {
    return {};
  } else {
    return {at, sample.size() - at - known_name.size(), true};
  }
}

inline constexpr signature_layout layout = measure_layout();

[[nodiscard]] constexpr auto drop_keyword(std::string_view name,
                                          const std::string_view keyword)
    noexcept -> std::string_view {
  if (name.substr(0U, keyword.size()) == keyword) {
    name.remove_prefix(keyword.size());
  }
  return name;
}

} // namespace detail

// Fully qualified, cv/ref-stripped name of `t` as the compiler spells it.
template <typename t>
[[nodiscard]] constexpr auto stable_type_name() noexcept -> std::string_view {
  std::string_view name =
      detail::function_signature<std::remove_cvref_t<t>>();
  if constexpr (!detail::layout.known) {
    return name;
  } else {
    name.remove_prefix(detail::layout.prefix);
    name.remove_suffix(detail::layout.suffix);
    name = detail::drop_keyword(name, "struct ");
    name = detail::drop_keyword(name, "class ");
    return detail::drop_keyword(name, "enum ");
  }
}

// Drops the namespace qualification, keeping template arguments intact:
// "vg::oracle::demo::turnstile" -> "turnstile".
[[nodiscard]] constexpr auto short_type_name(const std::string_view qualified)
    noexcept -> std::string_view {
  std::size_t depth = 0U;
  std::size_t last_separator = std::string_view::npos;
  for (std::size_t index = 0U; index < qualified.size(); ++index) {
    const char ch = qualified[index];
    if (ch == '<') {
      ++depth;
    } else if (ch == '>' && depth > 0U) {
      --depth;
    } else if (ch == ':' && depth == 0U && index + 1U < qualified.size() &&
               qualified[index + 1U] == ':') {
      last_separator = index + 1U;
    }
  }
  if (last_separator == std::string_view::npos) {
    return qualified;
  }
  return qualified.substr(last_separator + 1U);
}

// FNV-1a over the name, so ids are stable across runs and translation units.
[[nodiscard]] constexpr auto stable_name_hash(const std::string_view value)
    noexcept -> std::uint64_t {
  std::uint64_t hash = 1469598103934665603ULL;
  for (const char ch : value) {
    hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(ch));
    hash *= 1099511628211ULL;
  }
  return hash;
}

template <typename t>
[[nodiscard]] constexpr auto stable_type_hash() noexcept -> std::uint64_t {
  return stable_name_hash(stable_type_name<t>());
}

} // namespace vg::internal
