#pragma once

#include <any>
#include <concepts>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "vg/core/result.hpp"
#include "vg/core/type_utils.hpp"
#include "vg/oracle/type_registry.hpp"

namespace vg::oracle {

namespace detail {

template <typename value_t>
[[nodiscard]] auto describe_any(const std::any &storage) -> std::string {
  const auto &value = std::any_cast<const value_t &>(storage);
  if constexpr (std::is_same_v<value_t, bool>) {
    return value ? "true" : "false";
  } else if constexpr (std::is_convertible_v<const value_t &, std::string_view>) {
    return fmt::format("\"{}\"", std::string_view{value});
  } else if constexpr (fmt::is_formattable<value_t>::value) {
    return fmt::format("{}", value);
  } else {
    return fmt::format("<{}>", make_type_id<value_t>().short_name());
  }
}

template <typename value_t>
[[nodiscard]] auto equals_any(const std::any &lhs, const std::any &rhs)
    -> core::result<bool> {
  if constexpr (std::equality_comparable<value_t>) {
    return static_cast<bool>(std::any_cast<const value_t &>(lhs) ==
                             std::any_cast<const value_t &>(rhs));
  } else {
    return core::result<bool>::failure(core::errc::not_supported);
  }
}

struct value_operations {
  std::string (*describe)(const std::any &){nullptr};
  core::result<bool> (*equals)(const std::any &, const std::any &){nullptr};
};

// String literals and character pointers are stored as std::string.
template <typename value_t>
using boxed_type_t = std::conditional_t<
    std::is_same_v<std::decay_t<value_t>, const char *> ||
        std::is_same_v<std::decay_t<value_t>, char *>,
    std::string, core::remove_cvref_t<value_t>>;

template <typename value_t>
inline constexpr value_operations value_operations_for{
    &describe_any<value_t>,
    &equals_any<value_t>,
};

} // namespace detail

// Immutable, type-tagged value carried by observations. A default
// constructed box is empty and stands for a null argument.
class boxed_value {
public:
  boxed_value() = default;

  template <typename value_t>
  [[nodiscard]] static auto of(value_t &&value) -> boxed_value {
    using stored_t = detail::boxed_type_t<value_t>;
    boxed_value boxed;
    boxed.storage_.template emplace<stored_t>(std::forward<value_t>(value));
    boxed.type_ = make_type_id<stored_t>();
    boxed.operations_ = &detail::value_operations_for<stored_t>;
    return boxed;
  }

  [[nodiscard]] auto empty() const noexcept -> bool {
    return operations_ == nullptr;
  }

  [[nodiscard]] auto type() const noexcept -> type_id { return type_; }

  template <typename value_t>
  [[nodiscard]] auto get_if() const noexcept -> const value_t * {
    return std::any_cast<value_t>(&storage_);
  }

  template <typename value_t>
  [[nodiscard]] auto as() const
      -> core::result<std::reference_wrapper<const value_t>> {
    const auto *value = get_if<value_t>();
    if (value == nullptr) {
      return core::errc::type_mismatch;
    }
    return std::cref(*value);
  }

  [[nodiscard]] auto describe() const -> std::string {
    if (empty()) {
      return "null";
    }
    return operations_->describe(storage_);
  }

  [[nodiscard]] auto equals(const boxed_value &other) const
      -> core::result<bool> {
    if (empty() || other.empty()) {
      return empty() == other.empty();
    }
    if (type_ != other.type_) {
      return core::result<bool>::failure(core::errc::not_supported);
    }
    return operations_->equals(storage_, other.storage_);
  }

private:
  std::any storage_{};
  type_id type_{};
  const detail::value_operations *operations_{nullptr};
};

// The untyped actual-argument array handed to array-convention checkers.
using argument_list = std::vector<boxed_value>;

template <typename... values_t>
[[nodiscard]] auto make_arguments(values_t &&...values) -> argument_list {
  argument_list arguments;
  arguments.reserve(sizeof...(values_t));
  (arguments.push_back(boxed_value::of(std::forward<values_t>(values))), ...);
  return arguments;
}

[[nodiscard]] inline auto describe(const argument_list &arguments)
    -> std::string {
  std::string text;
  for (std::size_t index = 0U; index < arguments.size(); ++index) {
    if (index != 0U) {
      text += ", ";
    }
    text += arguments[index].describe();
  }
  return text;
}

// Structural equality of two observed values. Values of different types
// cannot be compared.
[[nodiscard]] inline auto equality(const boxed_value &lhs,
                                   const boxed_value &rhs)
    -> core::result<bool> {
  return lhs.equals(rhs);
}

// Non-owning reference to the instance an event or method belongs to. The
// test owns the instance and keeps it alive while observations refer to it.
// Checkers get the instance back mutable, so only mutable objects are taken.
class instance_handle {
public:
  instance_handle() = default;

  template <typename object_t>
    requires(!std::is_const_v<object_t>)
  [[nodiscard]] static auto of(object_t &object) noexcept -> instance_handle {
    instance_handle handle;
    handle.address_ = static_cast<void *>(std::addressof(object));
    handle.type_ = make_type_id<object_t>();
    return handle;
  }

  [[nodiscard]] auto empty() const noexcept -> bool {
    return address_ == nullptr;
  }

  [[nodiscard]] explicit operator bool() const noexcept { return !empty(); }

  [[nodiscard]] auto address() const noexcept -> const void * {
    return address_;
  }

  [[nodiscard]] auto type() const noexcept -> type_id { return type_; }

  template <typename object_t>
  [[nodiscard]] auto as() const
      -> core::result<std::reference_wrapper<object_t>> {
    if (empty() || type_ != make_type_id<object_t>()) {
      return core::errc::type_mismatch;
    }
    return std::ref(*static_cast<object_t *>(address_));
  }

  [[nodiscard]] auto describe() const -> std::string {
    if (empty()) {
      return "none";
    }
    return fmt::format("{}@{}", type_.short_name(), address_);
  }

  [[nodiscard]] friend auto operator==(const instance_handle &lhs,
                                       const instance_handle &rhs) noexcept
      -> bool {
    return lhs.address_ == rhs.address_ && lhs.type_ == rhs.type_;
  }

private:
  void *address_{nullptr};
  type_id type_{};
};

} // namespace vg::oracle
