#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include "vg/core/result.hpp"
#include "vg/core/type_utils.hpp"
#include "vg/oracle/calling_convention.hpp"
#include "vg/oracle/member.hpp"
#include "vg/oracle/type_registry.hpp"
#include "vg/oracle/value.hpp"

namespace vg::oracle {

namespace detail {

template <typename return_t>
inline constexpr bool is_checker_return_v =
    std::is_void_v<return_t> ||
    std::is_same_v<core::remove_cvref_t<return_t>, core::result<void>>;

template <typename callable_t, typename... arguments_t>
[[nodiscard]] auto call_checker(callable_t &callable, arguments_t &&...arguments)
    -> core::result<void> {
  using return_t =
      std::invoke_result_t<callable_t &, arguments_t &&...>;
  static_assert(is_checker_return_v<return_t>,
                "checkers return void or vg::core::result<void>");
  if constexpr (std::is_void_v<return_t>) {
    std::invoke(callable, std::forward<arguments_t>(arguments)...);
    return {};
  } else {
    return std::invoke(callable, std::forward<arguments_t>(arguments)...);
  }
}

template <typename... values_t, std::size_t... indexes>
[[nodiscard]] auto unpack_arguments(const argument_list &arguments,
                                    std::index_sequence<indexes...>)
    -> std::optional<std::tuple<values_t...>> {
  if (arguments.size() != sizeof...(values_t)) {
    return std::nullopt;
  }
  if (!((arguments[indexes].template get_if<values_t>() != nullptr) && ...)) {
    return std::nullopt;
  }
  return std::tuple<values_t...>{
      *arguments[indexes].template get_if<values_t>()...};
}

template <typename... values_t>
[[nodiscard]] auto unpack_arguments(const argument_list &arguments)
    -> std::optional<std::tuple<values_t...>> {
  return unpack_arguments<values_t...>(arguments,
                                       std::index_sequence_for<values_t...>{});
}

template <typename list_t> struct typed_invoker;

template <typename... parameters_t>
struct typed_invoker<core::type_list<parameters_t...>> {
  template <typename callable_t>
  [[nodiscard]] static auto direct(callable_t &callable,
                                   const argument_list &arguments)
      -> core::result<void> {
    auto values =
        unpack_arguments<core::remove_cvref_t<parameters_t>...>(arguments);
    if (!values.has_value()) {
      return core::errc::type_mismatch;
    }
    return std::apply(
        [&callable](auto &...unpacked) {
          return call_checker(callable, unpacked...);
        },
        *values);
  }
};

template <typename target_t, typename... parameters_t>
struct typed_invoker<core::type_list<target_t, parameters_t...>> {
  template <typename callable_t>
  [[nodiscard]] static auto direct(callable_t &callable,
                                   const argument_list &arguments)
      -> core::result<void> {
    auto values = unpack_arguments<core::remove_cvref_t<target_t>,
                                   core::remove_cvref_t<parameters_t>...>(
        arguments);
    if (!values.has_value()) {
      return core::errc::type_mismatch;
    }
    return std::apply(
        [&callable](auto &...unpacked) {
          return call_checker(callable, unpacked...);
        },
        *values);
  }

  template <typename callable_t>
  [[nodiscard]] static auto with_target(callable_t &callable,
                                        const instance_handle &target,
                                        const argument_list &arguments)
      -> core::result<void> {
    auto instance = target.as<core::remove_cvref_t<target_t>>();
    if (!instance.has_value()) {
      return core::errc::type_mismatch;
    }
    auto values =
        unpack_arguments<core::remove_cvref_t<parameters_t>...>(arguments);
    if (!values.has_value()) {
      return core::errc::type_mismatch;
    }
    return std::apply(
        [&callable, &instance](auto &...unpacked) {
          return call_checker(callable, instance->get(), unpacked...);
        },
        *values);
  }
};

} // namespace detail

// One alternative per usable calling convention. Each wraps the caller's
// callable behind the uniform "target + argument list" entry point.
struct parameters_direct_call {
  std::function<core::result<void>(const argument_list &)> call;
};

struct target_and_parameters_direct_call {
  std::function<core::result<void>(const instance_handle &,
                                   const argument_list &)>
      call;
};

struct parameters_array_call {
  std::function<core::result<void>(const argument_list &)> call;
};

struct target_and_parameters_array_call {
  std::function<core::result<void>(const argument_list &)> call;
};

class checker {
public:
  using alternative =
      std::variant<parameters_direct_call, target_and_parameters_direct_call,
                   parameters_array_call, target_and_parameters_array_call>;

  explicit checker(alternative call) : call_(std::move(call)) {}

  [[nodiscard]] auto convention() const noexcept -> calling_convention {
    switch (call_.index()) {
    case 0U:
      return calling_convention::parameters_direct;
    case 1U:
      return calling_convention::target_and_parameters_direct;
    case 2U:
      return calling_convention::parameters_array;
    case 3U:
      return calling_convention::target_and_parameters_array;
    default:
      return calling_convention::invalid;
    }
  }

  // Array-convention checkers that need a target see it boxed in front of
  // the actual arguments.
  [[nodiscard]] auto invoke(const instance_handle &target,
                            const argument_list &arguments) const
      -> core::result<void> {
    if (const auto *direct = std::get_if<parameters_direct_call>(&call_)) {
      return direct->call(arguments);
    }
    if (const auto *direct =
            std::get_if<target_and_parameters_direct_call>(&call_)) {
      if (target.empty()) {
        return core::errc::invalid_argument;
      }
      return direct->call(target, arguments);
    }
    if (const auto *array = std::get_if<parameters_array_call>(&call_)) {
      return array->call(arguments);
    }
    const auto &array = std::get<target_and_parameters_array_call>(call_);
    if (target.empty()) {
      return core::errc::invalid_argument;
    }
    argument_list with_target;
    with_target.reserve(arguments.size() + 1U);
    with_target.push_back(boxed_value::of(target));
    with_target.insert(with_target.end(), arguments.begin(), arguments.end());
    return array.call(with_target);
  }

private:
  alternative call_;
};

// Resolves how `callable` is called for observations of `member` and wraps
// it accordingly. Incompatible shapes are rejected here, once, instead of at
// every invocation.
template <typename callable_t>
[[nodiscard]] auto make_checker(const member_descriptor &member,
                                callable_t &&callable,
                                const type_registry &registry =
                                    type_registry::process())
    -> core::result<checker> {
  using stored_t = std::decay_t<callable_t>;
  using parameters_t = core::function_argument_types_t<stored_t>;
  using invoker_t = detail::typed_invoker<parameters_t>;

  constexpr bool takes_argument_array = [] {
    if constexpr (core::type_list_size_v<parameters_t> == 1U) {
      return detail::is_argument_array_v<core::type_list_at_t<0U, parameters_t>>;
    } else {
      return false;
    }
  }();

  const auto convention =
      resolve_calling_convention(member, make_checker_shape<stored_t>(), registry);
  auto shared = std::make_shared<stored_t>(std::forward<callable_t>(callable));

  switch (convention) {
  case calling_convention::invalid:
    return core::errc::incompatible_checker;
  case calling_convention::parameters_array:
  case calling_convention::target_and_parameters_array:
    if constexpr (takes_argument_array) {
      auto call = [shared](const argument_list &arguments) {
        return detail::call_checker(*shared, arguments);
      };
      if (convention == calling_convention::parameters_array) {
        return checker{parameters_array_call{std::move(call)}};
      }
      return checker{target_and_parameters_array_call{std::move(call)}};
    }
    return core::errc::incompatible_checker;
  case calling_convention::parameters_direct:
    return checker{parameters_direct_call{
        [shared](const argument_list &arguments) {
          return invoker_t::direct(*shared, arguments);
        }}};
  case calling_convention::target_and_parameters_direct:
    if constexpr (core::type_list_size_v<parameters_t> >= 1U) {
      return checker{target_and_parameters_direct_call{
          [shared](const instance_handle &target,
                   const argument_list &arguments) {
            return invoker_t::with_target(*shared, target, arguments);
          }}};
    }
    return core::errc::incompatible_checker;
  }
  return core::errc::incompatible_checker;
}

// Zero-argument predicate guarding a transition; returns void or
// vg::core::result<void>.
class pre_constraint_checker {
public:
  template <typename callable_t>
    requires std::invocable<std::decay_t<callable_t> &>
  explicit pre_constraint_checker(callable_t &&callable)
      : call_([shared = std::make_shared<std::decay_t<callable_t>>(
                   std::forward<callable_t>(callable))]() {
          return detail::call_checker(*shared);
        }) {}

  [[nodiscard]] auto invoke() const -> core::result<void> { return call_(); }

private:
  std::function<core::result<void>()> call_;
};

} // namespace vg::oracle
