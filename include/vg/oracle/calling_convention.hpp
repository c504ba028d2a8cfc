#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string_view>
#include <type_traits>
#include <vector>

#include "vg/core/type_utils.hpp"
#include "vg/oracle/member.hpp"
#include "vg/oracle/type_registry.hpp"
#include "vg/oracle/value.hpp"

namespace vg::oracle {

enum class calling_convention : std::uint8_t {
  invalid = 0U,
  parameters_direct,
  target_and_parameters_direct,
  parameters_array,
  target_and_parameters_array,
};

[[nodiscard]] constexpr auto to_string(const calling_convention convention)
    noexcept -> std::string_view {
  switch (convention) {
  case calling_convention::invalid:
    return "invalid";
  case calling_convention::parameters_direct:
    return "parameters_direct";
  case calling_convention::target_and_parameters_direct:
    return "target_and_parameters_direct";
  case calling_convention::parameters_array:
    return "parameters_array";
  case calling_convention::target_and_parameters_array:
    return "target_and_parameters_array";
  }
  return "unknown";
}

template <typename char_t, typename traits_t>
auto operator<<(std::basic_ostream<char_t, traits_t> &stream,
                const calling_convention convention)
    -> std::basic_ostream<char_t, traits_t> & {
  stream << to_string(convention);
  return stream;
}

// Parameter shape of a checker callable. `untyped` is set when the checker
// takes the whole argument array as its only parameter.
struct checker_shape {
  std::vector<type_id> parameters{};
  bool untyped{false};
};

namespace detail {

template <typename parameter_t>
inline constexpr bool is_argument_array_v =
    std::is_same_v<core::remove_cvref_t<parameter_t>, argument_list>;

template <typename... parameters_t>
[[nodiscard]] auto shape_of(core::type_list<parameters_t...>)
    -> checker_shape {
  checker_shape shape{std::vector<type_id>{make_type_id<parameters_t>()...},
                      false};
  if constexpr (sizeof...(parameters_t) == 1U) {
    shape.untyped = (is_argument_array_v<parameters_t> && ...);
  }
  return shape;
}

} // namespace detail

template <typename callable_t>
[[nodiscard]] auto make_checker_shape() -> checker_shape {
  return detail::shape_of(core::function_argument_types_t<callable_t>{});
}

// A member needs a target instance when it is instance-scoped and its
// declaring type is not an adapter.
[[nodiscard]] inline auto requires_target(const member_descriptor &member,
                                          const type_registry &registry)
    -> bool {
  return !member.is_static && !registry.is_adapter(member.declaring_type);
}

[[nodiscard]] inline auto
resolve_calling_convention(const member_descriptor &member,
                           const checker_shape &checker,
                           const type_registry &registry)
    -> calling_convention {
  const bool target_required = requires_target(member, registry);
  if (checker.untyped) {
    return target_required ? calling_convention::target_and_parameters_array
                           : calling_convention::parameters_array;
  }

  const auto outputs = member.checked_types();
  std::size_t offset = 0U;
  auto convention = calling_convention::parameters_direct;

  if (checker.parameters.size() == outputs.size() + 1U) {
    if (!target_required ||
        checker.parameters.front() != member.declaring_type) {
      return calling_convention::invalid;
    }
    offset = 1U;
    convention = calling_convention::target_and_parameters_direct;
  } else if (checker.parameters.size() != outputs.size()) {
    return calling_convention::invalid;
  }

  for (std::size_t index = 0U; index < outputs.size(); ++index) {
    if (outputs[index] != checker.parameters[offset + index]) {
      return calling_convention::invalid;
    }
  }
  return convention;
}

} // namespace vg::oracle
