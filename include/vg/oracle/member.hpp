#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
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

enum class member_kind : std::uint8_t {
  event,
  method,
  constructor,
};

[[nodiscard]] constexpr auto to_string(const member_kind kind) noexcept
    -> std::string_view {
  switch (kind) {
  case member_kind::event:
    return "event";
  case member_kind::method:
    return "method";
  case member_kind::constructor:
    return "constructor";
  }
  return "unknown";
}

struct parameter_shape {
  type_id type{};
  bool by_reference{false};
};

// Static description of an event, method or constructor, built once when the
// member is registered. Observations and expectations refer to descriptors
// by identity.
struct member_descriptor {
  member_kind kind{member_kind::method};
  std::string name{};
  type_id declaring_type{};
  bool is_static{false};
  std::vector<parameter_shape> parameters{};
  std::optional<type_id> return_type{};

  [[nodiscard]] auto parameter_types() const -> std::vector<type_id> {
    std::vector<type_id> types;
    types.reserve(parameters.size());
    for (const auto &parameter : parameters) {
      types.push_back(parameter.type);
    }
    return types;
  }

  // Types a checker is matched against: all parameters of an event; the
  // by-reference outputs followed by the non-void return value otherwise.
  [[nodiscard]] auto checked_types() const -> std::vector<type_id> {
    if (kind == member_kind::event) {
      return parameter_types();
    }
    std::vector<type_id> outputs;
    for (const auto &parameter : parameters) {
      if (parameter.by_reference) {
        outputs.push_back(parameter.type);
      }
    }
    if (return_type.has_value()) {
      outputs.push_back(*return_type);
    }
    return outputs;
  }

  [[nodiscard]] auto qualified_name() const -> std::string {
    return fmt::format("{}.{}", declaring_type.short_name(), name);
  }

  [[nodiscard]] auto signature() const -> std::string {
    std::string text = fmt::format("{}(", qualified_name());
    for (std::size_t index = 0U; index < parameters.size(); ++index) {
      if (index != 0U) {
        text += ", ";
      }
      if (parameters[index].by_reference) {
        text += "out ";
      }
      text += parameters[index].type.short_name();
    }
    text += ")";
    if (return_type.has_value()) {
      text += fmt::format(" -> {}", return_type->short_name());
    }
    return text;
  }
};

using member_ptr = std::shared_ptr<const member_descriptor>;

namespace detail {

template <typename parameter_t>
inline constexpr bool is_output_parameter_v =
    std::is_lvalue_reference_v<parameter_t> &&
    !std::is_const_v<std::remove_reference_t<parameter_t>>;

template <typename... parameters_t>
[[nodiscard]] auto make_parameter_shapes() -> std::vector<parameter_shape> {
  return std::vector<parameter_shape>{
      parameter_shape{make_type_id<parameters_t>(),
                      is_output_parameter_v<parameters_t>}...};
}

template <typename signature_t> struct signature_shape;

template <typename return_t, typename... parameters_t>
struct signature_shape<return_t(parameters_t...)> {
  [[nodiscard]] static auto parameters() -> std::vector<parameter_shape> {
    return make_parameter_shapes<parameters_t...>();
  }

  [[nodiscard]] static auto return_type() -> std::optional<type_id> {
    if constexpr (std::is_void_v<return_t>) {
      return std::nullopt;
    } else {
      return make_type_id<return_t>();
    }
  }
};

} // namespace detail

template <typename owner_t, typename... arguments_t>
[[nodiscard]] auto make_event(std::string name, const bool is_static = false)
    -> member_ptr {
  return std::make_shared<const member_descriptor>(member_descriptor{
      member_kind::event, std::move(name), make_type_id<owner_t>(), is_static,
      detail::make_parameter_shapes<arguments_t...>(), std::nullopt});
}

// `signature_t` is a function type; non-const lvalue reference parameters
// are the method's by-reference outputs.
template <typename owner_t, typename signature_t>
  requires std::is_function_v<signature_t>
[[nodiscard]] auto make_method(std::string name, const bool is_static = false)
    -> member_ptr {
  using shape_t = detail::signature_shape<signature_t>;
  return std::make_shared<const member_descriptor>(member_descriptor{
      member_kind::method, std::move(name), make_type_id<owner_t>(), is_static,
      shape_t::parameters(), shape_t::return_type()});
}

template <typename owner_t, typename... arguments_t>
[[nodiscard]] auto make_constructor() -> member_ptr {
  return std::make_shared<const member_descriptor>(member_descriptor{
      member_kind::constructor, ".ctor", make_type_id<owner_t>(), false,
      detail::make_parameter_shapes<arguments_t...>(), std::nullopt});
}

// Registered members of the types under test, looked up by declaring type,
// name and parameter types.
class member_catalog {
public:
  void add(member_ptr member) {
    std::lock_guard lock(mutex_);
    members_.push_back(std::move(member));
  }

  [[nodiscard]] auto size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return members_.size();
  }

  [[nodiscard]] auto find_method(const type_id type, const std::string_view name,
                                 const std::vector<type_id> &parameters) const
      -> core::result<member_ptr> {
    return find(member_kind::method, type, name, &parameters);
  }

  [[nodiscard]] auto
  find_constructor(const type_id type,
                   const std::vector<type_id> &parameters) const
      -> core::result<member_ptr> {
    return find(member_kind::constructor, type, ".ctor", &parameters);
  }

  [[nodiscard]] auto find_event(const type_id type,
                                const std::string_view name) const
      -> core::result<member_ptr> {
    return find(member_kind::event, type, name, nullptr);
  }

private:
  [[nodiscard]] auto find(const member_kind kind, const type_id type,
                          const std::string_view name,
                          const std::vector<type_id> *parameters) const
      -> core::result<member_ptr> {
    if (type.empty()) {
      return core::errc::invalid_argument;
    }
    std::lock_guard lock(mutex_);
    for (const auto &member : members_) {
      if (member->kind != kind || member->declaring_type != type ||
          member->name != name) {
        continue;
      }
      if (parameters != nullptr && member->parameter_types() != *parameters) {
        continue;
      }
      return member;
    }
    return core::errc::not_found;
  }

  mutable std::mutex mutex_{};
  std::vector<member_ptr> members_{};
};

} // namespace vg::oracle
