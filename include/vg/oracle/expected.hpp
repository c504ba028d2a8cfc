#pragma once

#include <optional>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "vg/core/result.hpp"
#include "vg/oracle/checker.hpp"
#include "vg/oracle/member.hpp"
#include "vg/oracle/observation.hpp"
#include "vg/oracle/type_registry.hpp"
#include "vg/oracle/value.hpp"

namespace vg::oracle {

namespace detail {

template <observation_kind kind> struct expected_observation {
  member_ptr member{};
  // Empty means any target.
  instance_handle target{};
  std::optional<checker> check{};

  [[nodiscard]] auto matches(const observation &observed) const -> bool {
    return observed.kind == kind && member != nullptr &&
           observed.member == member &&
           (target.empty() || target == observed.target);
  }

  [[nodiscard]] auto invoke(const observation &observed) const
      -> core::result<void> {
    if (!check.has_value()) {
      return {};
    }
    return check->invoke(observed.target, observed.arguments);
  }

  [[nodiscard]] auto describe() const -> std::string {
    std::string text = fmt::format(
        "{} {}",
        kind == observation_kind::available_event ? "event" : "return",
        member == nullptr ? std::string{"<unknown>"} : member->signature());
    if (!target.empty()) {
      text += fmt::format(" on {}", target.describe());
    }
    return text;
  }
};

template <typename pattern_t, typename callable_t>
[[nodiscard]] auto make_pattern(member_ptr member, const instance_handle target,
                                callable_t &&callable,
                                const type_registry &registry)
    -> core::result<pattern_t> {
  if (member == nullptr) {
    return core::errc::invalid_argument;
  }
  auto made = make_checker(*member, std::forward<callable_t>(callable), registry);
  if (made.has_error()) {
    return made.error();
  }
  return pattern_t{std::move(member), target, std::move(made).value()};
}

} // namespace detail

using expected_event =
    detail::expected_observation<observation_kind::available_event>;
using expected_return =
    detail::expected_observation<observation_kind::available_return>;

// Pattern without a checker: identity alone decides.
[[nodiscard]] inline auto make_expected_event(member_ptr member,
                                              const instance_handle target = {})
    -> expected_event {
  return expected_event{std::move(member), target, std::nullopt};
}

template <typename callable_t>
[[nodiscard]] auto make_expected_event(member_ptr member,
                                       const instance_handle target,
                                       callable_t &&callable,
                                       const type_registry &registry =
                                           type_registry::process())
    -> core::result<expected_event> {
  return detail::make_pattern<expected_event>(
      std::move(member), target, std::forward<callable_t>(callable), registry);
}

[[nodiscard]] inline auto make_expected_return(member_ptr member,
                                               const instance_handle target = {})
    -> expected_return {
  return expected_return{std::move(member), target, std::nullopt};
}

template <typename callable_t>
[[nodiscard]] auto make_expected_return(member_ptr member,
                                        const instance_handle target,
                                        callable_t &&callable,
                                        const type_registry &registry =
                                            type_registry::process())
    -> core::result<expected_return> {
  return detail::make_pattern<expected_return>(
      std::move(member), target, std::forward<callable_t>(callable), registry);
}

// Standalone predicate guarding a transition.
struct expected_pre_constraint {
  std::string description{};
  pre_constraint_checker check;

  [[nodiscard]] auto invoke() const -> core::result<void> {
    return check.invoke();
  }

  [[nodiscard]] auto describe() const -> std::string {
    return description.empty() ? std::string{"pre-constraint"} : description;
  }
};

template <typename callable_t>
[[nodiscard]] auto make_pre_constraint(std::string description,
                                       callable_t &&callable)
    -> expected_pre_constraint {
  return expected_pre_constraint{
      std::move(description),
      pre_constraint_checker{std::forward<callable_t>(callable)}};
}

} // namespace vg::oracle
