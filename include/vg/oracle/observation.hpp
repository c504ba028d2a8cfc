#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "vg/oracle/member.hpp"
#include "vg/oracle/value.hpp"

namespace vg::oracle {

enum class observation_kind : std::uint8_t {
  available_event,
  available_return,
};

// Record that an event fired or a method returned. `target` is empty for
// static and adapter-scoped members. Immutable once queued.
struct observation {
  using clock_type = std::chrono::steady_clock;

  observation_kind kind{observation_kind::available_event};
  member_ptr member{};
  instance_handle target{};
  argument_list arguments{};
  clock_type::time_point captured_at{};

  [[nodiscard]] auto describe() const -> std::string {
    const std::string name =
        member == nullptr ? std::string{"<unknown>"} : member->qualified_name();
    std::string text =
        kind == observation_kind::available_event
            ? fmt::format("event {}({})", name, vg::oracle::describe(arguments))
            : fmt::format("return {} -> ({})", name,
                          vg::oracle::describe(arguments));
    if (!target.empty()) {
      text += fmt::format(" on {}", target.describe());
    }
    return text;
  }
};

[[nodiscard]] inline auto make_available_event(member_ptr member,
                                               instance_handle target,
                                               argument_list arguments)
    -> observation {
  return observation{observation_kind::available_event, std::move(member),
                     target, std::move(arguments),
                     observation::clock_type::now()};
}

// `outputs` are the by-reference outputs followed by the return value.
[[nodiscard]] inline auto make_available_return(member_ptr member,
                                                instance_handle target,
                                                argument_list outputs)
    -> observation {
  return observation{observation_kind::available_return, std::move(member),
                     target, std::move(outputs),
                     observation::clock_type::now()};
}

} // namespace vg::oracle
