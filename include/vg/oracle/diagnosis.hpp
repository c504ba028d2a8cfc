#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "vg/oracle/observation.hpp"
#include "vg/oracle/transaction.hpp"

namespace vg::oracle {

// Outcome of one expected pattern against the observation at the head of a
// queue. `trace` is set for patterns whose identity matched but whose
// checker rejected the observation.
struct pattern_outcome {
  std::string pattern{};
  bool identity_matched{false};
  transaction trace{};
};

namespace detail {

inline constexpr std::string_view diagnosis_indent = "\t";
inline constexpr std::string_view trace_indent = "      ";

[[nodiscard]] inline auto milliseconds_of(const std::chrono::milliseconds value)
    -> long long {
  return static_cast<long long>(value.count());
}

inline void append_list(std::string &text,
                        const std::vector<std::string> &lines) {
  for (const auto &line : lines) {
    text += fmt::format("{}{}\n", diagnosis_indent, line);
  }
}

} // namespace detail

[[nodiscard]] inline auto
render_event_timeout(const std::chrono::milliseconds timeout,
                     const std::vector<std::string> &expected) -> std::string {
  std::string text = fmt::format("Event must occur within {}ms\n",
                                 detail::milliseconds_of(timeout));
  text += "Expecting events:\n";
  detail::append_list(text, expected);
  return text;
}

[[nodiscard]] inline auto
render_return_timeout(const std::chrono::milliseconds timeout) -> std::string {
  return fmt::format("expecting return within {}ms",
                     detail::milliseconds_of(timeout));
}

// One numbered line per expected pattern in declaration order. Rejected
// candidates carry their rolled-back trace below their line.
[[nodiscard]] inline auto
render_no_match(const observation &observed,
                const std::vector<pattern_outcome> &outcomes) -> std::string {
  std::string details;
  for (std::size_t index = 0U; index < outcomes.size(); ++index) {
    const auto &outcome = outcomes[index];
    if (outcome.identity_matched) {
      details += fmt::format("  {}. {} is not matching\n", index + 1U,
                             outcome.pattern);
      details += outcome.trace.describe(detail::trace_indent);
    } else {
      details += fmt::format("  {}. {} does not match member or target\n",
                             index + 1U, outcome.pattern);
    }
  }
  return fmt::format("expected matching event, found '{}'. Diagnosis:\n{}",
                     observed.describe(), details);
}

[[nodiscard]] inline auto
render_pre_constraint_failure(const std::vector<transaction> &failed)
    -> std::string {
  std::string text = "None of the expected pre-constraints are matched.\n";
  for (const auto &attempt : failed) {
    text += attempt.describe("    ");
  }
  return text;
}

[[nodiscard]] inline auto
render_accepting_timeout(const std::vector<std::string> &expected)
    -> std::string {
  std::string text = "Observation timeout while expecting events:\n";
  detail::append_list(text, expected);
  return text;
}

[[nodiscard]] inline auto
render_observation_timeout(const std::vector<std::string> &expected,
                           const std::vector<observation> &observed)
    -> std::string {
  std::string text = "Expected event didn't come within configured timeout.\n";
  text += "Expected events:\n";
  detail::append_list(text, expected);
  text += "Observed events:\n";
  for (const auto &entry : observed) {
    text += fmt::format("{}{}\n", detail::diagnosis_indent, entry.describe());
  }
  return text;
}

template <typename pattern_t>
[[nodiscard]] auto describe_all(const std::vector<pattern_t> &patterns)
    -> std::vector<std::string> {
  std::vector<std::string> lines;
  lines.reserve(patterns.size());
  for (const auto &pattern : patterns) {
    lines.push_back(pattern.describe());
  }
  return lines;
}

} // namespace vg::oracle
