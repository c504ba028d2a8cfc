#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "vg/core/error.hpp"
#include "vg/core/result.hpp"
#include "vg/oracle/reporting.hpp"

namespace vg::oracle {

// Type-erased view of a transactable variable, used by the log to describe
// and unwind bindings.
class variable_base {
public:
  virtual ~variable_base() = default;

  [[nodiscard]] virtual auto name() const noexcept -> const std::string & = 0;
  [[nodiscard]] virtual auto is_bound() const noexcept -> bool = 0;
  [[nodiscard]] virtual auto describe_value() const -> std::string = 0;

protected:
  friend class transaction_scope;

  virtual void unbind() noexcept = 0;
};

enum class transaction_entry_kind : std::uint8_t {
  assert_check,
  assume_check,
  checkpoint,
  comment,
  variable_bound,
};

[[nodiscard]] constexpr auto to_string(const transaction_entry_kind kind)
    noexcept -> std::string_view {
  switch (kind) {
  case transaction_entry_kind::assert_check:
    return "assert";
  case transaction_entry_kind::assume_check:
    return "assume";
  case transaction_entry_kind::checkpoint:
    return "checkpoint";
  case transaction_entry_kind::comment:
    return "comment";
  case transaction_entry_kind::variable_bound:
    return "bind";
  }
  return "unknown";
}

struct transaction_entry {
  transaction_entry_kind kind{transaction_entry_kind::comment};
  bool condition{true};
  std::string description{};
  std::shared_ptr<variable_base> variable{};
  std::string value_text{};

  [[nodiscard]] auto describe() const -> std::string {
    switch (kind) {
    case transaction_entry_kind::assert_check:
    case transaction_entry_kind::assume_check:
      return fmt::format("{} {}: {}", to_string(kind),
                         condition ? "succeeded" : "failed", description);
    case transaction_entry_kind::checkpoint:
      return fmt::format("checkpoint: {}", description);
    case transaction_entry_kind::comment:
      return fmt::format("comment: {}", description);
    case transaction_entry_kind::variable_bound:
      return binding_text();
    }
    return description;
  }

  [[nodiscard]] auto binding_text() const -> std::string {
    return fmt::format("bound variable {} to value: {}",
                       variable == nullptr ? std::string{"<unnamed>"}
                                           : variable->name(),
                       value_text);
  }
};

// Ordered record of what one matching attempt did.
class transaction {
public:
  void append(transaction_entry entry) { entries_.push_back(std::move(entry)); }

  [[nodiscard]] auto entries() const noexcept
      -> const std::vector<transaction_entry> & {
    return entries_;
  }

  [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }

  // True once any assert or assume in the attempt evaluated to false.
  [[nodiscard]] auto failed() const noexcept -> bool {
    for (const auto &entry : entries_) {
      if ((entry.kind == transaction_entry_kind::assert_check ||
           entry.kind == transaction_entry_kind::assume_check) &&
          !entry.condition) {
        return true;
      }
    }
    return false;
  }

  [[nodiscard]] auto describe(const std::string_view prefix) const
      -> std::string {
    std::string text;
    for (const auto &entry : entries_) {
      text += fmt::format("{}{}\n", prefix, entry.describe());
    }
    return text;
  }

private:
  std::vector<transaction_entry> entries_{};
};

// Holds the single active transaction of a test manager. Records made while
// a transaction is active are buffered until `end` commits or rolls back.
class transaction_scope {
public:
  transaction_scope() = default;
  transaction_scope(const transaction_scope &) = delete;
  auto operator=(const transaction_scope &) -> transaction_scope & = delete;

  [[nodiscard]] auto active() const noexcept -> bool {
    return current_.has_value();
  }

  // Null when no transaction is active.
  [[nodiscard]] auto current() const noexcept -> const transaction * {
    return current_.has_value() ? &*current_ : nullptr;
  }

  [[nodiscard]] auto begin() -> core::result<void> {
    if (current_.has_value()) {
      return core::errc::invalid_state;
    }
    current_.emplace();
    return {};
  }

  // Commit replays every entry to `sink` in order and stops at the first
  // sink failure. Rollback only unbinds the variables bound in the attempt.
  // Either way the scope is left without an active transaction.
  [[nodiscard]] auto end(const bool commit, reporting_sink &sink)
      -> core::result<transaction> {
    if (!current_.has_value()) {
      return core::errc::invalid_state;
    }
    transaction ended = std::move(*current_);
    current_.reset();

    if (!commit) {
      const auto &entries = ended.entries();
      for (auto entry = entries.rbegin(); entry != entries.rend(); ++entry) {
        if (entry->kind == transaction_entry_kind::variable_bound &&
            entry->variable != nullptr) {
          entry->variable->unbind();
        }
      }
      return ended;
    }

    for (const auto &entry : ended.entries()) {
      auto replayed = replay(entry, sink);
      if (replayed.has_error()) {
        return replayed.error();
      }
    }
    return ended;
  }

  // Returns transaction_failed when the condition is false so the checker
  // can stop at the failed check.
  [[nodiscard]] auto record_assert(const bool condition,
                                   std::string description)
      -> core::result<void> {
    return record_check(transaction_entry_kind::assert_check, condition,
                        std::move(description));
  }

  [[nodiscard]] auto record_assume(const bool condition,
                                   std::string description)
      -> core::result<void> {
    return record_check(transaction_entry_kind::assume_check, condition,
                        std::move(description));
  }

  [[nodiscard]] auto record_checkpoint(std::string description)
      -> core::result<void> {
    return record(transaction_entry{transaction_entry_kind::checkpoint, true,
                                    std::move(description), {}, {}});
  }

  [[nodiscard]] auto record_comment(std::string description)
      -> core::result<void> {
    return record(transaction_entry{transaction_entry_kind::comment, true,
                                    std::move(description), {}, {}});
  }

  [[nodiscard]] auto record_binding(std::shared_ptr<variable_base> variable,
                                    std::string value_text)
      -> core::result<void> {
    return record(transaction_entry{transaction_entry_kind::variable_bound,
                                    true, {}, std::move(variable),
                                    std::move(value_text)});
  }

private:
  [[nodiscard]] auto record(transaction_entry entry) -> core::result<void> {
    if (!current_.has_value()) {
      return core::errc::invalid_state;
    }
    current_->append(std::move(entry));
    return {};
  }

  [[nodiscard]] auto record_check(const transaction_entry_kind kind,
                                  const bool condition,
                                  std::string description)
      -> core::result<void> {
    auto recorded = record(
        transaction_entry{kind, condition, std::move(description), {}, {}});
    if (recorded.has_error()) {
      return recorded;
    }
    if (!condition) {
      return core::errc::transaction_failed;
    }
    return {};
  }

  [[nodiscard]] static auto replay(const transaction_entry &entry,
                                   reporting_sink &sink)
      -> core::result<void> {
    switch (entry.kind) {
    case transaction_entry_kind::assert_check:
      return sink.assert_that(entry.condition, entry.description);
    case transaction_entry_kind::assume_check:
      return sink.assume(entry.condition, entry.description);
    case transaction_entry_kind::checkpoint:
      return sink.checkpoint(entry.description);
    case transaction_entry_kind::comment:
      return sink.comment(entry.description);
    case transaction_entry_kind::variable_bound:
      return sink.comment(entry.binding_text());
    }
    return core::errc::internal_error;
  }

  std::optional<transaction> current_{};
};

} // namespace vg::oracle
