#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "vg/core/error.hpp"
#include "vg/core/result.hpp"
#include "vg/oracle/transaction.hpp"
#include "vg/oracle/value.hpp"

namespace vg::oracle {

// Named cell bound at most once. A binding made while the owning scope has
// an active transaction is logged and undone if the attempt rolls back.
// Always owned by a shared_ptr; `create` is the only way to make one.
template <typename value_t>
class variable final : public variable_base,
                       public std::enable_shared_from_this<variable<value_t>> {
  struct construction_key {
    explicit construction_key() = default;
  };

public:
  using value_type = value_t;

  variable(construction_key, std::string name, transaction_scope *scope)
      : name_(std::move(name)), scope_(scope) {}

  [[nodiscard]] static auto create(std::string name, transaction_scope *scope)
      -> std::shared_ptr<variable> {
    return std::make_shared<variable>(construction_key{}, std::move(name),
                                      scope);
  }

  [[nodiscard]] auto name() const noexcept -> const std::string & override {
    return name_;
  }

  [[nodiscard]] auto is_bound() const noexcept -> bool override {
    return value_.has_value();
  }

  [[nodiscard]] auto value() const -> core::result<value_t> {
    if (!value_.has_value()) {
      return core::errc::not_bound;
    }
    return *value_;
  }

  [[nodiscard]] auto bind(value_t value) -> core::result<void> {
    if (value_.has_value()) {
      return core::errc::already_bound;
    }
    value_.emplace(std::move(value));
    if (scope_ == nullptr || !scope_->active()) {
      return {};
    }
    auto recorded = scope_->record_binding(this->shared_from_this(),
                                           describe_value());
    if (recorded.has_error()) {
      value_.reset();
    }
    return recorded;
  }

  [[nodiscard]] auto describe_value() const -> std::string override {
    if (!value_.has_value()) {
      return "<unbound>";
    }
    return boxed_value::of(*value_).describe();
  }

protected:
  void unbind() noexcept override { value_.reset(); }

private:
  std::string name_;
  transaction_scope *scope_{nullptr};
  std::optional<value_t> value_{};
};

template <typename value_t>
using variable_ptr = std::shared_ptr<variable<value_t>>;

} // namespace vg::oracle
