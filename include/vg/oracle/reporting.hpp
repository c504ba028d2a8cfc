#pragma once

#include <cstddef>
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>

#include <fmt/format.h>

#include "vg/core/error.hpp"
#include "vg/core/result.hpp"
#include "vg/oracle/type_registry.hpp"
#include "vg/oracle/value.hpp"

namespace vg::oracle {

// Destination of test verdicts. A failed result is a sink-level failure and
// is passed back to whoever forwarded the record.
class reporting_sink {
public:
  virtual ~reporting_sink() = default;

  [[nodiscard]] virtual auto assert_that(bool condition,
                                         std::string_view description)
      -> core::result<void> = 0;
  [[nodiscard]] virtual auto assume(bool condition,
                                    std::string_view description)
      -> core::result<void> = 0;
  [[nodiscard]] virtual auto checkpoint(std::string_view description)
      -> core::result<void> = 0;
  [[nodiscard]] virtual auto comment(std::string_view description)
      -> core::result<void> = 0;
  [[nodiscard]] virtual auto begin_test(std::string_view name)
      -> core::result<void> = 0;
  [[nodiscard]] virtual auto end_test() -> core::result<void> = 0;
};

// Resolves the singleton adapter instance registered for a type.
class adapter_provider {
public:
  virtual ~adapter_provider() = default;

  [[nodiscard]] virtual auto get_adapter(type_id type)
      -> core::result<instance_handle> = 0;
};

// Adapter provider backed by instances the test registers up front.
class adapter_directory final : public adapter_provider {
public:
  template <typename adapter_t>
    requires(!std::is_const_v<adapter_t>)
  void add(adapter_t &adapter) {
    std::lock_guard lock(mutex_);
    adapters_.insert_or_assign(make_type_id<adapter_t>(),
                               instance_handle::of(adapter));
  }

  [[nodiscard]] auto get_adapter(const type_id type)
      -> core::result<instance_handle> override {
    std::lock_guard lock(mutex_);
    const auto found = adapters_.find(type);
    if (found == adapters_.end()) {
      return core::errc::not_found;
    }
    return found->second;
  }

private:
  std::mutex mutex_{};
  std::unordered_map<type_id, instance_handle> adapters_{};
};

// Line-oriented sink writing tagged records to a stream. One mutex
// serializes lines so concurrent writers never interleave.
class console_reporting_sink final : public reporting_sink {
public:
  console_reporting_sink() : console_reporting_sink(std::cout) {}

  explicit console_reporting_sink(std::ostream &stream) : stream_(stream) {}

  [[nodiscard]] auto assert_that(const bool condition,
                                 const std::string_view description)
      -> core::result<void> override {
    std::lock_guard lock(mutex_);
    if (!condition) {
      ++failures_;
    }
    write_locked(condition ? "pass" : "fail", description);
    return {};
  }

  [[nodiscard]] auto assume(const bool condition,
                            const std::string_view description)
      -> core::result<void> override {
    std::lock_guard lock(mutex_);
    write_locked("assume",
                 fmt::format("{}: {}", condition ? "held" : "violated",
                             description));
    return {};
  }

  [[nodiscard]] auto checkpoint(const std::string_view description)
      -> core::result<void> override {
    std::lock_guard lock(mutex_);
    write_locked("checkpoint", description);
    return {};
  }

  [[nodiscard]] auto comment(const std::string_view description)
      -> core::result<void> override {
    std::lock_guard lock(mutex_);
    write_locked("comment", description);
    return {};
  }

  [[nodiscard]] auto begin_test(const std::string_view name)
      -> core::result<void> override {
    std::lock_guard lock(mutex_);
    if (!current_test_.empty()) {
      return core::errc::invalid_state;
    }
    current_test_ = std::string{name};
    write_locked("test", fmt::format("begin {}", name));
    return {};
  }

  [[nodiscard]] auto end_test() -> core::result<void> override {
    std::lock_guard lock(mutex_);
    if (current_test_.empty()) {
      return core::errc::invalid_state;
    }
    write_locked("test", fmt::format("end {} ({} failed)", current_test_,
                                     failures_));
    current_test_.clear();
    return {};
  }

  [[nodiscard]] auto failure_count() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return failures_;
  }

private:
  void write_locked(const std::string_view tag,
                    const std::string_view description) {
    stream_ << fmt::format("[{}] {}\n", tag, description);
    stream_.flush();
  }

  std::ostream &stream_;
  mutable std::mutex mutex_{};
  std::size_t failures_{0U};
  std::string current_test_{};
};

} // namespace vg::oracle
