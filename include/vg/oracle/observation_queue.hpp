#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

#include "vg/core/error.hpp"
#include "vg/core/result.hpp"
#include "vg/oracle/observation.hpp"

namespace vg::oracle {

struct observation_queue_options {
  // Zero means unbounded.
  std::size_t capacity{0U};
};

// FIFO of observations shared between producer threads and the single
// matching consumer. `try_get` waits on a condition variable so the consumer
// wakes as soon as a producer adds an entry.
template <typename value_t = observation> class observation_queue {
public:
  using value_type = value_t;

  observation_queue() = default;

  explicit observation_queue(const observation_queue_options options)
      : options_(options) {}

  observation_queue(const observation_queue &) = delete;
  auto operator=(const observation_queue &) -> observation_queue & = delete;

  [[nodiscard]] auto add(value_t value) -> core::result<void> {
    {
      std::lock_guard lock(mutex_);
      if (options_.capacity != 0U && entries_.size() >= options_.capacity) {
        return core::errc::queue_full;
      }
      entries_.push_back(std::move(value));
    }
    ready_.notify_all();
    return {};
  }

  // Waits up to `timeout` for a head entry. A zero timeout polls once.
  // With `consume` false the head stays queued.
  template <typename rep_t, typename period_t>
  [[nodiscard]] auto try_get(const std::chrono::duration<rep_t, period_t> timeout,
                             const bool consume) -> core::result<value_t> {
    std::unique_lock lock(mutex_);
    if (entries_.empty() && timeout > timeout.zero()) {
      ready_.wait_until(lock, deadline_after(timeout),
                        [this] { return !entries_.empty(); });
    }
    if (entries_.empty()) {
      return core::errc::timeout;
    }
    if (!consume) {
      return entries_.front();
    }
    value_t head = std::move(entries_.front());
    entries_.pop_front();
    return head;
  }

  [[nodiscard]] auto count() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return entries_.size();
  }

  [[nodiscard]] auto empty() const -> bool { return count() == 0U; }

  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return options_.capacity;
  }

  // Copy of the queued entries in arrival order.
  [[nodiscard]] auto snapshot() const -> std::vector<value_t> {
    std::lock_guard lock(mutex_);
    return std::vector<value_t>(entries_.begin(), entries_.end());
  }

  void clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
  }

private:
  using clock_type = std::chrono::steady_clock;

  // Saturates at the clock's maximum instead of overflowing, so a timeout of
  // duration::max() waits until an entry arrives.
  template <typename rep_t, typename period_t>
  [[nodiscard]] static auto
  deadline_after(const std::chrono::duration<rep_t, period_t> timeout)
      -> clock_type::time_point {
    using timeout_type = std::chrono::duration<rep_t, period_t>;
    const auto now = clock_type::now();
    const auto headroom = std::chrono::duration_cast<timeout_type>(
        clock_type::time_point::max() - now);
    if (timeout >= headroom) {
      return clock_type::time_point::max();
    }
    return now + std::chrono::duration_cast<clock_type::duration>(timeout);
  }

  observation_queue_options options_{};
  mutable std::mutex mutex_{};
  std::condition_variable ready_{};
  std::deque<value_t> entries_{};
};

} // namespace vg::oracle
