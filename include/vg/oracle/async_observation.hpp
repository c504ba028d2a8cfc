#pragma once

#include <chrono>
#include <type_traits>
#include <utility>

#include <stdexec/execution.hpp>

#include "vg/core/result.hpp"
#include "vg/oracle/observation_queue.hpp"

namespace vg::oracle {

// Scheduler the timed queue wait of `async_try_get` runs on.
template <typename scheduler_t>
  requires stdexec::scheduler<scheduler_t>
struct wait_context {
  using scheduler_type = scheduler_t;

  scheduler_t scheduler{};
};

template <typename type_t> struct is_wait_context : std::false_type {};

template <typename scheduler_t>
struct is_wait_context<wait_context<scheduler_t>> : std::true_type {};

template <typename context_t>
concept wait_context_like =
    is_wait_context<std::remove_cvref_t<context_t>>::value;

template <typename scheduler_t>
  requires stdexec::scheduler<std::remove_cvref_t<scheduler_t>>
[[nodiscard]] constexpr auto make_wait_context(scheduler_t &&scheduler)
    -> wait_context<std::remove_cvref_t<scheduler_t>> {
  return wait_context<std::remove_cvref_t<scheduler_t>>{
      std::forward<scheduler_t>(scheduler)};
}

// Sender form of `observation_queue::try_get`. The timed wait runs on the
// context's scheduler and the sender completes with the same result. The
// queue must outlive the sender.
template <wait_context_like context_t, typename value_t, typename rep_t,
          typename period_t>
[[nodiscard]] auto
async_try_get(const context_t &context, observation_queue<value_t> &queue,
              const std::chrono::duration<rep_t, period_t> timeout,
              const bool consume) {
  return stdexec::schedule(context.scheduler) |
         stdexec::then([&queue, timeout, consume]() -> core::result<value_t> {
           return queue.try_get(timeout, consume);
         });
}

} // namespace vg::oracle
