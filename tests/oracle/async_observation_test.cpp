#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <thread>
#include <tuple>
#include <utility>

#include <stdexec/execution.hpp>

#include "vg/oracle/async_observation.hpp"
#include "vg/oracle/observation_queue.hpp"

using namespace std::chrono_literals;

namespace {

using context_t =
    decltype(vg::oracle::make_wait_context(stdexec::inline_scheduler{}));

static_assert(vg::oracle::wait_context_like<context_t>);
static_assert(!vg::oracle::wait_context_like<int>);

template <typename value_t, typename sender_t>
[[nodiscard]] auto consume_sender(sender_t &&sender) -> value_t {
  auto sync_result = stdexec::sync_wait(std::forward<sender_t>(sender));
  REQUIRE(sync_result.has_value());
  return std::move(std::get<0>(sync_result.value()));
}

} // namespace

TEST_CASE("async try_get completes with the queued head",
          "[oracle][async][condition]") {
  vg::oracle::observation_queue<int> queue;
  REQUIRE(queue.add(3).has_value());
  REQUIRE(queue.add(4).has_value());
  const auto context =
      vg::oracle::make_wait_context(stdexec::inline_scheduler{});

  auto peeked = consume_sender<vg::core::result<int>>(
      vg::oracle::async_try_get(context, queue, 0ms, false));
  REQUIRE(peeked.has_value());
  REQUIRE(peeked.value() == 3);
  REQUIRE(queue.count() == 2U);

  auto consumed = consume_sender<vg::core::result<int>>(
      vg::oracle::async_try_get(context, queue, 0ms, true));
  REQUIRE(consumed.value() == 3);
  REQUIRE(queue.count() == 1U);
}

TEST_CASE("async try_get reports timeout and early wake",
          "[oracle][async][branch]") {
  vg::oracle::observation_queue<int> queue;
  const auto context =
      vg::oracle::make_wait_context(stdexec::inline_scheduler{});

  auto expired = consume_sender<vg::core::result<int>>(
      vg::oracle::async_try_get(context, queue, 5ms, true));
  REQUIRE(expired.has_error());
  REQUIRE(expired.error() == vg::core::errc::timeout);

  std::thread producer([&queue]() {
    std::this_thread::sleep_for(10ms);
    [[maybe_unused]] const auto added = queue.add(9);
  });
  auto woken = consume_sender<vg::core::result<int>>(
      vg::oracle::async_try_get(context, queue, 5s, true));
  producer.join();
  REQUIRE(woken.value() == 9);
}
