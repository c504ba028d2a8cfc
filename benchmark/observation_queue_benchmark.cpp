#include <benchmark/benchmark.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "vg/oracle/expected.hpp"
#include "vg/oracle/member.hpp"
#include "vg/oracle/observation_queue.hpp"
#include "vg/oracle/reporting.hpp"
#include "vg/oracle/test_manager.hpp"
#include "vg/oracle/type_registry.hpp"
#include "vg/oracle/value.hpp"

namespace {

using stamp_queue_t = vg::oracle::observation_queue<std::uint64_t>;

struct sensor {
  int reading{0};
};

class null_sink final : public vg::oracle::reporting_sink {
public:
  [[nodiscard]] auto assert_that(const bool, const std::string_view)
      -> vg::core::result<void> override {
    return {};
  }
  [[nodiscard]] auto assume(const bool, const std::string_view)
      -> vg::core::result<void> override {
    return {};
  }
  [[nodiscard]] auto checkpoint(const std::string_view)
      -> vg::core::result<void> override {
    return {};
  }
  [[nodiscard]] auto comment(const std::string_view)
      -> vg::core::result<void> override {
    return {};
  }
  [[nodiscard]] auto begin_test(const std::string_view)
      -> vg::core::result<void> override {
    return {};
  }
  [[nodiscard]] auto end_test() -> vg::core::result<void> override {
    return {};
  }
};

struct shared_queue_state {
  std::unique_ptr<stamp_queue_t> queue{};
  std::atomic<bool> ready{false};
  std::atomic<std::uint64_t> latency_sum_ns{0U};
  std::atomic<std::uint64_t> latency_max_ns{0U};
  std::atomic<std::uint64_t> latency_samples{0U};
  std::atomic<std::uint32_t> barrier_arrived{0U};
  std::atomic<std::uint32_t> barrier_generation{0U};
};

void wait_for_threads(shared_queue_state &shared,
                      const std::uint32_t thread_count) {
  const auto generation =
      shared.barrier_generation.load(std::memory_order_acquire);
  if (shared.barrier_arrived.fetch_add(1U, std::memory_order_acq_rel) + 1U ==
      thread_count) {
    shared.barrier_arrived.store(0U, std::memory_order_release);
    shared.barrier_generation.fetch_add(1U, std::memory_order_acq_rel);
    return;
  }

  while (shared.barrier_generation.load(std::memory_order_acquire) ==
         generation) {
    std::this_thread::yield();
  }
}

void prepare_shared_queue(benchmark::State &state, shared_queue_state &shared,
                          const std::size_t capacity) {
  if (state.thread_index() == 0) {
    shared.queue = std::make_unique<stamp_queue_t>(
        vg::oracle::observation_queue_options{capacity});
    shared.latency_sum_ns.store(0U, std::memory_order_relaxed);
    shared.latency_max_ns.store(0U, std::memory_order_relaxed);
    shared.latency_samples.store(0U, std::memory_order_relaxed);
    shared.ready.store(true, std::memory_order_release);
  }
  while (!shared.ready.load(std::memory_order_acquire)) {
    std::this_thread::yield();
  }
  wait_for_threads(shared, static_cast<std::uint32_t>(state.threads()));
}

void finalize_shared_queue(benchmark::State &state,
                           shared_queue_state &shared) {
  wait_for_threads(shared, static_cast<std::uint32_t>(state.threads()));
  if (state.thread_index() == 0) {
    shared.ready.store(false, std::memory_order_release);
    shared.queue.reset();
  }
  wait_for_threads(shared, static_cast<std::uint32_t>(state.threads()));
}

void BM_observation_queue_single_thread(benchmark::State &state) {
  stamp_queue_t queue(vg::oracle::observation_queue_options{
      static_cast<std::size_t>(state.range(0))});
  std::uint64_t value = 0U;

  for (auto _ : state) {
    auto added = queue.add(value++);
    benchmark::DoNotOptimize(added);
    auto taken = queue.try_get(std::chrono::milliseconds::zero(), true);
    benchmark::DoNotOptimize(taken);
  }

  state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * 2);
}

// Even threads produce, odd threads consume.
void BM_observation_queue_contended(benchmark::State &state) {
  static shared_queue_state shared{};
  prepare_shared_queue(state, shared, static_cast<std::size_t>(state.range(0)));

  const auto thread_index = static_cast<std::size_t>(state.thread_index());
  const bool is_producer = (thread_index % 2U) == 0U;
  std::uint64_t value = static_cast<std::uint64_t>(thread_index) << 48U;

  for (auto _ : state) {
    if (is_producer) {
      while (!shared.queue->add(value).has_value()) {
        std::this_thread::yield();
      }
      ++value;
    } else {
      while (true) {
        auto taken = shared.queue->try_get(std::chrono::milliseconds{1}, true);
        if (taken.has_value()) {
          benchmark::DoNotOptimize(taken.value());
          break;
        }
      }
    }
  }

  if (state.thread_index() == 0) {
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) *
                            static_cast<std::int64_t>(state.threads()));
  }
  finalize_shared_queue(state, shared);
}

// Producer stamps, the waiting consumer measures the wake-up delay.
void BM_observation_queue_handoff_latency(benchmark::State &state) {
  static shared_queue_state shared{};
  prepare_shared_queue(state, shared, static_cast<std::size_t>(state.range(0)));

  const bool is_producer = state.thread_index() == 0;

  for (auto _ : state) {
    if (is_producer) {
      const auto now = std::chrono::steady_clock::now().time_since_epoch();
      const auto stamp = static_cast<std::uint64_t>(
          std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
      while (!shared.queue->add(stamp).has_value()) {
        std::this_thread::yield();
      }
    } else {
      std::uint64_t stamp = 0U;
      while (true) {
        auto taken = shared.queue->try_get(std::chrono::milliseconds{1}, true);
        if (taken.has_value()) {
          stamp = taken.value();
          break;
        }
      }

      const auto now = std::chrono::steady_clock::now().time_since_epoch();
      const auto now_ns = static_cast<std::uint64_t>(
          std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
      const auto latency_ns = now_ns - stamp;

      shared.latency_sum_ns.fetch_add(latency_ns, std::memory_order_relaxed);
      shared.latency_samples.fetch_add(1U, std::memory_order_relaxed);

      auto current_max = shared.latency_max_ns.load(std::memory_order_relaxed);
      while (latency_ns > current_max &&
             !shared.latency_max_ns.compare_exchange_weak(
                 current_max, latency_ns, std::memory_order_relaxed,
                 std::memory_order_relaxed)) {
      }
    }
  }

  if (state.thread_index() == 0) {
    const auto samples = shared.latency_samples.load(std::memory_order_relaxed);
    if (samples > 0U) {
      const auto sum = shared.latency_sum_ns.load(std::memory_order_relaxed);
      state.counters["avg_latency_ns"] = benchmark::Counter(
          static_cast<double>(sum) / static_cast<double>(samples));
      state.counters["max_latency_ns"] = benchmark::Counter(static_cast<double>(
          shared.latency_max_ns.load(std::memory_order_relaxed)));
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(samples));
  }
  finalize_shared_queue(state, shared);
}

// Head event is only accepted by the last of `range(0)` patterns, so every
// rejected candidate pays for one rolled-back transaction.
void BM_expect_event_last_pattern_wins(benchmark::State &state) {
  null_sink sink;
  vg::oracle::adapter_directory adapters;
  vg::oracle::type_registry registry;
  vg::oracle::test_manager manager{sink, adapters, {}, registry};
  sensor device;
  const auto target = vg::oracle::instance_handle::of(device);
  const auto changed = vg::oracle::make_event<sensor, int>("changed");

  const auto pattern_count = static_cast<int>(state.range(0));
  std::vector<vg::oracle::expected_event> expected;
  expected.reserve(static_cast<std::size_t>(pattern_count));
  for (int index = 0; index < pattern_count; ++index) {
    auto pattern = vg::oracle::make_expected_event(
        changed, target,
        [&manager, index](int value) {
          return manager.assert_that(value == index, "reading matches");
        },
        registry);
    if (pattern.has_error()) {
      state.SkipWithError("pattern construction failed");
      return;
    }
    expected.push_back(std::move(pattern).value());
  }

  for (auto _ : state) {
    auto added = manager.add_event(changed, target,
                                   vg::oracle::make_arguments(pattern_count - 1));
    benchmark::DoNotOptimize(added);
    auto matched =
        manager.expect_event(std::chrono::milliseconds::zero(), true, expected);
    benchmark::DoNotOptimize(matched);
  }

  state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()));
}

BENCHMARK(BM_observation_queue_single_thread)->Arg(0)->Arg(1024);

BENCHMARK(BM_observation_queue_contended)
    ->Arg(65536)
    ->Threads(2)
    ->Threads(4)
    ->Threads(8);

BENCHMARK(BM_observation_queue_handoff_latency)->Arg(1024)->Threads(2);

BENCHMARK(BM_expect_event_last_pattern_wins)->Arg(1)->Arg(8)->Arg(64);

} // namespace

BENCHMARK_MAIN();
