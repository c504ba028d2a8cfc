#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "support/manager_fixture.hpp"
#include "vg/oracle/expected.hpp"
#include "vg/oracle/reporting.hpp"
#include "vg/oracle/test_manager.hpp"

using namespace std::chrono_literals;

TEST_CASE("add_event and add_return validate the member kind",
          "[oracle][manager][condition]") {
  vg::testing::manager_fixture fixture;
  auto &manager = fixture.manager;

  REQUIRE(manager
              .add_event(fixture.members.read_pair, fixture.device_handle(),
                         {})
              .error() == vg::core::errc::invalid_argument);
  REQUIRE(manager
              .add_return(fixture.members.changed, fixture.device_handle(),
                          {})
              .error() == vg::core::errc::invalid_argument);
  REQUIRE(manager.add_event(nullptr, {}, {}).error() ==
          vg::core::errc::invalid_argument);
  REQUIRE(manager.add_return(fixture.members.reset, {}, {}).has_value());
  REQUIRE(manager.return_count() == 1U);
  REQUIRE(manager.event_count() == 0U);
}

TEST_CASE("queue limits come from the manager options",
          "[oracle][manager][boundary]") {
  vg::oracle::test_manager_options options;
  options.max_event_queue_size = 1U;
  vg::testing::manager_fixture fixture{options};
  auto &manager = fixture.manager;

  REQUIRE(manager
              .add_event(fixture.members.changed, fixture.device_handle(),
                         vg::oracle::make_arguments(1))
              .has_value());
  REQUIRE(manager
              .add_event(fixture.members.changed, fixture.device_handle(),
                         vg::oracle::make_arguments(2))
              .error() == vg::core::errc::queue_full);
  REQUIRE(manager.event_count() == 1U);
  REQUIRE(manager.event_queue().capacity() == 1U);
  REQUIRE(manager.return_queue().capacity() == 0U);
}

TEST_CASE("notify routes through subscriptions", "[oracle][manager][branch]") {
  vg::testing::manager_fixture fixture;
  auto &manager = fixture.manager;
  const auto target = fixture.device_handle();

  REQUIRE(manager
              .notify(fixture.members.changed, target,
                      vg::oracle::make_arguments(3))
              .error() == vg::core::errc::not_found);

  REQUIRE(manager.subscribe(fixture.members.changed, target).has_value());
  REQUIRE(manager
              .notify(fixture.members.changed, target,
                      vg::oracle::make_arguments(3))
              .has_value());
  REQUIRE(manager.event_count() == 1U);

  // Re-subscribing replaces the handler.
  REQUIRE(manager
              .subscribe(fixture.members.changed, target,
                         [](vg::oracle::test_manager &owner,
                            const vg::oracle::member_ptr &member,
                            const vg::oracle::instance_handle &source,
                            const vg::oracle::argument_list &arguments) {
                           const auto *value = arguments.front().get_if<int>();
                           return owner.add_event(
                               member, source,
                               vg::oracle::make_arguments(*value * 10));
                         })
              .has_value());
  REQUIRE(manager
              .notify(fixture.members.changed, target,
                      vg::oracle::make_arguments(4))
              .has_value());
  const auto queued = manager.event_queue().snapshot();
  REQUIRE(queued.size() == 2U);
  REQUIRE(*queued.back().arguments.front().get_if<int>() == 40);

  REQUIRE(manager
              .unsubscribe(fixture.members.changed,
                           vg::oracle::make_type_id<vg::testing::thermostat>())
              .has_value());
  REQUIRE(manager
              .unsubscribe(fixture.members.changed,
                           vg::oracle::make_type_id<vg::testing::thermostat>())
              .error() == vg::core::errc::not_found);
  REQUIRE(manager
              .notify(fixture.members.changed, target,
                      vg::oracle::make_arguments(5))
              .error() == vg::core::errc::not_found);
  REQUIRE(manager.subscribe(fixture.members.read_pair, target).error() ==
          vg::core::errc::invalid_argument);
}

TEST_CASE("notify accepts concurrent producers", "[oracle][manager][extreme]") {
  vg::testing::manager_fixture fixture;
  auto &manager = fixture.manager;
  const auto target = fixture.device_handle();
  REQUIRE(manager.subscribe(fixture.members.changed, target).has_value());

  constexpr int producers = 4;
  constexpr int per_producer = 250;
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int producer = 0; producer < producers; ++producer) {
    threads.emplace_back([&, producer]() {
      for (int index = 0; index < per_producer; ++index) {
        auto notified =
            manager.notify(fixture.members.changed, target,
                           vg::oracle::make_arguments(producer * 1000 + index));
        if (notified.has_error()) {
          failures.fetch_add(1, std::memory_order_relaxed);
        }
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  REQUIRE(failures.load() == 0);
  REQUIRE(manager.event_count() ==
          static_cast<std::size_t>(producers * per_producer));
}

TEST_CASE("check_observation_timeout passes only in a quiet accepting state",
          "[oracle][manager][condition]") {
  vg::testing::manager_fixture fixture;
  auto &manager = fixture.manager;
  const std::vector<vg::oracle::expected_event> expected{
      vg::oracle::make_expected_event(fixture.members.changed)};

  REQUIRE(manager.check_observation_timeout(true, expected).has_value());
  REQUIRE(fixture.sink.records ==
          std::vector<std::string>{
              "comment: Observation timeout while expecting events:\n"
              "\tevent thermostat.changed(int)\n"});

  REQUIRE(manager.check_observation_timeout(false, expected).has_value());
  REQUIRE(fixture.sink.failed_asserts == 1U);
  REQUIRE(manager.last_failure() ==
          "Expected event didn't come within configured timeout.\n"
          "Expected events:\n"
          "\tevent thermostat.changed(int)\n"
          "Observed events:\n");

  REQUIRE(manager.add_event(fixture.members.changed, {},
                            vg::oracle::make_arguments(9))
              .has_value());
  REQUIRE(manager.check_observation_timeout(true, expected).has_value());
  REQUIRE(fixture.sink.failed_asserts == 2U);
  REQUIRE(manager.last_failure().find("Observed events:\n"
                                      "\tevent thermostat.changed(9)\n") !=
          std::string::npos);
  REQUIRE(manager.event_count() == 1U);
}

TEST_CASE("raise policy returns failures instead of reporting them",
          "[oracle][manager][branch]") {
  vg::oracle::test_manager_options options;
  options.policy = vg::oracle::failure_policy::raise;
  vg::testing::manager_fixture fixture{options};
  auto &manager = fixture.manager;

  auto timed_out = manager.expect_event(
      1ms, true, {vg::oracle::make_expected_event(fixture.members.changed)});
  REQUIRE(timed_out.error() == vg::core::errc::test_failure);
  REQUIRE(manager.last_failure().rfind("Event must occur within 1ms", 0) ==
          0U);

  auto asserted = manager.assert_that(false, "door closed");
  REQUIRE(asserted.error() == vg::core::errc::test_failure);
  REQUIRE(manager.last_failure() == "door closed");

  REQUIRE(manager.assert_that(true, "door open").has_value());
  REQUIRE(fixture.sink.records ==
          std::vector<std::string>{"assert pass: door open"});
}

TEST_CASE("reporting calls are buffered inside a transaction",
          "[oracle][manager][condition]") {
  vg::testing::manager_fixture fixture;
  auto &manager = fixture.manager;

  REQUIRE(manager.begin_test("heating").has_value());
  REQUIRE(manager.begin_transaction().has_value());
  REQUIRE(manager.begin_transaction().error() ==
          vg::core::errc::invalid_state);
  REQUIRE(manager.in_transaction());
  REQUIRE(manager.begin_test("nested").has_value());
  REQUIRE(manager.checkpoint("warming").has_value());
  REQUIRE(manager.comment("setpoint 21").has_value());
  REQUIRE(manager.assume(true, "power on").has_value());
  REQUIRE(manager.end_test().has_value());
  REQUIRE(fixture.sink.records ==
          std::vector<std::string>{"begin test: heating"});

  REQUIRE(manager.end_transaction(true).has_value());
  REQUIRE_FALSE(manager.in_transaction());
  REQUIRE(manager.end_test().has_value());
  REQUIRE(fixture.sink.records ==
          std::vector<std::string>{
              "begin test: heating", "checkpoint: Begin Test: nested",
              "checkpoint: warming", "comment: setpoint 21",
              "assume pass: power on", "checkpoint: End Test.", "end test"});

  REQUIRE(manager.end_transaction(false).error() ==
          vg::core::errc::invalid_state);
}

TEST_CASE("rolled back transactions report nothing",
          "[oracle][manager][branch]") {
  vg::testing::manager_fixture fixture;
  auto &manager = fixture.manager;
  auto reading = manager.create_variable<int>("reading");

  REQUIRE(manager.begin_transaction().has_value());
  REQUIRE(reading->bind(21).has_value());
  REQUIRE(manager.assert_that(false, "too cold").error() ==
          vg::core::errc::transaction_failed);
  REQUIRE(manager.end_transaction(false).has_value());

  REQUIRE(fixture.sink.records.empty());
  REQUIRE_FALSE(reading->is_bound());
  REQUIRE(reading->value().error() == vg::core::errc::not_bound);
}

TEST_CASE("adapters resolve through the provider", "[oracle][manager][branch]") {
  vg::testing::manager_fixture fixture;
  auto &manager = fixture.manager;
  vg::testing::door_adapter door;
  fixture.adapters.add(door);

  auto typed = manager.get_adapter<vg::testing::door_adapter>();
  REQUIRE(typed.has_value());
  REQUIRE(&typed->get() == &door);

  auto handle =
      manager.get_adapter(vg::oracle::make_type_id<vg::testing::door_adapter>());
  REQUIRE(handle.has_value());
  REQUIRE(handle->address() == &door);

  REQUIRE(manager.get_adapter<vg::testing::thermostat>().error() ==
          vg::core::errc::not_found);
}

TEST_CASE("generate_value yields the default instance",
          "[oracle][manager][boundary]") {
  vg::testing::manager_fixture fixture;
  auto &manager = fixture.manager;

  REQUIRE(manager.generate_value<int>() == 0);
  REQUIRE(manager.generate_value<std::string>().empty());
  REQUIRE(manager.generate_value<vg::testing::thermostat>().setpoint == 0);
  REQUIRE(manager.generate_value<const std::string &>().empty());
}

TEST_CASE("console sink writes tagged lines and counts failures",
          "[oracle][reporting][condition]") {
  std::ostringstream stream;
  vg::oracle::console_reporting_sink sink{stream};

  REQUIRE(sink.begin_test("heating").has_value());
  REQUIRE(sink.begin_test("again").error() == vg::core::errc::invalid_state);
  REQUIRE(sink.assert_that(true, "door open").has_value());
  REQUIRE(sink.assert_that(false, "door closed").has_value());
  REQUIRE(sink.assume(false, "power on").has_value());
  REQUIRE(sink.checkpoint("warming").has_value());
  REQUIRE(sink.comment("setpoint 21").has_value());
  REQUIRE(sink.end_test().has_value());
  REQUIRE(sink.end_test().error() == vg::core::errc::invalid_state);

  REQUIRE(sink.failure_count() == 1U);
  REQUIRE(stream.str() == "[test] begin heating\n"
                          "[pass] door open\n"
                          "[fail] door closed\n"
                          "[assume] violated: power on\n"
                          "[checkpoint] warming\n"
                          "[comment] setpoint 21\n"
                          "[test] end heating (1 failed)\n");
}

TEST_CASE("manager drives the console sink end to end",
          "[oracle][reporting][condition]") {
  std::ostringstream stream;
  vg::oracle::console_reporting_sink sink{stream};
  vg::oracle::adapter_directory adapters;
  vg::oracle::type_registry registry;
  vg::testing::thermostat_members members;
  vg::oracle::test_manager manager{sink, adapters, {}, registry};

  REQUIRE(manager.begin_test("no events").has_value());
  auto matched = manager.expect_event(
      0ms, true, {vg::oracle::make_expected_event(members.changed)});
  REQUIRE(matched.value() == -1);
  REQUIRE(manager.end_test().has_value());

  REQUIRE(sink.failure_count() == 1U);
  REQUIRE(stream.str().find("[fail] Event must occur within 0ms\n") !=
          std::string::npos);
}
