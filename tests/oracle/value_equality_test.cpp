#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "support/sample_types.hpp"
#include "vg/oracle/reporting.hpp"
#include "vg/oracle/value.hpp"

namespace {

struct opaque {
  int id{0};
};

template <typename object_t>
concept handle_source = requires(object_t &object) {
  vg::oracle::instance_handle::of(object);
};

template <typename object_t>
concept adapter_source = requires(vg::oracle::adapter_directory &directory,
                                  object_t &object) { directory.add(object); };

} // namespace

TEST_CASE("boxed values describe and expose typed access",
          "[oracle][value][condition]") {
  const auto number = vg::oracle::boxed_value::of(5);
  REQUIRE_FALSE(number.empty());
  REQUIRE(number.type() == vg::oracle::make_type_id<int>());
  REQUIRE(number.describe() == "5");

  auto typed = number.as<int>();
  REQUIRE(typed.has_value());
  REQUIRE(typed->get() == 5);

  auto wrong = number.as<double>();
  REQUIRE(wrong.has_error());
  REQUIRE(wrong.error() == vg::core::errc::type_mismatch);

  REQUIRE(vg::oracle::boxed_value::of("door").describe() == "\"door\"");
  REQUIRE(vg::oracle::boxed_value::of(true).describe() == "true");
  REQUIRE(vg::oracle::boxed_value{}.describe() == "null");
  REQUIRE(vg::oracle::boxed_value::of(opaque{}).describe() == "<opaque>");

  const auto arguments = vg::oracle::make_arguments(1, std::string{"a"}, false);
  REQUIRE(vg::oracle::describe(arguments) == "1, \"a\", false");
}

TEST_CASE("equality compares nulls values and mismatched types",
          "[oracle][value][branch]") {
  const vg::oracle::boxed_value null_left;
  const vg::oracle::boxed_value null_right;
  REQUIRE(vg::oracle::equality(null_left, null_right).value());

  const auto five = vg::oracle::boxed_value::of(5);
  REQUIRE_FALSE(vg::oracle::equality(null_left, five).value());
  REQUIRE_FALSE(vg::oracle::equality(five, null_left).value());

  REQUIRE(vg::oracle::equality(five, vg::oracle::boxed_value::of(5)).value());
  REQUIRE_FALSE(
      vg::oracle::equality(five, vg::oracle::boxed_value::of(6)).value());

  auto mixed =
      vg::oracle::equality(five, vg::oracle::boxed_value::of(std::string{"5"}));
  REQUIRE(mixed.has_error());
  REQUIRE(mixed.error() == vg::core::errc::not_supported);

  auto incomparable = vg::oracle::equality(vg::oracle::boxed_value::of(opaque{}),
                                           vg::oracle::boxed_value::of(opaque{}));
  REQUIRE(incomparable.error() == vg::core::errc::not_supported);
}

TEST_CASE("instance handles compare by identity and check their type",
          "[oracle][value][extreme]") {
  vg::testing::thermostat first;
  vg::testing::thermostat second;

  const auto handle = vg::oracle::instance_handle::of(first);
  REQUIRE(handle);
  REQUIRE(handle == vg::oracle::instance_handle::of(first));
  REQUIRE_FALSE(handle == vg::oracle::instance_handle::of(second));
  REQUIRE(handle.type() ==
          vg::oracle::make_type_id<vg::testing::thermostat>());
  REQUIRE(handle.describe().rfind("thermostat@", 0) == 0U);

  auto typed = handle.as<vg::testing::thermostat>();
  REQUIRE(typed.has_value());
  typed->get().setpoint = 21;
  REQUIRE(first.setpoint == 21);

  REQUIRE(handle.as<vg::testing::door_adapter>().error() ==
          vg::core::errc::type_mismatch);

  const vg::oracle::instance_handle none;
  REQUIRE(none.empty());
  REQUIRE(none.describe() == "none");
  REQUIRE(none.as<vg::testing::thermostat>().error() ==
          vg::core::errc::type_mismatch);
}

TEST_CASE("instance handles refer only to mutable instances",
          "[oracle][value][boundary]") {
  STATIC_REQUIRE(handle_source<vg::testing::thermostat>);
  STATIC_REQUIRE_FALSE(handle_source<const vg::testing::thermostat>);
  STATIC_REQUIRE(adapter_source<vg::testing::door_adapter>);
  STATIC_REQUIRE_FALSE(adapter_source<const vg::testing::door_adapter>);

  vg::testing::door_adapter door;
  vg::oracle::adapter_directory directory;
  directory.add(door);
  auto found =
      directory.get_adapter(vg::oracle::make_type_id<vg::testing::door_adapter>());
  REQUIRE(found.has_value());
  REQUIRE(found->address() == static_cast<const void *>(&door));
  REQUIRE(found->as<vg::testing::door_adapter>().has_value());
}
