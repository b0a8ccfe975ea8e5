#include "doctest_compatibility.h"

#include "dmctl/device.hpp"
#include "dmctl/types.hpp"

#include <string>
#include <string_view>
#include <variant>

#include <fmt/format.h>

using namespace std::string_view_literals;

TEST_CASE("identifier test")
{
  SECTION("names")
  {
    const auto name = dmctl::DmName::create("vg0-root");
    REQUIRE(name.has_value());
    REQUIRE_EQ(name->as_string_view(), "vg0-root"sv);
    REQUIRE_EQ(name->size(), 8);
    REQUIRE_EQ(fmt::format("{}", *name), "vg0-root");
  }
  SECTION("empty is rejected")
  {
    const auto name = dmctl::DmName::create("");
    REQUIRE_FALSE(name.has_value());
    REQUIRE_EQ(name.error().kind, dmctl::ErrorKind::InvalidArgument);
    REQUIRE_EQ(name.error().message, "device name must not be empty");
    REQUIRE_FALSE(name.error().info.has_value());
  }
  SECTION("length limits")
  {
    REQUIRE(dmctl::DmName::create(std::string(127, 'n')).has_value());
    REQUIRE_FALSE(dmctl::DmName::create(std::string(128, 'n')).has_value());
    REQUIRE(dmctl::DmUuid::create(std::string(128, 'u')).has_value());

    const auto uuid = dmctl::DmUuid::create(std::string(129, 'u'));
    REQUIRE_FALSE(uuid.has_value());
    REQUIRE_EQ(uuid.error().message, "device uuid is 129 bytes, the limit is 128");

    REQUIRE(dmctl::TargetType::create("thin-pool").has_value());
    REQUIRE(dmctl::TargetType::create(std::string(15, 't')).has_value());
    REQUIRE_FALSE(dmctl::TargetType::create(std::string(16, 't')).has_value());
  }
  SECTION("embedded NUL is rejected")
  {
    const auto name = dmctl::DmName::create("bad\0name"sv);
    REQUIRE_FALSE(name.has_value());
    REQUIRE_EQ(name.error().message, "device name contains a NUL byte");
  }
  SECTION("ordering")
  {
    REQUIRE(*dmctl::DmName::create("a") < *dmctl::DmName::create("b"));
    REQUIRE(*dmctl::DmName::create("same") == *dmctl::DmName::create("same"));
  }
  SECTION("dev id formatting")
  {
    const dmctl::DevId by_name{*dmctl::DmName::create("data")};
    const dmctl::DevId by_uuid{*dmctl::DmUuid::create("LVM-1234")};
    REQUIRE_EQ(fmt::format("{}", by_name), "name 'data'");
    REQUIRE_EQ(fmt::format("{}", by_uuid), "uuid 'LVM-1234'");
    REQUIRE(std::holds_alternative<dmctl::DmUuid>(by_uuid));
  }
  SECTION("target line")
  {
    const dmctl::TargetLine line{
        .start       = dmctl::Sectors{0},
        .length      = dmctl::Sectors{2048},
        .target_type = *dmctl::TargetType::create("linear"),
        .params      = "8:16 0",
    };
    REQUIRE_EQ(fmt::format("{}", line), "(start:0, length:2048, type:'linear', params:'8:16 0')");
  }
}

TEST_CASE("device number test")
{
  SECTION("kdev_t round trip")
  {
    static constexpr dmctl::Device dev{.major = 253, .minor = 0x12345};
    const auto packed = dev.to_kdev_t();
    REQUIRE(packed.has_value());
    REQUIRE_EQ(*packed, 0x1230fd45u);
    REQUIRE_EQ(dmctl::Device::from_kdev_t(*packed), dev);
  }
  SECTION("kdev_t out of range")
  {
    REQUIRE_FALSE((dmctl::Device{.major = 0x1000, .minor = 0}).to_kdev_t().has_value());
    REQUIRE_FALSE((dmctl::Device{.major = 8, .minor = 0x100000}).to_kdev_t().has_value());
  }
  SECTION("dev_t round trip")
  {
    static constexpr dmctl::Device dev{.major = 259, .minor = 1048575};
    REQUIRE_EQ(dmctl::Device::from_dev_t(dev.to_dev_t()), dev);
    REQUIRE_EQ(dmctl::Device::from_dev_t((dmctl::Device{.major = 8, .minor = 16}).to_dev_t()).minor, 16);
  }
  SECTION("formatting")
  {
    REQUIRE_EQ(fmt::format("{}", dmctl::Device{.major = 253, .minor = 3}), "253:3");
  }
}
