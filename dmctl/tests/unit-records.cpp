#include "doctest_compatibility.h"

#include "dmctl/layout.hpp"
#include "dmctl/records.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>
#include <vector>

#include <fmt/format.h>

using namespace std::string_view_literals;

namespace layout = dmctl::layout;

namespace {

// Zeroed reply payload with helpers to place fields at fixed offsets.
struct PayloadBuilder {
  std::vector<std::byte> bytes;

  explicit PayloadBuilder(std::size_t size)
    : bytes(size, std::byte{0}) { }

  template <typename T>
  auto put(std::size_t offset, T value) -> PayloadBuilder& {
    layout::store(std::span{bytes}, offset, value);
    return *this;
  }
  auto put_string(std::size_t offset, std::string_view str) -> PayloadBuilder& {
    std::memcpy(bytes.data() + offset, str.data(), str.size());
    return *this;
  }
};

auto make_line(std::uint64_t start, std::uint64_t length, std::string_view type, std::string_view params) -> dmctl::TargetLine {
  return dmctl::TargetLine{
      .start       = dmctl::Sectors{start},
      .length      = dmctl::Sectors{length},
      .target_type = *dmctl::TargetType::create(type),
      .params      = std::string{params},
  };
}

}  // namespace

TEST_CASE("name list test")
{
  const auto dev_a = dmctl::Device{.major = 253, .minor = 0}.to_dev_t();
  const auto dev_b = dmctl::Device{.major = 253, .minor = 1}.to_dev_t();

  SECTION("empty payload")
  {
    REQUIRE(dmctl::records::parse_name_list({}, 48).empty());
  }
  SECTION("event numbers after the name")
  {
    PayloadBuilder payload{44};
    payload.put<std::uint64_t>(0, dev_a).put<std::uint32_t>(8, 24).put_string(12, "a"sv).put<std::uint32_t>(16, 5);
    payload.put<std::uint64_t>(24, dev_b).put<std::uint32_t>(32, 0).put_string(36, "bb"sv).put<std::uint32_t>(40, 9);

    const auto devices = dmctl::records::parse_name_list(payload.bytes, 48);
    REQUIRE_EQ(devices.size(), 2);
    REQUIRE_EQ(devices[0].name.as_string_view(), "a");
    REQUIRE_EQ(devices[0].device, (dmctl::Device{.major = 253, .minor = 0}));
    REQUIRE_EQ(devices[0].event_nr, 5u);
    REQUIRE_EQ(devices[1].name.as_string_view(), "bb");
    REQUIRE_EQ(devices[1].device.minor, 1);
    REQUIRE_EQ(devices[1].event_nr, 9u);
    REQUIRE_EQ(fmt::format("{}", devices[1]), "bb\t(253:1)\tevent 9");
  }
  SECTION("interface 4.36 places event numbers further out")
  {
    PayloadBuilder payload{40};
    payload.put<std::uint64_t>(0, dev_a).put<std::uint32_t>(8, 0).put_string(12, "a"sv);
    payload.put<std::uint32_t>(16, 111).put<std::uint32_t>(32, 3);

    const auto devices = dmctl::records::parse_name_list(payload.bytes, 36);
    REQUIRE_EQ(devices.size(), 1);
    REQUIRE_EQ(devices[0].event_nr, 3u);
  }
  SECTION("older interfaces carry no event numbers")
  {
    PayloadBuilder payload{16};
    payload.put<std::uint64_t>(0, dev_b).put<std::uint32_t>(8, 0).put_string(12, "x"sv);

    const auto devices = dmctl::records::parse_name_list(payload.bytes, 35);
    REQUIRE_EQ(devices.size(), 1);
    REQUIRE_EQ(devices[0].name.as_string_view(), "x");
    REQUIRE_FALSE(devices[0].event_nr.has_value());
    REQUIRE_EQ(fmt::format("{}", devices[0]), "x\t(253:1)");
  }
}

TEST_CASE("target versions test")
{
  SECTION("empty payload")
  {
    REQUIRE(dmctl::records::parse_target_versions({}).empty());
  }
  SECTION("two records")
  {
    PayloadBuilder payload{48};
    payload.put<std::uint32_t>(0, 24).put<std::uint32_t>(4, 1).put<std::uint32_t>(8, 4).put<std::uint32_t>(12, 0);
    payload.put_string(16, "linear"sv);
    payload.put<std::uint32_t>(24, 0).put<std::uint32_t>(28, 1).put<std::uint32_t>(32, 6).put<std::uint32_t>(36, 2);
    payload.put_string(40, "striped"sv);

    const auto targets = dmctl::records::parse_target_versions(payload.bytes);
    REQUIRE_EQ(targets.size(), 2);
    REQUIRE_EQ(targets[0].name, "linear");
    REQUIRE_EQ(targets[0].version, (dmctl::Version{1, 4, 0}));
    REQUIRE_EQ(targets[1].name, "striped");
    REQUIRE_EQ(fmt::format("{}", targets[1].version), "1.6.2");
  }
}

TEST_CASE("target deps test")
{
  SECTION("no table")
  {
    REQUIRE(dmctl::records::parse_target_deps({}).empty());
  }
  SECTION("no dependencies")
  {
    PayloadBuilder payload{8};
    REQUIRE(dmctl::records::parse_target_deps(payload.bytes).empty());
  }
  SECTION("kdev_t slots")
  {
    const auto sda = *dmctl::Device{.major = 8, .minor = 16}.to_kdev_t();
    const auto big = *dmctl::Device{.major = 259, .minor = 300}.to_kdev_t();

    PayloadBuilder payload{24};
    payload.put<std::uint32_t>(0, 2).put<std::uint64_t>(8, sda).put<std::uint64_t>(16, big);

    const auto devices = dmctl::records::parse_target_deps(payload.bytes);
    REQUIRE_EQ(devices.size(), 2);
    REQUIRE_EQ(devices[0], (dmctl::Device{.major = 8, .minor = 16}));
    REQUIRE_EQ(devices[1], (dmctl::Device{.major = 259, .minor = 300}));
  }
}

TEST_CASE("table status test")
{
  SECTION("empty payload")
  {
    REQUIRE(dmctl::records::parse_table_status(0, {}).empty());
  }
  SECTION("next is counted from the first record")
  {
    PayloadBuilder payload{48 + 48};
    payload.put<std::uint64_t>(0, 0).put<std::uint64_t>(8, 2048).put<std::uint32_t>(20, 48);
    payload.put_string(24, "linear"sv).put_string(40, "8:16 0 "sv);
    payload.put<std::uint64_t>(48, 2048).put<std::uint64_t>(56, 1024).put<std::uint32_t>(68, 0);
    payload.put_string(72, "zero"sv);

    const auto targets = dmctl::records::parse_table_status(2, payload.bytes);
    REQUIRE_EQ(targets.size(), 2);
    REQUIRE_EQ(targets[0], make_line(0, 2048, "linear", "8:16 0"));
    REQUIRE_EQ(targets[1], make_line(2048, 1024, "zero", ""));
  }
}

TEST_CASE("request payload test")
{
  SECTION("table load records are padded to 8 bytes")
  {
    const std::vector<dmctl::TargetLine> targets{
        make_line(0, 2048, "linear", "8:16 0"),
        make_line(2048, 8, "zero", ""),
    };
    const auto payload = dmctl::records::build_table_payload(targets);
    REQUIRE_EQ(payload.size(), 96);

    const auto first = layout::decode_target_spec(payload);
    REQUIRE_EQ(first.length, 2048);
    REQUIRE_EQ(first.next, 48);
    REQUIRE_EQ(layout::field_to_string_view(first.target_type), "linear");
    REQUIRE_EQ(static_cast<char>(payload[40]), '8');
    REQUIRE_EQ(payload[46], std::byte{0});

    const auto second = layout::decode_target_spec(std::span{payload}.subspan(48));
    REQUIRE_EQ(second.sector_start, 2048);
    REQUIRE_EQ(second.next, 48);
    REQUIRE_EQ(layout::field_to_string_view(second.target_type), "zero");
  }
  SECTION("no targets")
  {
    REQUIRE(dmctl::records::build_table_payload({}).empty());
  }
  SECTION("rename")
  {
    const auto payload = dmctl::records::build_rename_payload("new-name"sv);
    REQUIRE_EQ(payload.size(), 9);
    REQUIRE_EQ(payload.back(), std::byte{0});
  }
  SECTION("target message")
  {
    const auto any_sector = dmctl::records::build_message_payload(std::nullopt, "ping"sv);
    REQUIRE_EQ(any_sector.size(), 13);
    REQUIRE_EQ(layout::load<std::uint64_t>(any_sector, layout::target_msg::SECTOR), 0);
    REQUIRE_EQ(static_cast<char>(any_sector[8]), 'p');
    REQUIRE_EQ(any_sector.back(), std::byte{0});

    const auto with_sector = dmctl::records::build_message_payload(dmctl::Sectors{4096}, "create_thin 0"sv);
    REQUIRE_EQ(layout::load<std::uint64_t>(with_sector, layout::target_msg::SECTOR), 4096);
  }
}
