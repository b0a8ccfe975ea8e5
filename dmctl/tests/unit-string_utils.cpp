#include "doctest_compatibility.h"

#include "dmctl/string_utils.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

using namespace std::string_view_literals;

namespace {

template <std::size_t N>
auto to_bytes(const std::array<unsigned char, N>& raw) -> std::array<std::byte, N> {
  std::array<std::byte, N> out{};
  for (std::size_t i = 0; i < N; ++i) {
    out[i] = static_cast<std::byte>(raw[i]);
  }
  return out;
}

}  // namespace

TEST_CASE("Split test")
{
  SECTION("empty string view")
  {
    const auto tokens = dmctl::utils::split_keep_empty(""sv);
    REQUIRE_EQ(tokens.size(), 1);
    REQUIRE(tokens[0].empty());
  }
  SECTION("single delim string view")
  {
    const auto tokens = dmctl::utils::split_keep_empty(","sv, ',');
    REQUIRE_EQ(tokens.size(), 2);
    REQUIRE(tokens[0].empty());
    REQUIRE(tokens[1].empty());
  }
  SECTION("short string view")
  {
    static constexpr auto input = "1,22,333"sv;
    const auto tokens = dmctl::utils::split_keep_empty(input, ',');
    REQUIRE_EQ(input.data(), tokens[0].data());
    REQUIRE_EQ(tokens.size(), 3);
    REQUIRE_EQ(tokens[0], "1");
    REQUIRE_EQ(tokens[1], "22");
    REQUIRE_EQ(tokens[2], "333");
  }
  SECTION("empty lines are kept")
  {
    static constexpr auto input = "0 8 zero\n\n# comment\n8 8 error\n"sv;
    const auto tokens = dmctl::utils::split_keep_empty(input);
    REQUIRE_EQ(tokens.size(), 5);
    REQUIRE_EQ(tokens[0], "0 8 zero");
    REQUIRE(tokens[1].empty());
    REQUIRE_EQ(tokens[2], "# comment");
    REQUIRE_EQ(tokens[3], "8 8 error");
    REQUIRE(tokens[4].empty());
  }
}

TEST_CASE("trim test")
{
  SECTION("whitespace only")
  {
    REQUIRE(dmctl::utils::trim(" \t\n "sv).empty());
    REQUIRE(dmctl::utils::ltrim(""sv).empty());
    REQUIRE(dmctl::utils::rtrim("\n"sv).empty());
  }
  SECTION("both sides")
  {
    REQUIRE_EQ(dmctl::utils::ltrim("  8:16 0  "sv), "8:16 0  ");
    REQUIRE_EQ(dmctl::utils::rtrim("  8:16 0  "sv), "  8:16 0");
    REQUIRE_EQ(dmctl::utils::trim("\t8:16 0\r\n"sv), "8:16 0");
  }
  SECTION("inner whitespace is kept")
  {
    REQUIRE_EQ(dmctl::utils::trim(" 2 64 8:16 0 8:32 0 "sv), "2 64 8:16 0 8:32 0");
  }
}

TEST_CASE("utf8 lossy test")
{
  SECTION("ascii")
  {
    const auto bytes = to_bytes(std::array<unsigned char, 6>{'l', 'i', 'n', 'e', 'a', 'r'});
    REQUIRE_EQ(dmctl::utils::from_utf8_lossy(bytes), "linear");
  }
  SECTION("valid multibyte")
  {
    // "é" and "€"
    const auto bytes = to_bytes(std::array<unsigned char, 5>{0xC3, 0xA9, 0xE2, 0x82, 0xAC});
    REQUIRE_EQ(dmctl::utils::from_utf8_lossy(bytes), "\xC3\xA9\xE2\x82\xAC");
  }
  SECTION("invalid lead byte")
  {
    const auto bytes = to_bytes(std::array<unsigned char, 3>{'a', 0xFF, 'b'});
    REQUIRE_EQ(dmctl::utils::from_utf8_lossy(bytes), "a\xEF\xBF\xBD"
                                                     "b");
  }
  SECTION("truncated sequence")
  {
    const auto bytes = to_bytes(std::array<unsigned char, 3>{0xE2, 0x82, 'x'});
    REQUIRE_EQ(dmctl::utils::from_utf8_lossy(bytes), "\xEF\xBF\xBDx");
  }
  SECTION("surrogates are rejected")
  {
    const auto bytes = to_bytes(std::array<unsigned char, 3>{0xED, 0xA0, 0x80});
    REQUIRE_EQ(dmctl::utils::from_utf8_lossy(bytes), "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
  }
  SECTION("sequence cut at the end")
  {
    const auto bytes = to_bytes(std::array<unsigned char, 2>{'a', 0xC3});
    REQUIRE_EQ(dmctl::utils::from_utf8_lossy(bytes), "a\xEF\xBF\xBD");
  }
}
