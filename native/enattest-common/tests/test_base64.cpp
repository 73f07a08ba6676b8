#include <catch2/catch.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <enattest/common/base64.h>

namespace {

std::vector<std::uint8_t> Bytes(std::string_view s) {
  return std::vector<std::uint8_t>(s.begin(), s.end());
}

} // namespace

TEST_CASE("Base64Encode pads to a multiple of four") {
  REQUIRE(enattest::common::Base64Encode(Bytes("")).empty());
  REQUIRE(enattest::common::Base64Encode(Bytes("f")) == "Zg==");
  REQUIRE(enattest::common::Base64Encode(Bytes("fo")) == "Zm8=");
  REQUIRE(enattest::common::Base64Encode(Bytes("foo")) == "Zm9v");
  REQUIRE(enattest::common::Base64Encode(std::vector<std::uint8_t>{0xfb, 0xff}) == "+/8=");
}

TEST_CASE("Base64UrlEncode uses the URL-safe alphabet without padding") {
  REQUIRE(enattest::common::Base64UrlEncode(std::vector<std::uint8_t>{0xfb, 0xff}) == "-_8");
  REQUIRE(enattest::common::Base64UrlEncode(std::string_view("f")) == "Zg");
}

TEST_CASE("Base64Decode is strict") {
  REQUIRE(enattest::common::Base64Decode("Zm9v") == Bytes("foo"));
  REQUIRE(enattest::common::Base64Decode("Zg==") == Bytes("f"));
  REQUIRE(enattest::common::Base64Decode("") == Bytes(""));

  REQUIRE_FALSE(enattest::common::Base64Decode("Zg").has_value());
  REQUIRE_FALSE(enattest::common::Base64Decode("Zg=").has_value());
  REQUIRE_FALSE(enattest::common::Base64Decode("Z===").has_value());
  REQUIRE_FALSE(enattest::common::Base64Decode("Zg==Zg==").has_value());
  REQUIRE_FALSE(enattest::common::Base64Decode("-_8=").has_value());
  REQUIRE_FALSE(enattest::common::Base64Decode("Zm9v\n").has_value());
}

TEST_CASE("Base64UrlDecode accepts both alphabets with optional padding") {
  const std::vector<std::uint8_t> expected{0xfb, 0xff};
  REQUIRE(enattest::common::Base64UrlDecode("-_8") == expected);
  REQUIRE(enattest::common::Base64UrlDecode("-_8=") == expected);
  REQUIRE(enattest::common::Base64UrlDecode("+/8=") == expected);
  REQUIRE(enattest::common::Base64UrlDecode("Zm9v") == Bytes("foo"));

  REQUIRE_FALSE(enattest::common::Base64UrlDecode("Z").has_value());
  REQUIRE_FALSE(enattest::common::Base64UrlDecode("Zm9v.").has_value());
  REQUIRE_FALSE(enattest::common::Base64UrlDecode("Zm 9v").has_value());
}
