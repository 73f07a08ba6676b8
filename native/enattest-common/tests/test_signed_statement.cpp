#include <catch2/catch.hpp>

#include <string>
#include <string_view>

#include <enattest/common/signed_statement.h>

namespace {

using enattest::common::Base64UrlEncode;
using enattest::common::ParsedSignedStatement;
using enattest::common::ParseSignedStatement;
using enattest::common::StatementParseStatus;

std::string Compact(std::string_view header, std::string_view payload, std::string_view sig = "sig") {
  return Base64UrlEncode(header) + "." + Base64UrlEncode(payload) + "." + Base64UrlEncode(sig);
}

} // namespace

TEST_CASE("ParseSignedStatement keeps the encoded segments and decodes the rest") {
  const std::string raw = Compact(R"({"alg":"ES256","x5c":["AQID","BAU="]})", R"({"a":1})", "\x01\x02");

  ParsedSignedStatement parsed;
  std::string error;
  REQUIRE(ParseSignedStatement(raw, parsed, &error) == StatementParseStatus::kOk);
  REQUIRE(error.empty());

  REQUIRE(parsed.alg == "ES256");
  REQUIRE(parsed.payload_json == R"({"a":1})");
  REQUIRE(parsed.signature == std::vector<std::uint8_t>{0x01, 0x02});
  REQUIRE(parsed.certificate_chain_der.size() == 2);
  REQUIRE(parsed.certificate_chain_der[0] == std::vector<std::uint8_t>{0x01, 0x02, 0x03});
  REQUIRE(parsed.certificate_chain_der[1] == std::vector<std::uint8_t>{0x04, 0x05});
  REQUIRE(parsed.SigningInput() == parsed.header_segment + "." + parsed.payload_segment);
  REQUIRE(raw == parsed.SigningInput() + "." + parsed.signature_segment);
}

TEST_CASE("ParseSignedStatement accepts padded segments") {
  const std::string header = Base64UrlEncode(std::string_view(R"({"alg":"RS256","x5c":["AQID"]})"));
  const std::string raw = header + "=." + Base64UrlEncode(std::string_view("{}")) + "." + "c2ln";

  ParsedSignedStatement parsed;
  REQUIRE(ParseSignedStatement(raw, parsed) == StatementParseStatus::kOk);
  REQUIRE(parsed.header_segment == header + "=");
}

TEST_CASE("ParseSignedStatement distinguishes a missing chain from malformed input") {
  ParsedSignedStatement parsed;
  std::string error;

  REQUIRE(ParseSignedStatement(Compact(R"({"alg":"RS256"})", "{}"), parsed, &error) ==
          StatementParseStatus::kMissingCertificateChain);
  REQUIRE(parsed.alg == "RS256");

  REQUIRE(ParseSignedStatement(Compact(R"({"alg":"RS256","x5c":{}})", "{}"), parsed, &error) ==
          StatementParseStatus::kMalformed);
  REQUIRE(error == "header x5c is not an array");

  REQUIRE(ParseSignedStatement(Compact(R"({"alg":"","x5c":["AQID"]})", "{}"), parsed, &error) ==
          StatementParseStatus::kMalformed);
  REQUIRE(error == "header has no alg");

  REQUIRE(ParseSignedStatement(Compact(R"({"alg":"RS256","x5c":["AQID"]})", "\"text\""), parsed, &error) ==
          StatementParseStatus::kMalformed);
  REQUIRE(error == "payload is not a JSON object");

  REQUIRE(ParseSignedStatement("a.b", parsed, &error) == StatementParseStatus::kMalformed);
  REQUIRE(error == "expected 3 dot-separated segments, got 2");
}
