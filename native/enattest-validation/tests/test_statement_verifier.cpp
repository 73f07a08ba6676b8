// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file test_statement_verifier.cpp
 * @brief Parsing and signature verification of compact signed statements.
 */

#include <catch2/catch.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include <enattest/common/base64.h>
#include <enattest/common/signed_statement.h>

#include "enattest/validation/statement_verifier.h"
#include "test_utils.h"

namespace {

using enattest::common::ParsedSignedStatement;
using enattest::validation::ErrorCode;
using enattest::validation::JwsAlgorithm;
using enattest::validation::ParseStatement;
using enattest::validation::SignatureVerifyOptions;
using enattest::validation::VerifyStatementSignature;

constexpr const char* kPayload = R"({"nonce":"bm9uY2U=","timestampMs":1589154006495})";

std::vector<std::uint8_t> AnyCertDer() {
  static const std::vector<std::uint8_t> der = [] {
    auto key = enattest::tests::GenerateEcP256Key();
    const auto now = std::chrono::system_clock::now();
    auto cert = enattest::tests::IssueCertificate(
        {"any", {}, 1, now - std::chrono::hours(1), now + std::chrono::hours(1), false}, key.get(), nullptr, nullptr);
    return enattest::tests::CertificateDer(cert.get());
  }();
  return der;
}

ParsedSignedStatement MustParse(const std::string& raw) {
  ParsedSignedStatement parsed;
  auto r = ParseStatement("Sig", raw, parsed);
  REQUIRE(r.is_valid);
  return parsed;
}

} // namespace

TEST_CASE("ParseStatement exposes header, payload and chain") {
  auto key = enattest::tests::GenerateRsaKey(2048);
  const auto raw = enattest::tests::MakeSignedStatement("RS256", {AnyCertDer()}, kPayload, key.get());

  ParsedSignedStatement parsed;
  auto r = ParseStatement("Sig", raw, parsed);
  REQUIRE(r.is_valid);
  REQUIRE(parsed.alg == "RS256");
  REQUIRE(parsed.payload_json == kPayload);
  REQUIRE(parsed.certificate_chain_der.size() == 1);
  REQUIRE(parsed.certificate_chain_der[0] == AnyCertDer());
  REQUIRE(r.metadata.at("x5c.length") == "1");
  REQUIRE(parsed.SigningInput() == raw.substr(0, raw.rfind('.')));
}

TEST_CASE("ParseStatement rejects structural damage as MalformedStatement") {
  const std::string header = enattest::common::Base64UrlEncode(std::string_view(R"({"alg":"RS256","x5c":[]})"));
  const std::string payload = enattest::common::Base64UrlEncode(std::string_view(kPayload));
  const std::string sig = enattest::common::Base64UrlEncode(std::string_view("sig"));

  const std::vector<std::string> bad = {
      "",
      "abc",
      header + "." + payload,
      header + "." + payload + "." + sig + ".extra",
      header + ".." + sig,
      header + "." + payload + ".",
      "!!!." + payload + "." + sig,
      enattest::common::Base64UrlEncode(std::string_view("not json")) + "." + payload + "." + sig,
      enattest::common::Base64UrlEncode(std::string_view("[1,2]")) + "." + payload + "." + sig,
      header + "." + enattest::common::Base64UrlEncode(std::string_view("{")) + "." + sig,
      enattest::common::Base64UrlEncode(std::string_view(R"({"x5c":["AA=="]})")) + "." + payload + "." + sig,
      enattest::common::Base64UrlEncode(std::string_view(R"({"alg":7,"x5c":["AA=="]})")) + "." + payload + "." + sig,
      enattest::common::Base64UrlEncode(std::string_view(R"({"alg":"RS256","x5c":"AA=="})")) + "." + payload + "." + sig,
      enattest::common::Base64UrlEncode(std::string_view(R"({"alg":"RS256","x5c":[5]})")) + "." + payload + "." + sig,
      enattest::common::Base64UrlEncode(std::string_view(R"({"alg":"RS256","x5c":["*not base64*"]})")) + "." + payload + "." + sig,
  };

  for (const auto& raw : bad) {
    ParsedSignedStatement parsed;
    auto r = ParseStatement("Sig", raw, parsed);
    INFO(raw);
    REQUIRE_FALSE(r.is_valid);
    REQUIRE(r.error_code() == ErrorCode::kMalformedStatement);
    REQUIRE(r.message().rfind("malformed attestation statement: ", 0) == 0);
  }
}

TEST_CASE("ParseStatement reports an absent or empty x5c as MissingCertificateChain") {
  const std::string payload = enattest::common::Base64UrlEncode(std::string_view(kPayload));
  const std::string sig = enattest::common::Base64UrlEncode(std::string_view("sig"));

  for (const char* header_json : {R"({"alg":"RS256"})", R"({"alg":"RS256","x5c":[]})", R"({"alg":"RS256","x5c":null})"}) {
    const std::string raw = enattest::common::Base64UrlEncode(std::string_view(header_json)) + "." + payload + "." + sig;
    ParsedSignedStatement parsed;
    auto r = ParseStatement("Sig", raw, parsed);
    INFO(header_json);
    REQUIRE_FALSE(r.is_valid);
    REQUIRE(r.error_code() == ErrorCode::kMissingCertificateChain);
    REQUIRE(r.message() == "attestation statement has no x5c certificate chain");
  }
}

TEST_CASE("VerifyStatementSignature supports RS256, PS256, ES256 and ES384") {
  struct Case {
    const char* alg;
    enattest::tests::EvpPkeyPtr key;
  };
  std::vector<Case> cases;
  cases.push_back({"RS256", enattest::tests::GenerateRsaKey(2048)});
  cases.push_back({"PS256", enattest::tests::GenerateRsaKey(2048)});
  cases.push_back({"ES256", enattest::tests::GenerateEcP256Key()});
  cases.push_back({"ES384", enattest::tests::GenerateEcP384Key()});

  for (const auto& c : cases) {
    INFO(c.alg);
    const auto parsed = MustParse(enattest::tests::MakeSignedStatement(c.alg, {AnyCertDer()}, kPayload, c.key.get()));

    SignatureVerifyOptions opt;
    opt.public_key_bytes = enattest::tests::PublicKeyDerFromKey(c.key.get());
    auto r = VerifyStatementSignature("Sig", parsed, opt);
    REQUIRE(r.is_valid);
    REQUIRE(r.metadata.at("alg") == c.alg);
  }
}

TEST_CASE("VerifyStatementSignature rejects a signature from another key") {
  auto signer = enattest::tests::GenerateRsaKey(2048);
  auto other = enattest::tests::GenerateRsaKey(2048);
  const auto parsed = MustParse(enattest::tests::MakeSignedStatement("RS256", {AnyCertDer()}, kPayload, signer.get()));

  SignatureVerifyOptions opt;
  opt.public_key_bytes = enattest::tests::PublicKeyDerFromKey(other.get());
  auto r = VerifyStatementSignature("Sig", parsed, opt);
  REQUIRE_FALSE(r.is_valid);
  REQUIRE(r.error_code() == ErrorCode::kSignatureInvalid);
  REQUIRE(r.message() == "attestation signature verification failed");
}

TEST_CASE("VerifyStatementSignature detects a tampered payload") {
  auto key = enattest::tests::GenerateEcP256Key();
  const auto raw = enattest::tests::MakeSignedStatement("ES256", {AnyCertDer()}, kPayload, key.get());

  const auto first_dot = raw.find('.');
  const auto second_dot = raw.find('.', first_dot + 1);
  const std::string forged_payload =
      enattest::common::Base64UrlEncode(std::string_view(R"({"nonce":"b3RoZXI=","timestampMs":1589154006495})"));
  const std::string forged = raw.substr(0, first_dot + 1) + forged_payload + raw.substr(second_dot);

  SignatureVerifyOptions opt;
  opt.public_key_bytes = enattest::tests::PublicKeyDerFromKey(key.get());
  auto r = VerifyStatementSignature("Sig", MustParse(forged), opt);
  REQUIRE_FALSE(r.is_valid);
  REQUIRE(r.error_code() == ErrorCode::kSignatureInvalid);
}

TEST_CASE("ParseStatement rejects an unsupported algorithm before any key is needed") {
  auto key = enattest::tests::GenerateRsaKey(2048);

  for (const char* alg : {"HS256", "none", "rs256"}) {
    ParsedSignedStatement parsed;
    auto r = ParseStatement("Sig", enattest::tests::MakeSignedStatement(alg, {AnyCertDer()}, kPayload, key.get()), parsed);
    REQUIRE_FALSE(r.is_valid);
    REQUIRE(r.error_code() == ErrorCode::kUnsupportedAlgorithm);
    REQUIRE(r.message() == std::string("unsupported attestation signature algorithm: ") + alg);
    REQUIRE(r.failures.front().property_name == "alg");
  }
}

TEST_CASE("VerifyStatementSignature rejects unknown and unexpected algorithms") {
  auto key = enattest::tests::GenerateRsaKey(2048);

  {
    ParsedSignedStatement parsed;
    REQUIRE(enattest::common::ParseSignedStatement(
                enattest::tests::MakeSignedStatement("HS256", {AnyCertDer()}, kPayload, key.get()), parsed) ==
            enattest::common::StatementParseStatus::kOk);
    SignatureVerifyOptions opt;
    opt.public_key_bytes = enattest::tests::PublicKeyDerFromKey(key.get());
    auto r = VerifyStatementSignature("Sig", parsed, opt);
    REQUIRE_FALSE(r.is_valid);
    REQUIRE(r.error_code() == ErrorCode::kUnsupportedAlgorithm);
    REQUIRE(r.message() == "unsupported attestation signature algorithm: HS256");
  }

  {
    const auto parsed = MustParse(enattest::tests::MakeSignedStatement("RS256", {AnyCertDer()}, kPayload, key.get()));
    SignatureVerifyOptions opt;
    opt.public_key_bytes = enattest::tests::PublicKeyDerFromKey(key.get());
    opt.expected_alg = JwsAlgorithm::PS256;
    auto r = VerifyStatementSignature("Sig", parsed, opt);
    REQUIRE_FALSE(r.is_valid);
    REQUIRE(r.error_code() == ErrorCode::kUnsupportedAlgorithm);
  }
}

TEST_CASE("VerifyStatementSignature requires a usable key") {
  auto key = enattest::tests::GenerateRsaKey(2048);
  const auto parsed = MustParse(enattest::tests::MakeSignedStatement("RS256", {AnyCertDer()}, kPayload, key.get()));

  SignatureVerifyOptions none;
  auto r = VerifyStatementSignature("Sig", parsed, none);
  REQUIRE(r.error_code() == ErrorCode::kSignatureInvalid);

  SignatureVerifyOptions garbage;
  garbage.public_key_bytes = std::vector<std::uint8_t>{0x01, 0x02};
  r = VerifyStatementSignature("Sig", parsed, garbage);
  REQUIRE(r.error_code() == ErrorCode::kSignatureInvalid);
}

TEST_CASE("ParseJwsAlgorithm maps the supported names only") {
  REQUIRE(enattest::validation::ParseJwsAlgorithm("RS256") == JwsAlgorithm::RS256);
  REQUIRE(enattest::validation::ParseJwsAlgorithm("PS256") == JwsAlgorithm::PS256);
  REQUIRE(enattest::validation::ParseJwsAlgorithm("ES256") == JwsAlgorithm::ES256);
  REQUIRE(enattest::validation::ParseJwsAlgorithm("ES384") == JwsAlgorithm::ES384);
  REQUIRE_FALSE(enattest::validation::ParseJwsAlgorithm("none").has_value());
  REQUIRE_FALSE(enattest::validation::ParseJwsAlgorithm("rs256").has_value());
}
