#include "enattest/validation/statement_verifier.h"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/openssl_utils.h"

namespace enattest::validation {

namespace {

using ParsedStatement = enattest::common::ParsedSignedStatement;

ValidationResult Fail(std::string_view validator_name,
                      std::string message,
                      ErrorCode error_code,
                      std::optional<std::string> property = std::nullopt) {
  return ValidationResult::Failure(std::string(validator_name), std::move(message), error_code, std::move(property));
}

} // namespace

std::optional<JwsAlgorithm> ParseJwsAlgorithm(std::string_view alg) {
  if (alg == "RS256") return JwsAlgorithm::RS256;
  if (alg == "PS256") return JwsAlgorithm::PS256;
  if (alg == "ES256") return JwsAlgorithm::ES256;
  if (alg == "ES384") return JwsAlgorithm::ES384;
  return std::nullopt;
}

ValidationResult ParseStatement(std::string_view validator_name, std::string_view raw, ParsedStatement& out) {
  std::string parse_error;
  switch (enattest::common::ParseSignedStatement(raw, out, &parse_error)) {
    case enattest::common::StatementParseStatus::kOk:
      break;
    case enattest::common::StatementParseStatus::kMissingCertificateChain:
      return Fail(validator_name, "attestation statement has no x5c certificate chain", ErrorCode::kMissingCertificateChain, "x5c");
    case enattest::common::StatementParseStatus::kMalformed:
      return Fail(validator_name, "malformed attestation statement: " + parse_error, ErrorCode::kMalformedStatement);
  }

  if (!ParseJwsAlgorithm(out.alg)) {
    return Fail(validator_name, "unsupported attestation signature algorithm: " + out.alg, ErrorCode::kUnsupportedAlgorithm, "alg");
  }

  std::unordered_map<std::string, std::string> metadata;
  metadata.emplace("alg", out.alg);
  metadata.emplace("x5c.length", std::to_string(out.certificate_chain_der.size()));
  return ValidationResult::Success(std::string(validator_name), std::move(metadata));
}

ValidationResult VerifyStatementSignature(std::string_view validator_name,
                                          const ParsedStatement& parsed,
                                          const SignatureVerifyOptions& options) {
  const auto alg = ParseJwsAlgorithm(parsed.alg);
  if (!alg) {
    return Fail(validator_name, "unsupported attestation signature algorithm: " + parsed.alg, ErrorCode::kUnsupportedAlgorithm, "alg");
  }

  if (options.expected_alg && *options.expected_alg != *alg) {
    return Fail(validator_name, "attestation signature algorithm did not match expected value: " + parsed.alg,
                ErrorCode::kUnsupportedAlgorithm, "alg");
  }

  if (!options.public_key_bytes) {
    return Fail(validator_name, "attestation signature verification failed: no verification key", ErrorCode::kSignatureInvalid);
  }

  auto key = internal::LoadPublicKeyOrCertFromDer(*options.public_key_bytes);
  if (!key) {
    return Fail(validator_name, "attestation signature verification failed: invalid public key", ErrorCode::kSignatureInvalid);
  }

  const std::string signing_input = parsed.SigningInput();
  const std::span<const std::uint8_t> tbs(reinterpret_cast<const std::uint8_t*>(signing_input.data()), signing_input.size());

  bool ok = false;
  switch (*alg) {
    case JwsAlgorithm::RS256:
      ok = internal::VerifyRs256(key.get(), tbs, parsed.signature);
      break;
    case JwsAlgorithm::PS256:
      ok = internal::VerifyPs256(key.get(), tbs, parsed.signature);
      break;
    case JwsAlgorithm::ES256:
      ok = internal::VerifyEs256(key.get(), tbs, parsed.signature);
      break;
    case JwsAlgorithm::ES384:
      ok = internal::VerifyEs384(key.get(), tbs, parsed.signature);
      break;
  }

  if (!ok) {
    return Fail(validator_name, "attestation signature verification failed", ErrorCode::kSignatureInvalid);
  }

  std::unordered_map<std::string, std::string> metadata;
  metadata.emplace("alg", parsed.alg);
  metadata.emplace("payloadLength", std::to_string(parsed.payload_json.size()));
  return ValidationResult::Success(std::string(validator_name), std::move(metadata));
}

} // namespace enattest::validation
