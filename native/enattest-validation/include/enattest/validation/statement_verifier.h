// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file statement_verifier.h
 * @brief Parsing and signature verification for compact signed statements.
 */

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include <enattest/common/signed_statement.h>

#include "enattest/validation/validation_result.h"

namespace enattest::validation {

enum class JwsAlgorithm {
  RS256,
  PS256,
  ES256,
  ES384,
};

std::optional<JwsAlgorithm> ParseJwsAlgorithm(std::string_view alg);

struct SignatureVerifyOptions {
  // DER-encoded SubjectPublicKeyInfo or DER-encoded X.509 certificate.
  std::optional<std::vector<std::uint8_t>> public_key_bytes;

  // If provided, require the header alg to match.
  std::optional<JwsAlgorithm> expected_alg;
};

// Parses @p raw into @p out and maps structural problems onto kMalformedStatement or
// kMissingCertificateChain.
ValidationResult ParseStatement(std::string_view validator_name,
                                std::string_view raw,
                                enattest::common::ParsedSignedStatement& out);

// Verifies the statement signature over `header_segment "." payload_segment` with the key in
// `options.public_key_bytes`.
ValidationResult VerifyStatementSignature(std::string_view validator_name,
                                          const enattest::common::ParsedSignedStatement& parsed,
                                          const SignatureVerifyOptions& options);

} // namespace enattest::validation
