// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file attestation_validator.h
 * @brief Device integrity attestation validation.
 *
 * A statement is accepted only when every stage passes, in this order:
 * - statement format (three base64url segments, JSON header with `alg` and `x5c`)
 * - certificate chain, leaf identity and signature (see x509::VerifyStatementWithX5c)
 * - claim decoding
 * - nonce, time window, app identity, digest and integrity flags
 *
 * Evaluation stops at the first failing stage; the result then carries exactly one failure.
 * Both functions are stateless and may be called concurrently.
 */

#include <string_view>

#include "enattest/android/claims.h"
#include "enattest/android/verify_options.h"
#include "enattest/validation/validation_result.h"

namespace enattest::android {

inline constexpr std::string_view kAttestationValidatorName = "AndroidAttestation";

/**
 * @brief Verifies the statement's format, chain of trust and signature, and decodes its claims.
 *
 * No policy from @p options is applied except `chain_options`.
 */
validation::ValidationResult VerifyAttestation(const ValidationContext& context,
                                               std::string_view raw_statement,
                                               const VerifyOptions& options,
                                               Claims& out_claims);

/**
 * @brief Runs VerifyAttestation and then applies the policy in @p options to the claims.
 */
validation::ValidationResult ValidateAttestation(const ValidationContext& context,
                                                 std::string_view raw_statement,
                                                 const VerifyOptions& options);

} // namespace enattest::android
