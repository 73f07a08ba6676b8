// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file attestation_validator.cpp
 * @brief Chain of trust, claim decoding and policy checks for attestation statements.
 */

#include "enattest/android/attestation_validator.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

#include <enattest/common/base64.h>
#include <enattest/common/signed_statement.h>

#include "enattest/validation/statement_verifier.h"
#include "enattest/x509/x5c_verifier.h"

namespace enattest::android {

namespace {

using validation::ErrorCode;
using validation::ErrorKind;
using validation::ValidationResult;

ValidationResult Fail(std::string message,
                      ErrorCode error_code,
                      std::optional<std::string> property = std::nullopt,
                      std::optional<std::string> attempted_value = std::nullopt) {
  return ValidationResult::Failure(std::string(kAttestationValidatorName), std::move(message), error_code,
                                   std::move(property), std::move(attempted_value));
}

std::int64_t UnixSeconds(std::chrono::system_clock::time_point t) {
  return std::chrono::floor<std::chrono::seconds>(t.time_since_epoch()).count();
}

spdlog::logger& LoggerFor(const ValidationContext& context) {
  if (context.logger) {
    return *context.logger;
  }
  return *spdlog::default_logger();
}

void LogOutcome(spdlog::logger& logger, const ValidationResult& result, std::string_view app_pkg_name) {
  const auto code = result.error_code();
  if (!code) {
    logger.debug("attestation accepted for app '{}'", app_pkg_name);
    return;
  }

  switch (validation::ErrorKindOf(*code)) {
    case ErrorKind::kTrust:
      logger.warn("attestation rejected ({}) for app '{}': {}", validation::ToString(*code), app_pkg_name,
                  result.message());
      break;
    case ErrorKind::kConfiguration:
      logger.error("attestation validator misconfigured ({}) for app '{}'", validation::ToString(*code),
                   app_pkg_name);
      break;
    case ErrorKind::kFormat:
      logger.info("attestation rejected ({}) for app '{}': {}", validation::ToString(*code), app_pkg_name,
                  result.message());
      break;
    case ErrorKind::kPolicy:
      logger.debug("attestation rejected ({}) for app '{}': {}", validation::ToString(*code), app_pkg_name,
                   result.message());
      break;
  }
}

ValidationResult CheckNonce(const VerifyOptions& options, const Claims& claims) {
  const std::string expected = options.nonce ? options.nonce->Value() : std::string();
  if (expected.empty()) {
    return Fail("missing nonce", ErrorCode::kMissingNonce, "nonce");
  }

  // The claim holds base64 of the nonce text.
  const auto decoded = common::Base64Decode(claims.nonce);
  if (!decoded || !std::equal(decoded->begin(), decoded->end(), expected.begin(), expected.end(),
                              [](std::uint8_t a, char b) { return a == static_cast<std::uint8_t>(b); })) {
    return Fail("attestation nonce mismatch", ErrorCode::kNonceMismatch, "nonce");
  }
  return ValidationResult::Success(std::string(kAttestationValidatorName));
}

ValidationResult CheckTimeWindow(const VerifyOptions& options, const Claims& claims) {
  if (!options.min_valid_time || !options.max_valid_time) {
    return Fail("missing timestamp bounds for attestation", ErrorCode::kMissingTimeBounds);
  }

  // Whole seconds: timestampMs may lie outside the range of a time_point.
  const std::int64_t claim_s = claims.timestamp_ms / 1000;
  const std::int64_t min_s = UnixSeconds(*options.min_valid_time);
  const std::int64_t max_s = UnixSeconds(*options.max_valid_time);

  // A claim second is before a fractional lower bound unless it reaches the next whole second.
  const std::int64_t min_ceil_s =
      std::chrono::ceil<std::chrono::seconds>(options.min_valid_time->time_since_epoch()).count();

  if (claim_s < min_ceil_s) {
    return Fail("attestation is too old, must be newer than " + std::to_string(min_s) + ", was " +
                    std::to_string(claim_s),
                ErrorCode::kTooOld, "timestampMs", std::to_string(claims.timestamp_ms));
  }
  if (claim_s > max_s) {
    return Fail("attestation is in the future, must be older than " + std::to_string(max_s) + ", was " +
                    std::to_string(claim_s),
                ErrorCode::kTooNew, "timestampMs", std::to_string(claims.timestamp_ms));
  }
  return ValidationResult::Success(std::string(kAttestationValidatorName));
}

ValidationResult CheckApp(const VerifyOptions& options, const Claims& claims) {
  if (!options.app_pkg_name.empty() && options.app_pkg_name != claims.apk_package_name) {
    return Fail("attestation apkPackageName mismatch, want " + options.app_pkg_name + ", got " +
                    claims.apk_package_name,
                ErrorCode::kAppMismatch, "apkPackageName", claims.apk_package_name);
  }

  if (!options.apk_digest.empty()) {
    const auto& cert_digests = claims.apk_certificate_digest_sha256;
    const bool found = options.apk_digest == claims.apk_digest_sha256 ||
                       std::find(cert_digests.begin(), cert_digests.end(), options.apk_digest) != cert_digests.end();
    if (!found) {
      return Fail("attestation apk digest mismatch, " + options.apk_digest + " not present", ErrorCode::kDigestMismatch,
                  "apkCertificateDigestSha256", claims.apk_digest_sha256);
    }
  }
  return ValidationResult::Success(std::string(kAttestationValidatorName));
}

ValidationResult CheckIntegrity(const VerifyOptions& options, const Claims& claims) {
  if (options.basic_integrity && !claims.basic_integrity) {
    return Fail("attestation failed basicIntegrity check", ErrorCode::kIntegrityFailed, "basicIntegrity");
  }
  if (options.cts_profile_match && !claims.cts_profile_match) {
    return Fail("attestation failed ctsProfileMatch check", ErrorCode::kProfileMismatch, "ctsProfileMatch");
  }
  return ValidationResult::Success(std::string(kAttestationValidatorName));
}

} // namespace

ValidationResult VerifyAttestation(const ValidationContext& context,
                                   std::string_view raw_statement,
                                   const VerifyOptions& options,
                                   Claims& out_claims) {
  out_claims = Claims{};
  const auto now = context.clock ? context.clock() : std::chrono::system_clock::now();

  common::ParsedSignedStatement parsed;
  ValidationResult parse = validation::ParseStatement(kAttestationValidatorName, raw_statement, parsed);
  if (!parse.is_valid) {
    return parse;
  }

  ValidationResult trust = x509::VerifyStatementWithX5c(kAttestationValidatorName, parsed, options.chain_options, now);
  if (!trust.is_valid) {
    return trust;
  }

  ValidationResult claims = DecodeClaims(kAttestationValidatorName, parsed.payload_json, out_claims);
  if (!claims.is_valid) {
    return claims;
  }

  trust.metadata.insert(parse.metadata.begin(), parse.metadata.end());
  trust.metadata.insert(claims.metadata.begin(), claims.metadata.end());
  return trust;
}

ValidationResult ValidateAttestation(const ValidationContext& context,
                                     std::string_view raw_statement,
                                     const VerifyOptions& options) {
  spdlog::logger& logger = LoggerFor(context);

  Claims claims;
  ValidationResult verified = VerifyAttestation(context, raw_statement, options, claims);
  if (!verified.is_valid) {
    LogOutcome(logger, verified, options.app_pkg_name);
    return verified;
  }

  using Check = ValidationResult (*)(const VerifyOptions&, const Claims&);
  for (Check check : {&CheckNonce, &CheckTimeWindow, &CheckApp, &CheckIntegrity}) {
    ValidationResult r = check(options, claims);
    if (!r.is_valid) {
      LogOutcome(logger, r, claims.apk_package_name);
      return r;
    }
  }

  LogOutcome(logger, verified, claims.apk_package_name);
  return verified;
}

} // namespace enattest::android
