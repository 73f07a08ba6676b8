// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file error_code.h
 * @brief Failure codes reported by the attestation gate, and their classification.
 */

#include <string_view>

namespace enattest::validation {

enum class ErrorCode {
  // Format: the statement or its claims are corrupt or of an incompatible shape.
  kMalformedStatement,
  kMissingCertificateChain,
  kUnsupportedAlgorithm,
  kMalformedClaims,

  // Trust: the statement is forged or tampered with.
  kUntrustedChain,
  kExpiredCertificate,
  kIdentityMismatch,
  kSignatureInvalid,

  // Policy: expected, user-surfaceable rejections.
  kMissingNonce,
  kNonceMismatch,
  kTooOld,
  kTooNew,
  kAppMismatch,
  kDigestMismatch,
  kIntegrityFailed,
  kProfileMismatch,

  // Configuration: the caller supplied unusable options.
  kMissingTimeBounds,
};

enum class ErrorKind {
  kFormat,
  kTrust,
  kPolicy,
  kConfiguration,
};

constexpr ErrorKind ErrorKindOf(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kMalformedStatement:
    case ErrorCode::kMissingCertificateChain:
    case ErrorCode::kUnsupportedAlgorithm:
    case ErrorCode::kMalformedClaims:
      return ErrorKind::kFormat;
    case ErrorCode::kUntrustedChain:
    case ErrorCode::kExpiredCertificate:
    case ErrorCode::kIdentityMismatch:
    case ErrorCode::kSignatureInvalid:
      return ErrorKind::kTrust;
    case ErrorCode::kMissingTimeBounds:
      return ErrorKind::kConfiguration;
    case ErrorCode::kMissingNonce:
    case ErrorCode::kNonceMismatch:
    case ErrorCode::kTooOld:
    case ErrorCode::kTooNew:
    case ErrorCode::kAppMismatch:
    case ErrorCode::kDigestMismatch:
    case ErrorCode::kIntegrityFailed:
    case ErrorCode::kProfileMismatch:
      break;
  }
  return ErrorKind::kPolicy;
}

constexpr std::string_view ToString(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kMalformedStatement: return "MALFORMED_STATEMENT";
    case ErrorCode::kMissingCertificateChain: return "MISSING_CERTIFICATE_CHAIN";
    case ErrorCode::kUnsupportedAlgorithm: return "UNSUPPORTED_ALGORITHM";
    case ErrorCode::kMalformedClaims: return "MALFORMED_CLAIMS";
    case ErrorCode::kUntrustedChain: return "UNTRUSTED_CHAIN";
    case ErrorCode::kExpiredCertificate: return "EXPIRED_CERTIFICATE";
    case ErrorCode::kIdentityMismatch: return "IDENTITY_MISMATCH";
    case ErrorCode::kSignatureInvalid: return "SIGNATURE_INVALID";
    case ErrorCode::kMissingNonce: return "MISSING_NONCE";
    case ErrorCode::kNonceMismatch: return "NONCE_MISMATCH";
    case ErrorCode::kTooOld: return "TOO_OLD";
    case ErrorCode::kTooNew: return "TOO_NEW";
    case ErrorCode::kAppMismatch: return "APP_MISMATCH";
    case ErrorCode::kDigestMismatch: return "DIGEST_MISMATCH";
    case ErrorCode::kIntegrityFailed: return "INTEGRITY_FAILED";
    case ErrorCode::kProfileMismatch: return "PROFILE_MISMATCH";
    case ErrorCode::kMissingTimeBounds: return "MISSING_TIME_BOUNDS";
  }
  return "UNKNOWN";
}

constexpr std::string_view ToString(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::kFormat: return "format";
    case ErrorKind::kTrust: return "trust";
    case ErrorKind::kPolicy: return "policy";
    case ErrorKind::kConfiguration: return "configuration";
  }
  return "unknown";
}

} // namespace enattest::validation
