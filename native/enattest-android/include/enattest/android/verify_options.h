// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file verify_options.h
 * @brief Caller policy and per-call context for attestation validation.
 */

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/logger.h>

#include <enattest/nonce/nonce.h>
#include <enattest/x509/x5c_verifier.h>

namespace enattest::android {

/**
 * @brief Policy applied to the claims of a verified statement.
 */
struct VerifyOptions {
  // If non-empty, must equal the claim's apkPackageName.
  std::string app_pkg_name;

  // If non-empty, must equal apkDigestSha256 or one of apkCertificateDigestSha256.
  std::string apk_digest;

  // Required. A null nonce or one that renders empty fails with kMissingNonce.
  std::shared_ptr<const nonce::INonce> nonce;

  bool cts_profile_match = false;
  bool basic_integrity = false;

  // Inclusive window for the claim timestamp. Both bounds are required.
  std::optional<std::chrono::system_clock::time_point> min_valid_time;
  std::optional<std::chrono::system_clock::time_point> max_valid_time;

  x509::X509ChainVerifyOptions chain_options;
};

/**
 * @brief Per-call environment.
 */
struct ValidationContext {
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  // Falls back to spdlog::default_logger() when null.
  std::shared_ptr<spdlog::logger> logger;

  // Read once per call to obtain the certificate evaluation time. Defaults to the system clock.
  Clock clock;
};

} // namespace enattest::android
