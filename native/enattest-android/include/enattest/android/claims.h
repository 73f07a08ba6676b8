// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file claims.h
 * @brief Device integrity claims carried in the payload of an attestation statement.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "enattest/validation/validation_result.h"

namespace enattest::android {

struct Claims {
  // Base64 of the nonce string the device was asked to attest.
  std::string nonce;
  std::int64_t timestamp_ms = 0;
  std::string apk_package_name;
  std::string apk_digest_sha256;
  std::vector<std::string> apk_certificate_digest_sha256;
  bool cts_profile_match = false;
  bool basic_integrity = false;
  std::string evaluation_type;
};

/**
 * @brief Decodes the JSON payload of a statement into @p out.
 *
 * `timestampMs` (number) and `apkPackageName` (string) are required. Every other field is
 * optional and keeps its default when absent; a field present with the wrong JSON type is
 * rejected. Failures carry ErrorCode::kMalformedClaims.
 */
validation::ValidationResult DecodeClaims(std::string_view validator_name, std::string_view payload_json, Claims& out);

} // namespace enattest::android
