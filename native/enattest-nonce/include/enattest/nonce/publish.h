// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file publish.h
 * @brief Read-only view of a key publish request, as consumed by the nonce binder.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace enattest::nonce {

/**
 * @brief A single temporary exposure key record.
 */
struct ExposureKey {
  /** @brief Key bytes in their transport (base64) form, exactly as submitted. */
  std::string key;
  std::int32_t interval_number = 0;
  std::int32_t interval_count = 0;
};

/**
 * @brief The fields of a publish request that are bound into the attestation nonce.
 */
struct Publish {
  std::vector<ExposureKey> keys;

  // Region codes; case-insensitive and unordered.
  std::vector<std::string> regions;

  std::string app_package_name;
  int transmission_risk = 0;

  // May be empty.
  std::string verification_authority_name;
};

} // namespace enattest::nonce
