// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file claims.cpp
 * @brief JSON decoding of attestation claims.
 */

#include "enattest/android/claims.h"

#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace enattest::android {

namespace {

using validation::ErrorCode;
using validation::ValidationResult;

ValidationResult Fail(std::string_view validator_name, std::string detail, std::string property) {
  return ValidationResult::Failure(std::string(validator_name), "malformed attestation claims: " + detail,
                                   ErrorCode::kMalformedClaims, std::move(property));
}

// Each reader returns false only when the field is present with the wrong type.
bool ReadString(const nlohmann::json& j, const char* name, std::string& out) {
  const auto it = j.find(name);
  if (it == j.end() || it->is_null()) return true;
  if (!it->is_string()) return false;
  out = it->get<std::string>();
  return true;
}

bool ReadBool(const nlohmann::json& j, const char* name, bool& out) {
  const auto it = j.find(name);
  if (it == j.end() || it->is_null()) return true;
  if (!it->is_boolean()) return false;
  out = it->get<bool>();
  return true;
}

bool ReadStringArray(const nlohmann::json& j, const char* name, std::vector<std::string>& out) {
  const auto it = j.find(name);
  if (it == j.end() || it->is_null()) return true;
  if (!it->is_array()) return false;
  for (const auto& entry : *it) {
    if (!entry.is_string()) return false;
    out.push_back(entry.get<std::string>());
  }
  return true;
}

std::optional<std::int64_t> ReadTimestampMs(const nlohmann::json& value) {
  if (value.is_number_integer()) {
    if (value.is_number_unsigned() &&
        value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      return std::nullopt;
    }
    return value.get<std::int64_t>();
  }
  if (value.is_number_float()) {
    const double d = value.get<double>();
    if (!std::isfinite(d) || d < -9.2e18 || d > 9.2e18) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(d);
  }
  return std::nullopt;
}

} // namespace

ValidationResult DecodeClaims(std::string_view validator_name, std::string_view payload_json, Claims& out) {
  out = Claims{};

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(payload_json.begin(), payload_json.end());
  } catch (const nlohmann::json::exception& e) {
    return Fail(validator_name, std::string("payload is not JSON: ") + e.what(), "payload");
  }
  if (!j.is_object()) {
    return Fail(validator_name, "payload is not a JSON object", "payload");
  }
  const nlohmann::json& payload = j;

  const auto ts = payload.find("timestampMs");
  if (ts == payload.end()) {
    return Fail(validator_name, "timestampMs is missing", "timestampMs");
  }
  const auto timestamp_ms = ReadTimestampMs(*ts);
  if (!timestamp_ms) {
    return Fail(validator_name, "timestampMs is not a number", "timestampMs");
  }

  const auto pkg = payload.find("apkPackageName");
  if (pkg == payload.end()) {
    return Fail(validator_name, "apkPackageName is missing", "apkPackageName");
  }
  if (!pkg->is_string()) {
    return Fail(validator_name, "apkPackageName is not a string", "apkPackageName");
  }

  Claims claims;
  claims.timestamp_ms = *timestamp_ms;
  claims.apk_package_name = pkg->get<std::string>();

  if (!ReadString(payload, "nonce", claims.nonce)) {
    return Fail(validator_name, "nonce is not a string", "nonce");
  }
  if (!ReadString(payload, "apkDigestSha256", claims.apk_digest_sha256)) {
    return Fail(validator_name, "apkDigestSha256 is not a string", "apkDigestSha256");
  }
  if (!ReadStringArray(payload, "apkCertificateDigestSha256", claims.apk_certificate_digest_sha256)) {
    return Fail(validator_name, "apkCertificateDigestSha256 is not an array of strings", "apkCertificateDigestSha256");
  }
  if (!ReadBool(payload, "ctsProfileMatch", claims.cts_profile_match)) {
    return Fail(validator_name, "ctsProfileMatch is not a boolean", "ctsProfileMatch");
  }
  if (!ReadBool(payload, "basicIntegrity", claims.basic_integrity)) {
    return Fail(validator_name, "basicIntegrity is not a boolean", "basicIntegrity");
  }
  if (!ReadString(payload, "evaluationType", claims.evaluation_type)) {
    return Fail(validator_name, "evaluationType is not a string", "evaluationType");
  }

  out = std::move(claims);
  return ValidationResult::Success(std::string(validator_name), {
    {"apkPackageName", out.apk_package_name},
    {"timestampMs", std::to_string(out.timestamp_ms)},
  });
}

} // namespace enattest::android
