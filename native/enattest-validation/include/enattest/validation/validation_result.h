// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file validation_result.h
 * @brief Standard result type returned by validators.
 */

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "enattest/validation/validation_failure.h"

namespace enattest::validation {

/**
 * @brief Outcome of a validation step.
 *
 * The attestation pipeline stops at the first violated check, so a failed result
 * produced by this library carries exactly one failure.
 */
struct ValidationResult {
  bool is_valid = false;
  std::string validator_name;
  std::vector<ValidationFailure> failures;
  std::unordered_map<std::string, std::string> metadata;

  static ValidationResult Success(
      std::string validator_name,
      std::unordered_map<std::string, std::string> metadata = {}) {
    ValidationResult r;
    r.is_valid = true;
    r.validator_name = std::move(validator_name);
    r.metadata = std::move(metadata);
    return r;
  }

  static ValidationResult Failure(std::string validator_name, std::vector<ValidationFailure> failures) {
    ValidationResult r;
    r.is_valid = false;
    r.validator_name = std::move(validator_name);
    r.failures = std::move(failures);
    return r;
  }

  static ValidationResult Failure(
      std::string validator_name,
      std::string message,
      ErrorCode error_code,
      std::optional<std::string> property_name = std::nullopt,
      std::optional<std::string> attempted_value = std::nullopt) {
    ValidationFailure f;
    f.message = std::move(message);
    f.error_code = error_code;
    f.property_name = std::move(property_name);
    f.attempted_value = std::move(attempted_value);
    std::vector<ValidationFailure> failures;
    failures.push_back(std::move(f));
    return Failure(std::move(validator_name), std::move(failures));
  }

  /**
   * @brief Code of the first failure, or nullopt when valid.
   */
  std::optional<ErrorCode> error_code() const {
    if (is_valid || failures.empty()) {
      return std::nullopt;
    }
    return failures.front().error_code;
  }

  /**
   * @brief Message of the first failure; empty when valid.
   */
  std::string message() const {
    if (is_valid || failures.empty()) {
      return {};
    }
    return failures.front().message;
  }
};

} // namespace enattest::validation
