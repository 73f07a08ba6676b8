// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file validation_failure.h
 * @brief Structured failure details produced by validators.
 */

#include <optional>
#include <string>

#include "enattest/validation/error_code.h"

namespace enattest::validation {

struct ValidationFailure {
  std::string message;
  ErrorCode error_code = ErrorCode::kMalformedStatement;
  std::optional<std::string> property_name;
  std::optional<std::string> attempted_value;

  ErrorKind kind() const noexcept { return ErrorKindOf(error_code); }
};

} // namespace enattest::validation
