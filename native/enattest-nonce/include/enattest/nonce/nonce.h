// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file nonce.h
 * @brief Binds an attestation to the exact contents of a publish request.
 */

#include <string>

#include "enattest/nonce/publish.h"

namespace enattest::nonce {

/**
 * @brief A value that can be rendered as the expected attestation nonce.
 *
 * An implementation that renders an empty string models "no nonce available";
 * validators treat it exactly like an absent nonce.
 */
class INonce {
 public:
  virtual ~INonce() = default;

  /**
   * @brief Returns the nonce text (standard base64), or an empty string.
   */
  virtual std::string Value() const = 0;
};

/**
 * @brief Nonce derived from a publish request.
 *
 * The digest is computed once at construction; the request is not retained.
 */
class PublishNonce final : public INonce {
 public:
  explicit PublishNonce(const Publish& publish);

  std::string Value() const override { return value_; }

 private:
  std::string value_;
};

/**
 * @brief Nonce that always renders empty.
 */
class EmptyNonce final : public INonce {
 public:
  std::string Value() const override { return {}; }
};

/**
 * @brief Builds the canonical cleartext that is hashed into the nonce.
 *
 * Layout: `app|risk|keys|regions|authority`, where `keys` are the sorted
 * `key.interval_number.interval_count` triples joined by ',', and `regions` are the
 * upper-cased, sorted region codes joined by ','.
 */
std::string NonceCleartext(const Publish& publish);

/**
 * @brief Returns base64(SHA-256(NonceCleartext(publish))), 44 characters including padding.
 */
std::string ComputeNonce(const Publish& publish);

} // namespace enattest::nonce
