// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file trusted_root_store.h
 * @brief Immutable set of caller-provisioned trust anchors.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace enattest::x509 {

/**
 * @brief Trust anchors used by X509TrustMode::kCustomRoots.
 *
 * A store is validated when it is built and never changes afterwards, so one instance
 * can be shared (typically as `std::shared_ptr<const TrustedRootStore>`) by any number
 * of concurrent verifications.
 */
class TrustedRootStore {
 public:
  /**
   * @brief Builds a store from DER-encoded certificates.
   * @return nullopt if the list is empty or any entry is not a certificate.
   */
  static std::optional<TrustedRootStore> FromDer(std::vector<std::vector<std::uint8_t>> roots_der,
                                                 std::string* out_error = nullptr);

  /**
   * @brief Builds a store from a PEM bundle (one or more CERTIFICATE blocks).
   */
  static std::optional<TrustedRootStore> FromPem(std::string_view pem, std::string* out_error = nullptr);

  /**
   * @brief Reads a PEM bundle from disk; see FromPem.
   */
  static std::optional<TrustedRootStore> FromPemFile(const std::string& path, std::string* out_error = nullptr);

  const std::vector<std::vector<std::uint8_t>>& roots_der() const { return roots_der_; }
  std::size_t size() const { return roots_der_.size(); }

  // Exact DER match.
  bool Contains(std::span<const std::uint8_t> der) const;

 private:
  explicit TrustedRootStore(std::vector<std::vector<std::uint8_t>> roots_der) : roots_der_(std::move(roots_der)) {}

  std::vector<std::vector<std::uint8_t>> roots_der_;
};

} // namespace enattest::x509
