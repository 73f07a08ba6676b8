// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file nonce.cpp
 * @brief Publish request nonce derivation.
 */

#include "enattest/nonce/nonce.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/evp.h>

#include <enattest/common/base64.h>

namespace enattest::nonce {

namespace {

std::string ToUpperAscii(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c >= 'a' && c <= 'z') {
      out.push_back(static_cast<char>(c - 'a' + 'A'));
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string JoinSorted(std::vector<std::string> parts, char separator) {
  std::sort(parts.begin(), parts.end());

  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i != 0) {
      out.push_back(separator);
    }
    out.append(parts[i]);
  }
  return out;
}

} // namespace

std::string NonceCleartext(const Publish& publish) {
  std::vector<std::string> keys;
  keys.reserve(publish.keys.size());
  for (const auto& k : publish.keys) {
    keys.push_back(k.key + "." + std::to_string(k.interval_number) + "." + std::to_string(k.interval_count));
  }

  std::vector<std::string> regions;
  regions.reserve(publish.regions.size());
  for (const auto& r : publish.regions) {
    regions.push_back(ToUpperAscii(r));
  }

  std::string cleartext;
  cleartext.append(publish.app_package_name);
  cleartext.push_back('|');
  cleartext.append(std::to_string(publish.transmission_risk));
  cleartext.push_back('|');
  cleartext.append(JoinSorted(std::move(keys), ','));
  cleartext.push_back('|');
  cleartext.append(JoinSorted(std::move(regions), ','));
  cleartext.push_back('|');
  cleartext.append(publish.verification_authority_name);
  return cleartext;
}

std::string ComputeNonce(const Publish& publish) {
  const std::string cleartext = NonceCleartext(publish);

  std::array<std::uint8_t, 32> digest{};
  unsigned int digest_len = 0;
  if (EVP_Digest(cleartext.data(), cleartext.size(), digest.data(), &digest_len, EVP_sha256(), nullptr) != 1 ||
      digest_len != digest.size()) {
    throw std::runtime_error("EVP_Digest(sha256) failed");
  }

  return enattest::common::Base64Encode(digest);
}

PublishNonce::PublishNonce(const Publish& publish) : value_(ComputeNonce(publish)) {}

} // namespace enattest::nonce
