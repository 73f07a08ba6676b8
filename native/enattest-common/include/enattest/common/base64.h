// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file base64.h
 * @brief Base64 helpers (RFC 4648 standard and URL-safe alphabets).
 */

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/evp.h>

namespace enattest::common {

/**
 * @brief Encodes @p bytes with the standard alphabet and '=' padding.
 */
inline std::string Base64Encode(std::span<const std::uint8_t> bytes) {
  if (bytes.empty()) {
    return {};
  }

  std::string out(((bytes.size() + 2) / 3) * 4 + 1, '\0');
  const int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), bytes.data(), static_cast<int>(bytes.size()));
  out.resize(static_cast<std::size_t>(len));
  return out;
}

/**
 * @brief Encodes @p bytes with the URL-safe alphabet and no padding (JWS segment form).
 */
inline std::string Base64UrlEncode(std::span<const std::uint8_t> bytes) {
  std::string out = Base64Encode(bytes);
  while (!out.empty() && out.back() == '=') {
    out.pop_back();
  }
  for (char& c : out) {
    if (c == '+') {
      c = '-';
    } else if (c == '/') {
      c = '_';
    }
  }
  return out;
}

inline std::string Base64UrlEncode(std::string_view text) {
  return Base64UrlEncode(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

namespace internal {

inline std::optional<std::vector<std::uint8_t>> DecodePaddedBlock(const std::string& b64) {
  if (b64.empty()) {
    return std::vector<std::uint8_t>{};
  }
  if (b64.size() % 4 != 0) {
    return std::nullopt;
  }

  std::vector<std::uint8_t> out((b64.size() / 4) * 3);
  const int len = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(b64.data()), static_cast<int>(b64.size()));
  if (len < 0) {
    return std::nullopt;
  }

  std::size_t actual = static_cast<std::size_t>(len);
  // EVP_DecodeBlock does not account for '=' padding.
  if (b64.back() == '=') {
    actual--;
    if (b64[b64.size() - 2] == '=') {
      actual--;
    }
  }

  out.resize(actual);
  return out;
}

inline bool IsStandardAlphabet(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

} // namespace internal

/**
 * @brief Strict standard base64 decode; input must be padded to a multiple of four.
 */
inline std::optional<std::vector<std::uint8_t>> Base64Decode(std::string_view in) {
  std::string b64(in);
  std::size_t padding = 0;
  for (std::size_t i = 0; i < b64.size(); ++i) {
    const char c = b64[i];
    if (c == '=') {
      padding++;
      continue;
    }
    // Data after padding, or a character outside the alphabet.
    if (padding != 0 || !internal::IsStandardAlphabet(c)) {
      return std::nullopt;
    }
  }
  if (padding > 2) {
    return std::nullopt;
  }
  return internal::DecodePaddedBlock(b64);
}

/**
 * @brief Lenient decode used for JWS segments.
 *
 * Accepts both the URL-safe and standard alphabets, with or without '=' padding.
 */
inline std::optional<std::vector<std::uint8_t>> Base64UrlDecode(std::string_view in) {
  std::string b64;
  b64.reserve(in.size() + 4);
  for (char c : in) {
    if (c == '-') {
      b64.push_back('+');
    } else if (c == '_') {
      b64.push_back('/');
    } else if (c == '=') {
      // ignore explicit padding
    } else if (internal::IsStandardAlphabet(c)) {
      b64.push_back(c);
    } else {
      return std::nullopt;
    }
  }

  if (b64.size() % 4 == 1) {
    return std::nullopt;
  }
  while (b64.size() % 4 != 0) {
    b64.push_back('=');
  }

  return internal::DecodePaddedBlock(b64);
}

} // namespace enattest::common
