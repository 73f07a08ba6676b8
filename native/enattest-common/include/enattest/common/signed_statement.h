// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file signed_statement.h
 * @brief Compact signed statement (JWS compact serialization with an x5c header) model and parser.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <enattest/common/base64.h>

namespace enattest::common {

/**
 * @brief A signed statement split into its segments.
 *
 * The encoded segments are kept verbatim because the signature covers the encoded text,
 * not a re-encoding of the decoded values.
 */
struct ParsedSignedStatement {
  std::string header_segment;
  std::string payload_segment;
  std::string signature_segment;

  // Header "alg", e.g. "RS256".
  std::string alg;

  // Header "x5c", DER certificates, leaf first.
  std::vector<std::vector<std::uint8_t>> certificate_chain_der;

  // Decoded payload; a JSON object.
  std::string payload_json;

  std::vector<std::uint8_t> signature;

  /**
   * @brief Bytes covered by the signature: `header_segment "." payload_segment`.
   */
  std::string SigningInput() const {
    std::string out;
    out.reserve(header_segment.size() + 1 + payload_segment.size());
    out.append(header_segment);
    out.push_back('.');
    out.append(payload_segment);
    return out;
  }
};

enum class StatementParseStatus {
  kOk = 0,
  kMalformed = 1,
  kMissingCertificateChain = 2,
};

namespace internal {

inline StatementParseStatus Malformed(std::string* out_error, std::string message) {
  if (out_error) *out_error = std::move(message);
  return StatementParseStatus::kMalformed;
}

inline bool SplitCompact(std::string_view raw, std::vector<std::string_view>& parts) {
  parts.clear();
  std::size_t start = 0;
  while (true) {
    const std::size_t dot = raw.find('.', start);
    if (dot == std::string_view::npos) {
      parts.push_back(raw.substr(start));
      break;
    }
    parts.push_back(raw.substr(start, dot - start));
    start = dot + 1;
  }
  return parts.size() == 3;
}

inline bool TryParseJsonObject(const std::vector<std::uint8_t>& bytes, nlohmann::json& out) {
  try {
    out = nlohmann::json::parse(bytes.begin(), bytes.end());
  } catch (const nlohmann::json::exception&) {
    return false;
  }
  return out.is_object();
}

} // namespace internal

/**
 * @brief Parses a compact signed statement.
 *
 * Structural checks only; no cryptography is performed here.
 *
 * @return kMalformed if the statement does not have exactly three non-empty segments, a segment
 *         is not valid base64, the header or payload is not a JSON object, the header lacks a
 *         string "alg", or an x5c entry is not a base64 string; kMissingCertificateChain if the
 *         header has no x5c entries.
 */
inline StatementParseStatus ParseSignedStatement(std::string_view raw,
                                                 ParsedSignedStatement& out,
                                                 std::string* out_error = nullptr) {
  if (out_error) out_error->clear();
  out = ParsedSignedStatement{};

  std::vector<std::string_view> parts;
  if (!internal::SplitCompact(raw, parts)) {
    return internal::Malformed(out_error, "expected 3 dot-separated segments, got " + std::to_string(parts.size()));
  }
  for (const auto& part : parts) {
    if (part.empty()) {
      return internal::Malformed(out_error, "empty segment");
    }
  }

  const auto header_bytes = Base64UrlDecode(parts[0]);
  if (!header_bytes) {
    return internal::Malformed(out_error, "header is not valid base64");
  }
  const auto payload_bytes = Base64UrlDecode(parts[1]);
  if (!payload_bytes) {
    return internal::Malformed(out_error, "payload is not valid base64");
  }
  auto signature = Base64UrlDecode(parts[2]);
  if (!signature || signature->empty()) {
    return internal::Malformed(out_error, "signature is not valid base64");
  }

  nlohmann::json header;
  if (!internal::TryParseJsonObject(*header_bytes, header)) {
    return internal::Malformed(out_error, "header is not a JSON object");
  }
  nlohmann::json payload;
  if (!internal::TryParseJsonObject(*payload_bytes, payload)) {
    return internal::Malformed(out_error, "payload is not a JSON object");
  }

  const nlohmann::json& hdr = header;
  const auto alg = hdr.find("alg");
  if (alg == hdr.end() || !alg->is_string() || alg->get_ref<const std::string&>().empty()) {
    return internal::Malformed(out_error, "header has no alg");
  }

  std::vector<std::vector<std::uint8_t>> chain;
  const auto x5c = hdr.find("x5c");
  if (x5c != hdr.end() && !x5c->is_null()) {
    if (!x5c->is_array()) {
      return internal::Malformed(out_error, "header x5c is not an array");
    }
    for (const auto& entry : *x5c) {
      if (!entry.is_string()) {
        return internal::Malformed(out_error, "header x5c entry is not a string");
      }
      auto der = Base64Decode(entry.get_ref<const std::string&>());
      if (!der || der->empty()) {
        return internal::Malformed(out_error, "header x5c entry is not valid base64");
      }
      chain.push_back(std::move(*der));
    }
  }

  out.header_segment = std::string(parts[0]);
  out.payload_segment = std::string(parts[1]);
  out.signature_segment = std::string(parts[2]);
  out.alg = alg->get<std::string>();
  out.certificate_chain_der = std::move(chain);
  out.payload_json.assign(payload_bytes->begin(), payload_bytes->end());
  out.signature = std::move(*signature);

  if (out.certificate_chain_der.empty()) {
    if (out_error) *out_error = "header has no x5c certificate chain";
    return StatementParseStatus::kMissingCertificateChain;
  }
  return StatementParseStatus::kOk;
}

} // namespace enattest::common
