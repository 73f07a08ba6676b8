// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file trusted_root_store.cpp
 * @brief TrustedRootStore construction from DER and PEM inputs.
 */

#include "enattest/x509/trusted_root_store.h"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <memory>
#include <utility>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

namespace enattest::x509 {

namespace {

using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free)>;
using X509Ptr = std::unique_ptr<X509, decltype(&X509_free)>;

bool IsCertificateDer(const std::vector<std::uint8_t>& der) {
  if (der.empty()) return false;
  const unsigned char* p = der.data();
  X509Ptr cert(d2i_X509(nullptr, &p, static_cast<long>(der.size())), &X509_free);
  return cert && p == der.data() + der.size();
}

std::optional<std::vector<std::uint8_t>> ToDer(X509* cert) {
  const int len = i2d_X509(cert, nullptr);
  if (len <= 0) {
    return std::nullopt;
  }
  std::vector<std::uint8_t> der(static_cast<std::size_t>(len));
  unsigned char* p = der.data();
  if (i2d_X509(cert, &p) != len) {
    return std::nullopt;
  }
  return der;
}

std::nullopt_t SetError(std::string* out_error, std::string message) {
  if (out_error) *out_error = std::move(message);
  return std::nullopt;
}

} // namespace

std::optional<TrustedRootStore> TrustedRootStore::FromDer(std::vector<std::vector<std::uint8_t>> roots_der,
                                                          std::string* out_error) {
  if (out_error) out_error->clear();

  if (roots_der.empty()) {
    return SetError(out_error, "no trusted root certificates provided");
  }
  for (std::size_t i = 0; i < roots_der.size(); ++i) {
    if (!IsCertificateDer(roots_der[i])) {
      return SetError(out_error, "trusted root " + std::to_string(i) + " is not a DER certificate");
    }
  }
  return TrustedRootStore(std::move(roots_der));
}

std::optional<TrustedRootStore> TrustedRootStore::FromPem(std::string_view pem, std::string* out_error) {
  if (out_error) out_error->clear();

  BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), &BIO_free);
  if (!bio) {
    return SetError(out_error, "failed to allocate PEM reader");
  }

  ERR_clear_error();
  std::vector<std::vector<std::uint8_t>> roots;
  while (true) {
    X509Ptr cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr), &X509_free);
    if (!cert) {
      break;
    }
    auto der = ToDer(cert.get());
    if (!der) {
      return SetError(out_error, "failed to re-encode PEM certificate");
    }
    roots.push_back(std::move(*der));
  }

  // Reading past the last block leaves PEM_R_NO_START_LINE queued; anything else is a broken block.
  const unsigned long err = ERR_peek_last_error();
  const bool clean_eof = err == 0 || (ERR_GET_LIB(err) == ERR_LIB_PEM && ERR_GET_REASON(err) == PEM_R_NO_START_LINE);
  ERR_clear_error();
  if (!clean_eof) {
    return SetError(out_error, "PEM bundle contains an invalid certificate block");
  }

  if (roots.empty()) {
    return SetError(out_error, "PEM bundle contains no certificates");
  }
  return TrustedRootStore(std::move(roots));
}

std::optional<TrustedRootStore> TrustedRootStore::FromPemFile(const std::string& path, std::string* out_error) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    return SetError(out_error, "failed to open file: " + path);
  }
  const std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  if (f.bad()) {
    return SetError(out_error, "failed to read file: " + path);
  }
  return FromPem(text, out_error);
}

bool TrustedRootStore::Contains(std::span<const std::uint8_t> der) const {
  return std::any_of(roots_der_.begin(), roots_der_.end(), [&](const std::vector<std::uint8_t>& root) {
    return std::equal(root.begin(), root.end(), der.begin(), der.end());
  });
}

} // namespace enattest::x509
