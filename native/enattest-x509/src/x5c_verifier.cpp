// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file x5c_verifier.cpp
 * @brief X.509 (x5c) certificate-chain based signed statement verification.
 */

#include "enattest/x509/x5c_verifier.h"

#include <cstddef>
#include <ctime>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>

#include <openssl/x509.h>
#include <openssl/x509_vfy.h>
#include <openssl/x509v3.h>

#include "enattest/validation/statement_verifier.h"

namespace enattest::x509 {

namespace {

using validation::ErrorCode;

using X509Ptr = std::unique_ptr<X509, decltype(&X509_free)>;

struct X509StackDeleter {
  void operator()(STACK_OF(X509)* s) const noexcept { sk_X509_pop_free(s, X509_free); }
};
using X509StackPtr = std::unique_ptr<STACK_OF(X509), X509StackDeleter>;

validation::ValidationResult Fail(std::string_view validator_name,
                                  std::string message,
                                  ErrorCode error_code,
                                  std::optional<std::string> property = std::nullopt) {
  return validation::ValidationResult::Failure(std::string(validator_name), std::move(message), error_code,
                                               std::move(property));
}

validation::ValidationResult ChainFail(std::string_view validator_name, std::string reason, ErrorCode error_code) {
  validation::ValidationResult r =
      Fail(validator_name, "certificate chain validation failed: " + reason, error_code, "x5c");
  r.metadata.insert({
      {"x5c.chain_valid", "false"},
  });
  return r;
}

X509Ptr ParseX509(std::span<const std::uint8_t> der) {
  if (der.empty()) return X509Ptr(nullptr, &X509_free);
  const unsigned char* p = der.data();
  X509Ptr cert(d2i_X509(nullptr, &p, static_cast<long>(der.size())), &X509_free);
  if (cert && p != der.data() + der.size()) {
    cert.reset();
  }
  return cert;
}

bool ToDer(X509* cert, std::vector<std::uint8_t>& out) {
  const int len = i2d_X509(cert, nullptr);
  if (len <= 0) return false;
  out.resize(static_cast<std::size_t>(len));
  unsigned char* p = out.data();
  return i2d_X509(cert, &p) == len;
}

// Revocation is best-effort: a certificate without a usable CRL is accepted.
// Missing, out-of-date and unverifiable CRLs are all unusable.
int IgnoreUnavailableCrl(int ok, X509_STORE_CTX* ctx) {
  if (ok == 1) return ok;
  switch (X509_STORE_CTX_get_error(ctx)) {
    case X509_V_ERR_UNABLE_TO_GET_CRL:
    case X509_V_ERR_UNABLE_TO_GET_CRL_ISSUER:
    case X509_V_ERR_CRL_HAS_EXPIRED:
    case X509_V_ERR_CRL_NOT_YET_VALID:
    case X509_V_ERR_CRL_SIGNATURE_FAILURE:
    case X509_V_ERR_UNABLE_TO_DECRYPT_CRL_SIGNATURE:
    case X509_V_ERR_UNABLE_TO_DECODE_ISSUER_PUBLIC_KEY:
      X509_STORE_CTX_set_error(ctx, X509_V_OK);
      return 1;
    default:
      return ok;
  }
}

ErrorCode ErrorCodeFromVerifyError(int err) {
  switch (err) {
    case X509_V_ERR_CERT_HAS_EXPIRED:
    case X509_V_ERR_CERT_NOT_YET_VALID:
      return ErrorCode::kExpiredCertificate;
    default:
      return ErrorCode::kUntrustedChain;
  }
}

} // namespace

validation::ValidationResult ValidateX5cChain(
    std::string_view validator_name,
    const std::vector<std::vector<std::uint8_t>>& x5c_certs_der,
    const X509ChainVerifyOptions& chain_options,
    std::chrono::system_clock::time_point now) {
  if (x5c_certs_der.empty()) {
    return Fail(validator_name, "attestation statement has no x5c certificate chain", ErrorCode::kMissingCertificateChain, "x5c");
  }

  std::unique_ptr<X509_STORE, decltype(&X509_STORE_free)> store(X509_STORE_new(), X509_STORE_free);
  if (!store) {
    return ChainFail(validator_name, "failed to create X509 store", ErrorCode::kUntrustedChain);
  }

  if (chain_options.trust_mode == X509TrustMode::kSystem) {
    if (X509_STORE_set_default_paths(store.get()) != 1) {
      return ChainFail(validator_name, "failed to load the system trust store", ErrorCode::kUntrustedChain);
    }
  } else {
    if (!chain_options.trusted_roots || chain_options.trusted_roots->size() == 0) {
      return ChainFail(validator_name, "custom root trust mode requires at least one trusted root", ErrorCode::kUntrustedChain);
    }
    for (const auto& root_der : chain_options.trusted_roots->roots_der()) {
      X509Ptr root = ParseX509(root_der);
      if (!root) {
        return ChainFail(validator_name, "failed to parse a trusted root certificate", ErrorCode::kUntrustedChain);
      }
      // Duplicates are rejected by the store and are harmless.
      X509_STORE_add_cert(store.get(), root.get());
    }
    // Caller roots may be intermediates; the chain only has to reach one of them.
    X509_STORE_set_flags(store.get(), X509_V_FLAG_PARTIAL_CHAIN);
  }

  for (const auto& crl_der : chain_options.crls_der) {
    const unsigned char* p = crl_der.data();
    std::unique_ptr<X509_CRL, decltype(&X509_CRL_free)> crl(
        d2i_X509_CRL(nullptr, &p, static_cast<long>(crl_der.size())), X509_CRL_free);
    if (!crl) {
      return ChainFail(validator_name, "failed to parse a certificate revocation list", ErrorCode::kUntrustedChain);
    }
    X509_STORE_add_crl(store.get(), crl.get());
  }
  if (!chain_options.crls_der.empty()) {
    X509_STORE_set_flags(store.get(), X509_V_FLAG_CRL_CHECK | X509_V_FLAG_CRL_CHECK_ALL);
  }

  X509Ptr leaf = ParseX509(x5c_certs_der.front());
  if (!leaf) {
    return Fail(validator_name, "malformed attestation statement: x5c[0] is not a DER certificate",
                ErrorCode::kMalformedStatement, "x5c");
  }

  X509StackPtr untrusted(sk_X509_new_null());
  if (!untrusted) {
    return ChainFail(validator_name, "failed to allocate intermediate chain", ErrorCode::kUntrustedChain);
  }

  for (std::size_t i = 1; i < x5c_certs_der.size(); ++i) {
    X509Ptr cert = ParseX509(x5c_certs_der[i]);
    if (!cert) {
      return Fail(validator_name,
                  "malformed attestation statement: x5c[" + std::to_string(i) + "] is not a DER certificate",
                  ErrorCode::kMalformedStatement, "x5c");
    }
    if (sk_X509_push(untrusted.get(), cert.get()) <= 0) {
      return ChainFail(validator_name, "failed to allocate intermediate chain", ErrorCode::kUntrustedChain);
    }
    cert.release(); // stack owns cert
  }

  std::unique_ptr<X509_STORE_CTX, decltype(&X509_STORE_CTX_free)> ctx(X509_STORE_CTX_new(), X509_STORE_CTX_free);
  if (!ctx) {
    return ChainFail(validator_name, "failed to create store context", ErrorCode::kUntrustedChain);
  }

  if (X509_STORE_CTX_init(ctx.get(), store.get(), leaf.get(), untrusted.get()) != 1) {
    return ChainFail(validator_name, "failed to initialize store context", ErrorCode::kUntrustedChain);
  }

  X509_STORE_CTX_set_time(ctx.get(), 0, std::chrono::system_clock::to_time_t(now));
  if (!chain_options.crls_der.empty()) {
    X509_STORE_CTX_set_verify_cb(ctx.get(), IgnoreUnavailableCrl);
  }

  if (X509_verify_cert(ctx.get()) != 1) {
    const int err = X509_STORE_CTX_get_error(ctx.get());
    const char* err_str = X509_verify_cert_error_string(err);
    return ChainFail(validator_name, err_str ? err_str : "unknown error", ErrorCodeFromVerifyError(err));
  }

  STACK_OF(X509)* chain = X509_STORE_CTX_get0_chain(ctx.get());
  const int chain_len = chain ? sk_X509_num(chain) : 0;
  if (chain_len <= 0) {
    return ChainFail(validator_name, "failed to read verified certificate chain", ErrorCode::kUntrustedChain);
  }

  if (chain_options.trust_mode == X509TrustMode::kCustomRoots) {
    // The verified chain must terminate at one of the caller-provided roots, matched by exact DER bytes.
    std::vector<std::uint8_t> anchor_der;
    if (!ToDer(sk_X509_value(chain, chain_len - 1), anchor_der)) {
      return ChainFail(validator_name, "failed to serialize chain root certificate", ErrorCode::kUntrustedChain);
    }
    if (!chain_options.trusted_roots->Contains(anchor_der)) {
      return ChainFail(validator_name, "certificate chain did not terminate at an exact trusted root",
                       ErrorCode::kUntrustedChain);
    }
  }

  return validation::ValidationResult::Success(std::string(validator_name), {
    {"x5c.chain_valid", "true"},
    {"x5c.chain_length", std::to_string(chain_len)},
  });
}

validation::ValidationResult VerifyLeafIdentity(
    std::string_view validator_name,
    std::span<const std::uint8_t> leaf_der,
    std::string_view hostname) {
  X509Ptr leaf = ParseX509(leaf_der);
  if (!leaf) {
    return Fail(validator_name, "malformed attestation statement: x5c[0] is not a DER certificate",
                ErrorCode::kMalformedStatement, "x5c");
  }

  const std::string host(hostname);
  if (host.empty() || X509_check_host(leaf.get(), host.data(), host.size(), 0, nullptr) != 1) {
    return Fail(validator_name, "leaf certificate is not valid for " + host, ErrorCode::kIdentityMismatch, "x5c");
  }

  return validation::ValidationResult::Success(std::string(validator_name), {
    {"x5c.leaf_hostname", host},
  });
}

validation::ValidationResult VerifyStatementWithX5c(
    std::string_view validator_name,
    const enattest::common::ParsedSignedStatement& parsed,
    const X509ChainVerifyOptions& chain_options,
    std::chrono::system_clock::time_point now) {
  // 1) Chain of trust at the evaluation time.
  validation::ValidationResult chain = ValidateX5cChain(validator_name, parsed.certificate_chain_der, chain_options, now);
  if (!chain.is_valid) {
    return chain;
  }

  // 2) Leaf identity.
  const auto& leaf_der = parsed.certificate_chain_der.front();
  validation::ValidationResult identity = VerifyLeafIdentity(validator_name, leaf_der, chain_options.expected_hostname);
  if (!identity.is_valid) {
    return identity;
  }

  // 3) Statement signature under the leaf public key.
  validation::SignatureVerifyOptions opt;
  opt.public_key_bytes = leaf_der;
  validation::ValidationResult sig = validation::VerifyStatementSignature(validator_name, parsed, opt);
  if (!sig.is_valid) {
    return sig;
  }

  sig.metadata.insert(chain.metadata.begin(), chain.metadata.end());
  sig.metadata.insert(identity.metadata.begin(), identity.metadata.end());
  return sig;
}

} // namespace enattest::x509
