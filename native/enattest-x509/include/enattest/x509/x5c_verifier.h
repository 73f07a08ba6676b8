// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file x5c_verifier.h
 * @brief X.509 (x5c) certificate chain based validation for signed statements.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <enattest/common/signed_statement.h>

#include "enattest/validation/validation_result.h"
#include "enattest/x509/trusted_root_store.h"

namespace enattest::x509 {

/**
 * @brief Hostname the attestation service issues its signing certificates to.
 */
inline constexpr std::string_view kDefaultAttestationHostname = "attest.android.com";

/**
 * @brief How the x5c verifier should decide trust for the signing certificate chain.
 */
enum class X509TrustMode {
    /**
     * @brief Chain must be trusted by the host OS trust store.
     */
    kSystem = 0,

    /**
     * @brief Chain must build to one of the caller-provided roots.
     */
    kCustomRoots = 1,
};

/**
 * @brief Options controlling X.509 chain validation for x5c.
 */
struct X509ChainVerifyOptions {
    X509TrustMode trust_mode = X509TrustMode::kSystem;

    /**
     * @brief Caller-provided trust anchors.
     *
     * Used only when trust_mode == kCustomRoots. Any certificate in the store may terminate
     * the chain, and the chain must end at one of these exact certificates.
     */
    std::shared_ptr<const TrustedRootStore> trusted_roots;

    /**
     * @brief DER-encoded CRLs for best-effort revocation checking.
     *
     * When non-empty, every certificate on the path is checked. Certificates for which no
     * usable CRL is available are accepted.
     */
    std::vector<std::vector<std::uint8_t>> crls_der;

    /**
     * @brief Identity (SAN dNSName, or CN when there is no SAN) required on the leaf.
     */
    std::string expected_hostname = std::string(kDefaultAttestationHostname);
};

/**
 * @brief Validates the leaf-first chain @p x5c_certs_der at time @p now.
 *
 * Fails with kUntrustedChain when no path reaches a trust anchor (or a certificate is revoked),
 * kExpiredCertificate when a certificate's validity window excludes @p now, and
 * kMalformedStatement when an entry is not a DER certificate.
 */
validation::ValidationResult ValidateX5cChain(
    std::string_view validator_name,
    const std::vector<std::vector<std::uint8_t>>& x5c_certs_der,
    const X509ChainVerifyOptions& chain_options,
    std::chrono::system_clock::time_point now);

/**
 * @brief Checks that the leaf certificate is issued to @p hostname (kIdentityMismatch otherwise).
 */
validation::ValidationResult VerifyLeafIdentity(
    std::string_view validator_name,
    std::span<const std::uint8_t> leaf_der,
    std::string_view hostname);

/**
 * @brief Chain of trust for a parsed statement: chain, then leaf identity, then signature.
 *
 * The signature is only verified once the chain and the leaf identity have been accepted.
 */
validation::ValidationResult VerifyStatementWithX5c(
    std::string_view validator_name,
    const enattest::common::ParsedSignedStatement& parsed,
    const X509ChainVerifyOptions& chain_options,
    std::chrono::system_clock::time_point now);

} // namespace enattest::x509
