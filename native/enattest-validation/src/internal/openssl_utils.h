#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <openssl/evp.h>
#include <openssl/x509.h>

namespace enattest::internal {

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using X509Ptr = std::unique_ptr<X509, decltype(&X509_free)>;

// Parses a DER X.509 certificate; rejects trailing bytes.
X509Ptr ParseCertificateDer(std::span<const std::uint8_t> der);

// Loads a public key from DER-encoded SubjectPublicKeyInfo, or from DER-encoded X.509 certificate.
EvpPkeyPtr LoadPublicKeyOrCertFromDer(std::span<const std::uint8_t> der);

// JWS encodes ECDSA signatures as raw r||s, each component left-padded to the curve size.
std::optional<std::vector<std::uint8_t>> JwsEcdsaRawToDer(std::span<const std::uint8_t> raw_sig);
std::optional<std::vector<std::uint8_t>> EcdsaDerToJwsRaw(std::span<const std::uint8_t> der_sig, std::size_t component_size);

bool VerifyRs256(EVP_PKEY* key, std::span<const std::uint8_t> to_be_signed, std::span<const std::uint8_t> signature);
bool VerifyPs256(EVP_PKEY* key, std::span<const std::uint8_t> to_be_signed, std::span<const std::uint8_t> signature);
bool VerifyEs256(EVP_PKEY* key, std::span<const std::uint8_t> to_be_signed, std::span<const std::uint8_t> raw_sig);
bool VerifyEs384(EVP_PKEY* key, std::span<const std::uint8_t> to_be_signed, std::span<const std::uint8_t> raw_sig);

} // namespace enattest::internal
