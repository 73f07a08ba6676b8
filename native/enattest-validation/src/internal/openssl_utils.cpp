#include "openssl_utils.h"

#include <openssl/bn.h>
#include <openssl/ecdsa.h>
#include <openssl/rsa.h>

namespace enattest::internal {

namespace {
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using EcdsaSigPtr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;

bool VerifyEcdsa(EVP_PKEY* key,
                 const EVP_MD* md,
                 std::size_t component_size,
                 std::span<const std::uint8_t> to_be_signed,
                 std::span<const std::uint8_t> raw_sig) {
  if (raw_sig.size() != component_size * 2) {
    return false;
  }

  auto der = JwsEcdsaRawToDer(raw_sig);
  if (!der) {
    return false;
  }

  MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) return false;

  if (EVP_DigestVerifyInit(ctx.get(), nullptr, md, nullptr, key) != 1) return false;
  if (EVP_DigestVerifyUpdate(ctx.get(), to_be_signed.data(), to_be_signed.size()) != 1) return false;
  return EVP_DigestVerifyFinal(ctx.get(), der->data(), der->size()) == 1;
}

} // namespace

X509Ptr ParseCertificateDer(std::span<const std::uint8_t> der) {
  if (der.empty()) {
    return X509Ptr(nullptr, &X509_free);
  }

  const unsigned char* p = der.data();
  const unsigned char* end = der.data() + der.size();
  X509Ptr cert(d2i_X509(nullptr, &p, static_cast<long>(der.size())), &X509_free);
  if (cert && p != end) {
    cert.reset();
  }
  return cert;
}

EvpPkeyPtr LoadPublicKeyOrCertFromDer(std::span<const std::uint8_t> der) {
  if (der.empty()) {
    return EvpPkeyPtr(nullptr, &EVP_PKEY_free);
  }

  const unsigned char* p = der.data();
  const unsigned char* end = der.data() + der.size();
  // Try SubjectPublicKeyInfo first.
  if (EVP_PKEY* pkey = d2i_PUBKEY(nullptr, &p, static_cast<long>(der.size()))) {
    // Only accept if the parser consumed the entire buffer.
    if (p == end) {
      return EvpPkeyPtr(pkey, &EVP_PKEY_free);
    }
    EVP_PKEY_free(pkey);
  }

  if (auto cert = ParseCertificateDer(der)) {
    return EvpPkeyPtr(X509_get_pubkey(cert.get()), &EVP_PKEY_free);
  }

  return EvpPkeyPtr(nullptr, &EVP_PKEY_free);
}

std::optional<std::vector<std::uint8_t>> JwsEcdsaRawToDer(std::span<const std::uint8_t> raw_sig) {
  if (raw_sig.size() % 2 != 0 || raw_sig.empty()) {
    return std::nullopt;
  }

  const std::size_t n = raw_sig.size() / 2;
  BIGNUM* r = BN_bin2bn(raw_sig.data(), static_cast<int>(n), nullptr);
  BIGNUM* s = BN_bin2bn(raw_sig.data() + n, static_cast<int>(n), nullptr);
  if (!r || !s) {
    BN_free(r);
    BN_free(s);
    return std::nullopt;
  }

  EcdsaSigPtr sig(ECDSA_SIG_new(), &ECDSA_SIG_free);
  if (!sig || ECDSA_SIG_set0(sig.get(), r, s) != 1) {
    BN_free(r);
    BN_free(s);
    return std::nullopt;
  }

  const int len = i2d_ECDSA_SIG(sig.get(), nullptr);
  if (len <= 0) {
    return std::nullopt;
  }

  std::vector<std::uint8_t> der(static_cast<std::size_t>(len));
  unsigned char* out = der.data();
  if (i2d_ECDSA_SIG(sig.get(), &out) != len) {
    return std::nullopt;
  }
  return der;
}

std::optional<std::vector<std::uint8_t>> EcdsaDerToJwsRaw(std::span<const std::uint8_t> der_sig, std::size_t component_size) {
  const unsigned char* p = der_sig.data();
  EcdsaSigPtr sig(d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(der_sig.size())), &ECDSA_SIG_free);
  if (!sig) {
    return std::nullopt;
  }

  const BIGNUM* r = nullptr;
  const BIGNUM* s = nullptr;
  ECDSA_SIG_get0(sig.get(), &r, &s);

  std::vector<std::uint8_t> raw(component_size * 2);
  if (BN_bn2binpad(r, raw.data(), static_cast<int>(component_size)) != static_cast<int>(component_size) ||
      BN_bn2binpad(s, raw.data() + component_size, static_cast<int>(component_size)) != static_cast<int>(component_size)) {
    return std::nullopt;
  }
  return raw;
}

bool VerifyRs256(EVP_PKEY* key, std::span<const std::uint8_t> to_be_signed, std::span<const std::uint8_t> signature) {
  MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) return false;

  EVP_PKEY_CTX* pctx = nullptr;
  if (EVP_DigestVerifyInit(ctx.get(), &pctx, EVP_sha256(), nullptr, key) != 1) return false;
  if (EVP_PKEY_get_base_id(key) != EVP_PKEY_RSA) return false;
  if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PADDING) != 1) return false;

  if (EVP_DigestVerifyUpdate(ctx.get(), to_be_signed.data(), to_be_signed.size()) != 1) return false;
  return EVP_DigestVerifyFinal(ctx.get(), signature.data(), signature.size()) == 1;
}

bool VerifyPs256(EVP_PKEY* key, std::span<const std::uint8_t> to_be_signed, std::span<const std::uint8_t> signature) {
  MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) return false;

  EVP_PKEY_CTX* pctx = nullptr;
  if (EVP_DigestVerifyInit(ctx.get(), &pctx, EVP_sha256(), nullptr, key) != 1) return false;
  if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING) != 1) return false;
  if (EVP_PKEY_CTX_set_rsa_mgf1_md(pctx, EVP_sha256()) != 1) return false;
  if (EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, -1) != 1) return false;

  if (EVP_DigestVerifyUpdate(ctx.get(), to_be_signed.data(), to_be_signed.size()) != 1) return false;
  return EVP_DigestVerifyFinal(ctx.get(), signature.data(), signature.size()) == 1;
}

bool VerifyEs256(EVP_PKEY* key, std::span<const std::uint8_t> to_be_signed, std::span<const std::uint8_t> raw_sig) {
  return VerifyEcdsa(key, EVP_sha256(), 32, to_be_signed, raw_sig);
}

bool VerifyEs384(EVP_PKEY* key, std::span<const std::uint8_t> to_be_signed, std::span<const std::uint8_t> raw_sig) {
  return VerifyEcdsa(key, EVP_sha384(), 48, to_be_signed, raw_sig);
}

} // namespace enattest::internal
