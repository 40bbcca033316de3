#include <provenance/crypto/verify.hpp>

#include "openssl_types.hpp"

#include <openssl/core_names.h>

#include <algorithm>
#include <array>
#include <optional>
#include <vector>

namespace provenance::crypto {

namespace {

using namespace provenance::crypto::detail;

bool verify_with_key(EVP_PKEY* pkey,
                     const EVP_MD* digest,
                     const provenance::schema::bytes_view_t& message,
                     const uint8_t* signature,
                     size_t signature_size) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, digest, nullptr, pkey) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature, signature_size, message.data(),
                          message.size()) == 1;
}

bool verify_ed25519(const provenance::schema::bytes_view_t& message,
                    const provenance::schema::ed25519_signer_id& signer,
                    const provenance::schema::ed25519_signature_t& signature) {
  auto pkey =
      evp_pkey_ptr{EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                               signer.public_key.data(),
                                               signer.public_key.size()),
                   EVP_PKEY_free};
  if (!pkey) {
    return false;
  }
  return verify_with_key(pkey.get(), nullptr, message, signature.data(),
                         signature.size());
}

// 65-byte secp256k1 signatures carry a recovery id either first ([v|r|s]) or
// last ([r|s|v]). Small ids (0..3) and legacy 27+ ids are accepted.
std::optional<std::array<uint8_t, 64>> compact_secp256k1_signature(
    const provenance::schema::secp256k1_signature_t& signature) {
  auto is_recovery_id = [](uint8_t v) { return v <= 3 || v >= 27; };
  auto out = std::array<uint8_t, 64>{};
  if (is_recovery_id(signature.front())) {
    std::copy_n(signature.data() + 1, out.size(), out.data());
    return out;
  }
  if (is_recovery_id(signature.back())) {
    std::copy_n(signature.data(), out.size(), out.data());
    return out;
  }
  return std::nullopt;
}

std::optional<std::vector<uint8_t>> to_der(
    const std::array<uint8_t, 64>& compact) {
  auto ecdsa_sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  auto r = bignum_ptr{BN_bin2bn(compact.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(compact.data() + 32, 32, nullptr), BN_free};
  if (!ecdsa_sig || !r || !s ||
      ECDSA_SIG_set0(ecdsa_sig.get(), r.get(), s.get()) != 1) {
    return std::nullopt;
  }
  // ECDSA_SIG_set0 took ownership.
  r.release();
  s.release();

  auto der_len = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (der_len <= 0) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(der_len));
  auto* der_ptr = der.data();
  if (i2d_ECDSA_SIG(ecdsa_sig.get(), &der_ptr) != der_len) {
    return std::nullopt;
  }
  return der;
}

evp_pkey_ptr make_secp256k1_public_key(
    const provenance::schema::secp256k1_signer_id& signer) {
  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }

  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(signer.public_key.data()),
                     signer.public_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

bool verify_secp256k1(
    const provenance::schema::bytes_view_t& message,
    const provenance::schema::secp256k1_signer_id& signer,
    const provenance::schema::secp256k1_signature_t& signature) {
  auto compact = compact_secp256k1_signature(signature);
  if (!compact) {
    return false;
  }
  auto der = to_der(compact.value());
  if (!der) {
    return false;
  }
  auto pkey = make_secp256k1_public_key(signer);
  if (!pkey) {
    return false;
  }
  return verify_with_key(pkey.get(), EVP_sha256(), message, der->data(),
                         der->size());
}

}  // namespace

bool available() {
  static const auto available_now = [] {
    auto ed25519 = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free};
    auto ec = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
    return ed25519 != nullptr && ec != nullptr;
  }();
  return available_now;
}

bool verify_signature(const provenance::schema::bytes_view_t& message,
                      const provenance::schema::signer_id_t& signer,
                      const provenance::schema::signature_t& signature) {
  return std::visit(
      overloaded{
          [&](const provenance::schema::ed25519_signer_id& value) {
            const auto* ed25519 =
                std::get_if<provenance::schema::ed25519_signature_t>(
                    &signature);
            return ed25519 != nullptr &&
                   verify_ed25519(message, value, *ed25519);
          },
          [&](const provenance::schema::secp256k1_signer_id& value) {
            const auto* secp =
                std::get_if<provenance::schema::secp256k1_signature_t>(
                    &signature);
            return secp != nullptr && verify_secp256k1(message, value, *secp);
          },
          [](const provenance::schema::named_signer_t&) { return false; }},
      signer);
}

}  // namespace provenance::crypto
