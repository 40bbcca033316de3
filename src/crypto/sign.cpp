#include <provenance/crypto/sign.hpp>

#include "openssl_types.hpp"

#include <openssl/rand.h>

namespace provenance::crypto {

using namespace provenance::crypto::detail;

namespace {

evp_pkey_ptr make_private_key(const ed25519_seed_t& seed) {
  return evp_pkey_ptr{EVP_PKEY_new_raw_private_key(
                          EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()),
                      EVP_PKEY_free};
}

}  // namespace

std::optional<ed25519_keypair> make_ed25519_keypair(
    const ed25519_seed_t& seed) {
  auto pkey = make_private_key(seed);
  if (!pkey) {
    return std::nullopt;
  }
  auto keypair = ed25519_keypair{.seed = seed, .signer = {}};
  auto public_key_size = keypair.signer.public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), keypair.signer.public_key.data(),
                                  &public_key_size) != 1 ||
      public_key_size != keypair.signer.public_key.size()) {
    return std::nullopt;
  }
  return keypair;
}

std::optional<ed25519_keypair> generate_ed25519_keypair() {
  auto seed = ed25519_seed_t{};
  if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1) {
    return std::nullopt;
  }
  return make_ed25519_keypair(seed);
}

std::optional<provenance::schema::ed25519_signature_t> sign_ed25519(
    const ed25519_keypair& keypair,
    const provenance::schema::bytes_view_t& message) {
  auto pkey = make_private_key(keypair.seed);
  if (!pkey) {
    return std::nullopt;
  }
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
          1) {
    return std::nullopt;
  }
  auto signature = provenance::schema::ed25519_signature_t{};
  auto signature_size = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &signature_size,
                     message.data(), message.size()) != 1 ||
      signature_size != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

}  // namespace provenance::crypto
