#pragma once

#include <provenance/schema/primitives.hpp>
#include <array>
#include <optional>

namespace provenance::crypto {

using ed25519_seed_t = std::array<uint8_t, 32>;

struct ed25519_keypair final {
  ed25519_seed_t seed;
  provenance::schema::ed25519_signer_id signer;
};

/// Derive the public half of an Ed25519 key from its 32-byte seed.
std::optional<ed25519_keypair> make_ed25519_keypair(const ed25519_seed_t& seed);

/// Fresh keypair from the OpenSSL CSPRNG.
std::optional<ed25519_keypair> generate_ed25519_keypair();

std::optional<provenance::schema::ed25519_signature_t> sign_ed25519(
    const ed25519_keypair& keypair,
    const provenance::schema::bytes_view_t& message);

}  // namespace provenance::crypto
