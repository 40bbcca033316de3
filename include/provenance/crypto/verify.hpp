#pragma once

#include <provenance/schema/primitives.hpp>

namespace provenance::crypto {

/// True when the linked OpenSSL exposes both Ed25519 and secp256k1.
bool available();

/// Verify `signature` over `message` for `signer`. Named identities have no
/// key material and never verify.
bool verify_signature(const provenance::schema::bytes_view_t& message,
                      const provenance::schema::signer_id_t& signer,
                      const provenance::schema::signature_t& signature);

}  // namespace provenance::crypto
