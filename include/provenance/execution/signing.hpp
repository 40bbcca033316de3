#pragma once

#include <provenance/schema/primitives.hpp>
#include <provenance/schema/transaction.hpp>
#include <tuple>

namespace provenance::execution {

/// Bytes covered by a transaction signature: every envelope field except the
/// signature itself, SCALE encoded in declaration order.
template <typename Encoder>
provenance::schema::bytes_t make_signing_message(
    Encoder& encoder,
    const provenance::schema::transaction_t& tx) {
  return encoder.encode(
      std::tuple{tx.version, tx.chain_id, tx.nonce, tx.signer, tx.payload});
}

}  // namespace provenance::execution
