#pragma once

#include <provenance/crypto/sign.hpp>
#include <provenance/execution/engine.hpp>
#include <provenance/execution/signing.hpp>
#include <provenance/schema/transaction.hpp>
#include <provenance/storage/rocksdb/storage.hpp>
#include <provenance/testing/common.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace provenance::testing {

using storage_t =
    provenance::storage::storage<provenance::storage::rocksdb_storage_tag>;

inline provenance::schema::register_product_t make_register_product(
    std::string product_id) {
  auto op = provenance::schema::register_product_t{};
  op.product_id = std::move(product_id);
  op.name = "Single origin coffee";
  op.origin = "Huila, Colombia";
  op.description = "Washed arabica, lot 7";
  op.category = "coffee";
  op.tags = {"organic", "fair-trade"};
  op.certifications = {make_hash(0x10)};
  op.media_hashes = {make_hash(0x20), make_hash(0x21)};
  op.custom = {{.key = "process", .value = "washed"},
               {.key = "altitude", .value = "1700m"}};
  return op;
}

inline provenance::schema::event_input_t make_event_input(
    std::string event_type,
    std::string location = "Bogota") {
  auto event = provenance::schema::event_input_t{};
  event.event_type = std::move(event_type);
  event.location = std::move(location);
  event.metadata = provenance::schema::bytes_t{0x01, 0x02};
  return event;
}

inline provenance::schema::add_tracking_event_t make_add_event(
    std::string product_id,
    std::string event_type) {
  auto op = provenance::schema::add_tracking_event_t{};
  op.product_id = std::move(product_id);
  op.event = make_event_input(std::move(event_type));
  return op;
}

/// Signs a transaction with a real Ed25519 key.
template <typename Encoder>
provenance::schema::transaction_t sign_transaction(
    Encoder& encoder,
    const provenance::schema::hash32_t& chain_id,
    const uint64_t nonce,
    const provenance::crypto::ed25519_keypair& keypair,
    provenance::schema::transaction_payload_t payload) {
  auto tx = provenance::schema::transaction_t{
      .version = 1,
      .chain_id = chain_id,
      .nonce = nonce,
      .signer = provenance::schema::signer_id_t{keypair.signer},
      .payload = std::move(payload),
      .signature = provenance::schema::ed25519_signature_t{}};
  auto message = provenance::execution::make_signing_message(encoder, tx);
  auto signature = provenance::crypto::sign_ed25519(
      keypair, provenance::schema::make_bytes_view(message));
  EXPECT_TRUE(signature.has_value());
  if (signature) {
    tx.signature = signature.value();
  }
  return tx;
}

/// Engine over an in-memory RocksDB with block driving helpers. Each
/// `execute` call runs one transaction as its own block and commits it.
class ledger_fixture final {
 public:
  explicit ledger_fixture(provenance::execution::engine_options options = {})
      : encoder_{},
        storage_{provenance::storage::make_memory_storage<
            provenance::storage::rocksdb_storage_tag>()},
        engine_{encoder_, storage_, std::move(options)} {}

  ledger_fixture(const ledger_fixture&) = delete;
  ledger_fixture& operator=(const ledger_fixture&) = delete;
  ledger_fixture(ledger_fixture&&) = delete;
  ledger_fixture& operator=(ledger_fixture&&) = delete;

  scale_encoder_t& encoder() { return encoder_; }
  storage_t& storage() { return storage_; }
  provenance::execution::engine& engine() { return engine_; }

  /// Next valid nonce for `keypair` against committed state.
  uint64_t next_nonce(const provenance::crypto::ed25519_keypair& keypair) {
    return engine_.nonce(identity(keypair)) + 1;
  }

  provenance::schema::bytes_t signed_tx(
      const provenance::crypto::ed25519_keypair& keypair,
      provenance::schema::transaction_payload_t payload,
      std::optional<uint64_t> nonce = std::nullopt) {
    auto tx = sign_transaction(encoder_, engine_.chain_id(),
                               nonce.value_or(next_nonce(keypair)), keypair,
                               std::move(payload));
    return encoder_.encode(tx);
  }

  provenance::schema::block_result_t run_block(
      const std::vector<provenance::schema::bytes_t>& txs) {
    auto height =
        static_cast<uint64_t>(engine_.info().last_block_height) + 1;
    auto block = engine_.finalize_block(height, 1'700'000'000'000 + height,
                                        txs);
    (void)engine_.commit();
    return block;
  }

  provenance::schema::transaction_result_t execute(
      const provenance::crypto::ed25519_keypair& keypair,
      provenance::schema::transaction_payload_t payload) {
    auto block = run_block({signed_tx(keypair, std::move(payload))});
    EXPECT_EQ(block.tx_results.size(), 1u);
    return block.tx_results.front();
  }

  std::vector<provenance::schema::tracking_event_t> custody_events(
      const provenance::schema::product_id_t& product_id) {
    return collect(engine_.events(product_id));
  }

  std::vector<provenance::schema::tracking_event_t> governance_events(
      const provenance::schema::product_id_t& product_id) {
    return collect(engine_.governance(product_id));
  }

 private:
  static std::vector<provenance::schema::tracking_event_t> collect(
      const std::optional<provenance::execution::event_reader>& reader) {
    auto out = std::vector<provenance::schema::tracking_event_t>{};
    if (!reader) {
      return out;
    }
    for (const auto& event : reader.value()) {
      out.push_back(event);
    }
    return out;
  }

  scale_encoder_t encoder_;
  storage_t storage_;
  provenance::execution::engine engine_;
};

}  // namespace provenance::testing
