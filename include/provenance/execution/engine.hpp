#pragma once

#include <provenance/execution/event_reader.hpp>
#include <provenance/execution/write_buffer.hpp>
#include <provenance/schema/app_info.hpp>
#include <provenance/schema/block_result.hpp>
#include <provenance/schema/commit_result.hpp>
#include <provenance/schema/encoding/encoder.hpp>
#include <provenance/schema/event_filter.hpp>
#include <provenance/schema/event_page.hpp>
#include <provenance/schema/event_type_record.hpp>
#include <provenance/schema/history_entry.hpp>
#include <provenance/schema/primitives.hpp>
#include <provenance/schema/product_state.hpp>
#include <provenance/schema/query_result.hpp>
#include <provenance/schema/transaction.hpp>
#include <provenance/schema/transaction_error_code.hpp>
#include <provenance/schema/transaction_result.hpp>
#include <provenance/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace provenance::execution {

/// Signature check consulted for every transaction under strict crypto.
/// Defaults to `crypto::verify_signature`.
using signature_verifier_t =
    std::function<bool(const provenance::schema::bytes_view_t& message,
                       const provenance::schema::signer_id_t& signer,
                       const provenance::schema::signature_t& signature)>;

/// Runtime policy for the ledger state machine.
struct engine_options final {
  /// Human readable network name; transactions carry its BLAKE3 hash.
  std::string chain_id{"provenance-local"};
  /// When false, signatures are not verified (test networks only). Envelope
  /// checks (version, chain id, nonce) still apply.
  bool require_strict_crypto{true};
  uint32_t max_batch_size{100};
  uint64_t max_metadata_bytes{4096};
};

/// A block executed and committed in one step.
struct committed_block final {
  provenance::schema::block_result_t block;
  provenance::schema::commit_result_t commit;
};

/// Deterministic provenance ledger state machine.
///
/// The engine validates signed transactions, executes product registry,
/// event ledger and access management operations against buffered state,
/// folds successful transactions into a state root and persists each block
/// atomically on commit. Every public entry point runs under one mutex.
class engine final {
 public:
  using encoder_t = provenance::schema::encoding::encoder<
      provenance::schema::encoding::scale_encoder_tag>;
  using storage_t =
      provenance::storage::storage<provenance::storage::rocksdb_storage_tag>;

  /// Construct the engine over encoder/storage backends and runtime options.
  ///
  /// Refuses to start (critical) when the store was created for a different
  /// chain id.
  explicit engine(encoder_t& encoder,
                  storage_t& storage,
                  engine_options options = {});

  /// Admit a transaction for mempool inclusion (CheckTx semantics).
  ///
  /// Performs decode + envelope + signature checks against committed state;
  /// does not mutate application state.
  provenance::schema::transaction_result_t check_transaction(
      const provenance::schema::bytes_view_t& raw_tx);

  /// Execute a candidate block and compute its resulting state root.
  ///
  /// Transactions are processed in order; each one is all-or-nothing and
  /// per-tx results are returned even on failures. Nothing is durable until
  /// `commit`.
  provenance::schema::block_result_t finalize_block(
      uint64_t height,
      provenance::schema::timestamp_milliseconds_t time_ms,
      const std::vector<provenance::schema::bytes_t>& txs);

  /// Persist the finalized block (state, history, checkpoint) atomically.
  provenance::schema::commit_result_t commit();

  /// True between `finalize_block` and the matching `commit`.
  bool has_pending_block() const;

  /// Execute `txs` as the next block and commit it without releasing the
  /// engine in between. Returns std::nullopt, touching nothing, while a block
  /// finalized by another caller is still awaiting its commit.
  std::optional<committed_block> execute_and_commit(
      provenance::schema::timestamp_milliseconds_t time_ms,
      const std::vector<provenance::schema::bytes_t>& txs);

  /// Return application metadata (latest committed height and state root).
  provenance::schema::app_info_t info() const;

  /// Execute a read-path query by route against committed state.
  provenance::schema::query_result_t query(
      std::string_view path,
      const provenance::schema::bytes_view_t& data);

  /// Committed product record, if registered.
  std::optional<provenance::schema::product_state_t> product(
      const provenance::schema::product_id_t& product_id) const;

  /// Whether `identity` may append events; std::nullopt for an unknown
  /// product.
  std::optional<bool> is_authorized(
      const provenance::schema::product_id_t& product_id,
      const provenance::schema::signer_id_t& identity) const;

  /// Committed custody events in `[from, from + limit)`, clamped to the
  /// product's event count. std::nullopt for an unknown product.
  std::optional<event_reader> events(
      const provenance::schema::product_id_t& product_id,
      uint64_t from = 0,
      std::optional<uint64_t> limit = std::nullopt) const;

  /// Committed governance records (ownership, access and status changes).
  std::optional<event_reader> governance(
      const provenance::schema::product_id_t& product_id,
      uint64_t from = 0,
      std::optional<uint64_t> limit = std::nullopt) const;

  /// Up to `limit` records of `log` starting at `from`, with the log's total
  /// size and whether records remain past the page.
  std::optional<provenance::schema::event_page_t> page(
      event_log log,
      const provenance::schema::product_id_t& product_id,
      uint64_t from,
      uint64_t limit) const;

  /// Custody events matching `filter`, paged over the matches: `from` skips
  /// that many matching events and `total_count` counts all of them.
  std::optional<provenance::schema::event_page_t> find_events(
      const provenance::schema::product_id_t& product_id,
      const provenance::schema::event_filter_t& filter,
      uint64_t from,
      uint64_t limit) const;

  /// Number of custody events, or of those tagged `event_type` when given.
  std::optional<uint64_t> count_events(
      const provenance::schema::product_id_t& product_id,
      const std::optional<std::string>& event_type = std::nullopt) const;

  std::optional<provenance::schema::event_type_record_t> event_type(
      std::string_view event_type) const;

  /// Last nonce consumed by `signer` (0 when it never transacted).
  uint64_t nonce(const provenance::schema::signer_id_t& signer) const;

  /// Return history entries in the inclusive height range, clamped to the
  /// committed height and to at most 1000 heights per call.
  std::vector<provenance::schema::history_entry_t> history(
      uint64_t from_height,
      uint64_t to_height) const;

  /// BLAKE3 of the configured chain id string.
  const provenance::schema::hash32_t& chain_id() const { return chain_id_; }

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

 private:
  class state_view;

  /// Validate transaction envelope, signature, and nonce.
  ///
  /// `state` supplies the nonce: committed state for CheckTx, the block's
  /// buffered state during FinalizeBlock.
  provenance::schema::transaction_result_t validate_transaction(
      const provenance::schema::transaction_t& tx,
      const state_view& state,
      std::string_view codespace,
      bool exact_nonce) const;

  /// Execute a validated transaction payload against `state`.
  provenance::schema::transaction_result_t execute_operation(
      const provenance::schema::transaction_t& tx,
      state_view& state);

  provenance::schema::block_result_t finalize_locked(
      uint64_t height,
      provenance::schema::timestamp_milliseconds_t time_ms,
      const std::vector<provenance::schema::bytes_t>& txs);

  provenance::schema::commit_result_t commit_locked();

  /// Stored counter of `log`; std::nullopt for an unknown product.
  std::optional<uint64_t> log_size(
      event_log log,
      const provenance::schema::product_id_t& product_id) const;

  std::optional<event_reader> make_reader(
      event_log log,
      const provenance::schema::product_id_t& product_id,
      uint64_t from,
      std::optional<uint64_t> limit) const;

  /// Load committed state and verify the chain id at startup.
  void load_persisted_state();

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  engine_options options_;
  provenance::schema::hash32_t chain_id_;
  int64_t last_committed_height_{};
  provenance::schema::hash32_t last_committed_state_root_;
  int64_t pending_height_{};
  provenance::schema::hash32_t pending_state_root_;
  write_buffer pending_writes_;
  uint64_t current_block_height_{};
  provenance::schema::timestamp_milliseconds_t current_block_time_ms_{};
  signature_verifier_t signature_verifier_;
};

}  // namespace provenance::execution
