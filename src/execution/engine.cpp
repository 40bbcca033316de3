#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <provenance/blake3/hash.hpp>
#include <provenance/common/critical.hpp>
#include <provenance/crypto/verify.hpp>
#include <provenance/execution/authorization.hpp>
#include <provenance/execution/engine.hpp>
#include <provenance/execution/signing.hpp>
#include <provenance/execution/validation.hpp>
#include <provenance/schema/encoding/scale/encoder.hpp>
#include <provenance/schema/governance_event_type.hpp>
#include <provenance/schema/key/engine_keys.hpp>
#include <provenance/schema/query_error_code.hpp>
#include <tuple>
#include <utility>

using namespace provenance::schema;

namespace {

using encoder_t = provenance::schema::encoding::encoder<
    provenance::schema::encoding::scale_encoder_tag>;

constexpr auto kCheckTxCodespace = std::string_view{"provenance.checktx"};
constexpr auto kFinalizeCodespace = std::string_view{"provenance.finalize"};
constexpr auto kExecuteCodespace = std::string_view{"provenance.execute"};
constexpr auto kQueryCodespace = std::string_view{"provenance.query"};

// Upper bound on the number of records one read query returns.
constexpr auto kMaxQueryPage = uint64_t{1000};

hash32_t fold_state_root(const hash32_t& seed,
                         const bytes_t& tx,
                         uint64_t height,
                         uint64_t index) {
  auto material = bytes_t{};
  material.reserve(seed.size() + tx.size() + 16);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  material.insert(std::end(material), std::begin(encoded_suffix),
                  std::end(encoded_suffix));
  return provenance::blake3::hash(bytes_view_t{material.data(), material.size()});
}

std::optional<transaction_t> decode_transaction(const bytes_view_t& raw_tx,
                                                std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<transaction_t>(raw_tx);
  if (!tx) {
    error = "malformed SCALE transaction";
  }
  return tx;
}

transaction_result_t make_error_result(transaction_error_code code,
                                       std::string log,
                                       std::string info,
                                       std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

transaction_event_t make_event(
    std::string type,
    std::vector<std::pair<std::string, std::string>> attributes) {
  auto event = transaction_event_t{};
  event.type = std::move(type);
  event.attributes.reserve(attributes.size());
  for (auto& [key, value] : attributes) {
    event.attributes.push_back(transaction_event_attribute_t{
        .key = std::move(key), .value = std::move(value), .index = true});
  }
  return event;
}

query_result_t make_query_error(query_error_code code,
                                std::string log,
                                const bytes_view_t& key,
                                int64_t height) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.key = make_bytes(key);
  result.height = height;
  result.codespace = std::string{kQueryCodespace};
  return result;
}

std::string_view payload_name(const transaction_payload_t& payload) {
  return std::visit(
      overloaded{
          [](const register_product_t&) {
            return std::string_view{"register_product"};
          },
          [](const add_tracking_event_t&) {
            return std::string_view{"add_tracking_event"};
          },
          [](const add_tracking_events_batch_t&) {
            return std::string_view{"add_tracking_events_batch"};
          },
          [](const transfer_ownership_t&) {
            return std::string_view{"transfer_ownership"};
          },
          [](const add_authorized_actor_t&) {
            return std::string_view{"add_authorized_actor"};
          },
          [](const remove_authorized_actor_t&) {
            return std::string_view{"remove_authorized_actor"};
          },
          [](const register_event_type_t&) {
            return std::string_view{"register_event_type"};
          },
          [](const set_product_active_t&) {
            return std::string_view{"set_product_active"};
          }},
      payload);
}

// End of a page of `size` records starting at `from`.
uint64_t page_end(uint64_t size, uint64_t from, std::optional<uint64_t> limit) {
  if (limit && from < size && limit.value() < size - from) {
    return from + limit.value();
  }
  return size;
}

bool has_more_after(const event_page_t& page, uint64_t from) {
  return page.total_count > from &&
         page.total_count - from > page.events.size();
}

}  // namespace

namespace provenance::execution {

/// Read-through view of ledger state for one transaction: the transaction's
/// own writes, then the block's pending writes, then committed storage.
/// Writes land only in the transaction buffer.
class engine::state_view final {
 public:
  state_view(encoder_t& encoder,
             const storage_t& storage,
             const write_buffer* block_writes,
             write_buffer* tx_writes)
      : encoder_{encoder},
        storage_{storage},
        block_writes_{block_writes},
        tx_writes_{tx_writes} {}

  template <typename T>
  std::optional<T> get(const bytes_t& key) const {
    if (tx_writes_ != nullptr) {
      if (auto value = tx_writes_->find(key)) {
        return encoder_.decode<T>(make_bytes_view(value.value()));
      }
    }
    if (block_writes_ != nullptr) {
      if (auto value = block_writes_->find(key)) {
        return encoder_.decode<T>(make_bytes_view(value.value()));
      }
    }
    return storage_.get<T>(encoder_, make_bytes_view(key));
  }

  bool contains(const bytes_t& key) const {
    if (tx_writes_ != nullptr && tx_writes_->find(key)) {
      return true;
    }
    if (block_writes_ != nullptr && block_writes_->find(key)) {
      return true;
    }
    return storage_.load(make_bytes_view(key)).has_value();
  }

  template <typename T>
  void put(bytes_t key, const T& value) {
    if (tx_writes_ == nullptr) {
      provenance::common::critical("write attempted through read-only state");
    }
    tx_writes_->put(std::move(key), encoder_.encode(value));
  }

  /// Stored counter for a product log. Registration creates both counters,
  /// so a missing one means the store is inconsistent.
  uint64_t counter(const bytes_t& key) const {
    auto value = get<uint64_t>(key);
    if (!value) {
      provenance::common::critical("product sequence counter is missing");
    }
    return value.value();
  }

 private:
  encoder_t& encoder_;
  const storage_t& storage_;
  const write_buffer* block_writes_;
  write_buffer* tx_writes_;
};

namespace {

struct execution_context final {
  const transaction_t& tx;
  uint64_t height;
  timestamp_milliseconds_t time_ms;
  uint64_t max_batch_size;
  uint64_t max_metadata_bytes;
};

tracking_event_t make_tracking_event(const execution_context& ctx,
                                     const product_id_t& product_id,
                                     uint64_t sequence,
                                     const event_input_t& input) {
  auto event = tracking_event_t{};
  event.product_id = product_id;
  event.sequence = sequence;
  event.actor = ctx.tx.signer;
  event.event_type = input.event_type;
  event.location = input.location;
  event.metadata = input.metadata;
  event.data_hash = input.data_hash;
  event.timestamp = ctx.time_ms;
  event.height = ctx.height;
  return event;
}

}  // namespace

engine::engine(encoder_t& encoder, storage_t& storage, engine_options options)
    : encoder_{encoder},
      storage_{storage},
      options_{std::move(options)},
      chain_id_{provenance::blake3::hash(std::string_view{options_.chain_id})},
      last_committed_state_root_{make_zero_hash()},
      pending_state_root_{make_zero_hash()},
      signature_verifier_{provenance::crypto::verify_signature} {
  auto lock = std::scoped_lock{mutex_};
  spdlog::info("Initializing provenance engine for chain '{}'",
               options_.chain_id);
  if (!options_.require_strict_crypto) {
    spdlog::warn("Strict crypto disabled; signatures will not be verified");
  } else if (!provenance::crypto::available()) {
    spdlog::warn("OpenSSL does not expose Ed25519 and secp256k1; signature "
                 "verification will reject every transaction");
  }
  load_persisted_state();
  spdlog::info("Provenance engine ready at height {}", last_committed_height_);
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  signature_verifier_ = std::move(verifier);
}

transaction_result_t engine::validate_transaction(const transaction_t& tx,
                                                  const state_view& state,
                                                  std::string_view codespace,
                                                  bool exact_nonce) const {
  if (tx.version != 1) {
    return make_error_result(
        transaction_error_code::unsupported_transaction_version,
        "unsupported transaction version", "expected version 1", codespace);
  }
  if (tx.chain_id != chain_id_) {
    return make_error_result(transaction_error_code::invalid_chain_id,
                             "invalid chain id",
                             "transaction targets a different chain",
                             codespace);
  }

  auto last_nonce =
      state.get<uint64_t>(key::make_nonce_key(encoder_, tx.signer)).value_or(0);
  auto nonce_ok =
      exact_nonce ? tx.nonce == last_nonce + 1 : tx.nonce > last_nonce;
  if (!nonce_ok) {
    return make_error_result(
        transaction_error_code::invalid_nonce, "invalid nonce",
        fmt::format("expected nonce {} got {}", last_nonce + 1, tx.nonce),
        codespace);
  }

  if (options_.require_strict_crypto) {
    auto signature_type_ok = std::visit(
        overloaded{[&](const ed25519_signer_id&) {
                     return std::holds_alternative<ed25519_signature_t>(
                         tx.signature);
                   },
                   [&](const secp256k1_signer_id&) {
                     return std::holds_alternative<secp256k1_signature_t>(
                         tx.signature);
                   },
                   [](const named_signer_t&) { return false; }},
        tx.signer);
    if (!signature_type_ok) {
      return make_error_result(
          transaction_error_code::invalid_signature_type,
          "invalid signature type",
          "signature kind does not match the signer key kind", codespace);
    }
    auto message = make_signing_message(encoder_, tx);
    if (!signature_verifier_ ||
        !signature_verifier_(make_bytes_view(message), tx.signer,
                             tx.signature)) {
      return make_error_result(
          transaction_error_code::signature_verification_failed,
          "signature verification failed", to_string(tx.signer), codespace);
    }
  }

  return transaction_result_t{};
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             "invalid transaction", decode_error,
                             kCheckTxCodespace);
  }
  auto committed = state_view{encoder_, storage_, nullptr, nullptr};
  auto result = validate_transaction(maybe_tx.value(), committed,
                                     kCheckTxCodespace, false);
  if (result.code == 0) {
    result.info = std::string{payload_name(maybe_tx->payload)};
  }
  return result;
}

transaction_result_t engine::execute_operation(const transaction_t& tx,
                                               state_view& state) {
  auto ctx = execution_context{.tx = tx,
                               .height = current_block_height_,
                               .time_ms = current_block_time_ms_,
                               .max_batch_size = options_.max_batch_size,
                               .max_metadata_bytes = options_.max_metadata_bytes};

  auto fail = [](transaction_error_code code, std::string log,
                 std::string info = {}) {
    return make_error_result(code, std::move(log), std::move(info),
                             kExecuteCodespace);
  };

  auto load_product =
      [&](const product_id_t& product_id) -> std::optional<product_state_t> {
    return state.get<product_state_t>(
        key::make_product_key(encoder_, product_id));
  };

  auto append_governance = [&](const product_state_t& product,
                               governance_event_type_t type,
                               bytes_t metadata) {
    auto sequence_key =
        key::make_governance_sequence_key(encoder_, product.product_id);
    auto sequence = state.counter(sequence_key);
    auto record = tracking_event_t{};
    record.product_id = product.product_id;
    record.sequence = sequence;
    record.actor = tx.signer;
    record.event_type = std::string{to_string(type)};
    record.metadata = std::move(metadata);
    record.timestamp = ctx.time_ms;
    record.height = ctx.height;
    state.put(key::make_governance_key(encoder_, product.product_id, sequence),
              record);
    state.put(std::move(sequence_key), uint64_t{sequence + 1});
  };

  return std::visit(
      overloaded{
          [&](const register_product_t& op) -> transaction_result_t {
            if (auto error = validate_product(op)) {
              return fail(transaction_error_code::invalid_product,
                          "invalid product", error.value());
            }
            auto product_key = key::make_product_key(encoder_, op.product_id);
            if (state.contains(product_key)) {
              return fail(transaction_error_code::product_exists,
                          "product already exists", op.product_id);
            }
            auto product = product_state_t{};
            product.product_id = op.product_id;
            product.name = op.name;
            product.origin = op.origin;
            product.description = op.description;
            product.category = op.category;
            product.tags = op.tags;
            product.certifications = op.certifications;
            product.media_hashes = op.media_hashes;
            product.custom = op.custom;
            std::sort(std::begin(product.custom), std::end(product.custom),
                      [](const custom_field_t& lhs, const custom_field_t& rhs) {
                        return lhs.key < rhs.key;
                      });
            product.owner = tx.signer;
            product.created_at = ctx.time_ms;
            product.created_height = ctx.height;
            product.authorized_actors = {tx.signer};
            product.active = true;

            state.put(std::move(product_key), product);
            state.put(key::make_event_sequence_key(encoder_, op.product_id),
                      uint64_t{0});
            state.put(
                key::make_governance_sequence_key(encoder_, op.product_id),
                uint64_t{0});

            auto result = transaction_result_t{};
            result.data = encoder_.encode(product);
            result.info = "register_product";
            result.events.push_back(make_event(
                "provenance.product_registered",
                {{"product_id", op.product_id},
                 {"owner", to_string(tx.signer)}}));
            return result;
          },
          [&](const add_tracking_event_t& op) -> transaction_result_t {
            auto product = load_product(op.product_id);
            if (!product) {
              return fail(transaction_error_code::product_missing,
                          "product not found", op.product_id);
            }
            if (auto denied = check_write_access(product.value(), tx.signer)) {
              return fail(denied.value(), "actor is not authorized",
                          to_string(tx.signer));
            }
            if (!product->active) {
              return fail(transaction_error_code::product_inactive,
                          "product is inactive", op.product_id);
            }
            if (auto error =
                    validate_event_input(op.event, ctx.max_metadata_bytes)) {
              return fail(transaction_error_code::invalid_event,
                          "invalid event", error.value());
            }
            auto sequence_key =
                key::make_event_sequence_key(encoder_, op.product_id);
            auto sequence = state.counter(sequence_key);
            auto event =
                make_tracking_event(ctx, op.product_id, sequence, op.event);
            state.put(key::make_event_key(encoder_, op.product_id, sequence),
                      event);
            state.put(std::move(sequence_key), uint64_t{sequence + 1});

            auto result = transaction_result_t{};
            result.data = encoder_.encode(event);
            result.info = "add_tracking_event";
            result.events.push_back(make_event(
                "provenance.event_added",
                {{"product_id", op.product_id},
                 {"sequence", std::to_string(sequence)},
                 {"event_type", event.event_type},
                 {"actor", to_string(tx.signer)}}));
            return result;
          },
          [&](const add_tracking_events_batch_t& op) -> transaction_result_t {
            auto product = load_product(op.product_id);
            if (!product) {
              return fail(transaction_error_code::product_missing,
                          "product not found", op.product_id);
            }
            if (auto denied = check_write_access(product.value(), tx.signer)) {
              return fail(denied.value(), "actor is not authorized",
                          to_string(tx.signer));
            }
            if (!product->active) {
              return fail(transaction_error_code::product_inactive,
                          "product is inactive", op.product_id);
            }
            if (op.events.size() > ctx.max_batch_size) {
              return fail(transaction_error_code::batch_too_large,
                          "batch too large",
                          fmt::format("{} events exceeds limit of {}",
                                      op.events.size(), ctx.max_batch_size));
            }
            if (op.events.empty()) {
              return fail(transaction_error_code::invalid_batch,
                          "invalid batch", "batch is empty");
            }
            for (size_t i = 0; i < op.events.size(); ++i) {
              if (auto error = validate_event_input(op.events[i],
                                                    ctx.max_metadata_bytes)) {
                return fail(transaction_error_code::invalid_batch,
                            "invalid batch",
                            fmt::format("event {}: {}", i, error.value()));
              }
            }

            auto sequence_key =
                key::make_event_sequence_key(encoder_, op.product_id);
            auto first = state.counter(sequence_key);
            auto stored = std::vector<tracking_event_t>{};
            stored.reserve(op.events.size());
            for (const auto& input : op.events) {
              auto sequence = static_cast<uint64_t>(first + stored.size());
              auto event =
                  make_tracking_event(ctx, op.product_id, sequence, input);
              state.put(key::make_event_key(encoder_, op.product_id, sequence),
                        event);
              stored.push_back(std::move(event));
            }
            state.put(std::move(sequence_key),
                      static_cast<uint64_t>(first + stored.size()));

            auto result = transaction_result_t{};
            result.data = encoder_.encode(stored);
            result.info = "add_tracking_events_batch";
            result.events.push_back(make_event(
                "provenance.events_batch_added",
                {{"product_id", op.product_id},
                 {"first_sequence", std::to_string(first)},
                 {"count", std::to_string(stored.size())},
                 {"actor", to_string(tx.signer)}}));
            return result;
          },
          [&](const transfer_ownership_t& op) -> transaction_result_t {
            auto product = load_product(op.product_id);
            if (!product) {
              return fail(transaction_error_code::product_missing,
                          "product not found", op.product_id);
            }
            if (auto denied = check_owner(product.value(), tx.signer)) {
              return fail(denied.value(), "only the owner may transfer",
                          to_string(tx.signer));
            }
            auto result = transaction_result_t{};
            result.info = "transfer_ownership";
            if (op.new_owner == product->owner) {
              result.data = encoder_.encode(product.value());
              result.log = "owner unchanged";
              return result;
            }

            auto previous = product->owner;
            auto& actors = product->authorized_actors;
            actors.erase(std::remove(std::begin(actors), std::end(actors),
                                     previous),
                         std::end(actors));
            if (!is_authorized_actor(product.value(), op.new_owner)) {
              actors.push_back(op.new_owner);
            }
            product->owner = op.new_owner;
            state.put(key::make_product_key(encoder_, op.product_id),
                      product.value());
            append_governance(product.value(),
                              governance_event_type_t::ownership_transfer,
                              encoder_.encode(std::tuple{previous, op.new_owner}));

            result.data = encoder_.encode(product.value());
            result.events.push_back(make_event(
                "provenance.ownership_transferred",
                {{"product_id", op.product_id},
                 {"previous_owner", to_string(previous)},
                 {"new_owner", to_string(op.new_owner)}}));
            return result;
          },
          [&](const add_authorized_actor_t& op) -> transaction_result_t {
            auto product = load_product(op.product_id);
            if (!product) {
              return fail(transaction_error_code::product_missing,
                          "product not found", op.product_id);
            }
            if (auto denied = check_owner(product.value(), tx.signer)) {
              return fail(denied.value(), "only the owner may grant access",
                          to_string(tx.signer));
            }
            auto result = transaction_result_t{};
            result.info = "add_authorized_actor";
            if (is_authorized_actor(product.value(), op.actor)) {
              result.data = encoder_.encode(product.value());
              result.log = "actor already authorized";
              return result;
            }
            product->authorized_actors.push_back(op.actor);
            state.put(key::make_product_key(encoder_, op.product_id),
                      product.value());
            append_governance(product.value(),
                              governance_event_type_t::access_granted,
                              encoder_.encode(op.actor));

            result.data = encoder_.encode(product.value());
            result.events.push_back(
                make_event("provenance.access_granted",
                           {{"product_id", op.product_id},
                            {"actor", to_string(op.actor)}}));
            return result;
          },
          [&](const remove_authorized_actor_t& op) -> transaction_result_t {
            auto product = load_product(op.product_id);
            if (!product) {
              return fail(transaction_error_code::product_missing,
                          "product not found", op.product_id);
            }
            if (auto denied = check_owner(product.value(), tx.signer)) {
              return fail(denied.value(), "only the owner may revoke access",
                          to_string(tx.signer));
            }
            auto result = transaction_result_t{};
            result.info = "remove_authorized_actor";
            if (!is_authorized_actor(product.value(), op.actor)) {
              result.data = encoder_.encode(product.value());
              result.log = "actor not authorized";
              return result;
            }
            auto& actors = product->authorized_actors;
            actors.erase(
                std::remove(std::begin(actors), std::end(actors), op.actor),
                std::end(actors));
            state.put(key::make_product_key(encoder_, op.product_id),
                      product.value());
            append_governance(product.value(),
                              governance_event_type_t::access_revoked,
                              encoder_.encode(op.actor));

            result.data = encoder_.encode(product.value());
            result.events.push_back(
                make_event("provenance.access_revoked",
                           {{"product_id", op.product_id},
                            {"actor", to_string(op.actor)}}));
            return result;
          },
          [&](const register_event_type_t& op) -> transaction_result_t {
            if (is_reserved_event_type(op.event_type)) {
              return fail(transaction_error_code::event_type_reserved,
                          "event type is reserved", op.event_type);
            }
            if (auto error = validate_event_type(op)) {
              return fail(transaction_error_code::invalid_event,
                          "invalid event type", error.value());
            }
            auto record_key = key::make_event_type_key(encoder_, op.event_type);
            if (state.contains(record_key)) {
              return fail(transaction_error_code::event_type_exists,
                          "event type already registered", op.event_type);
            }
            auto record = event_type_record_t{};
            record.event_type = op.event_type;
            record.label = op.label;
            record.registered_by = tx.signer;
            record.registered_at = ctx.time_ms;
            state.put(std::move(record_key), record);

            auto result = transaction_result_t{};
            result.data = encoder_.encode(record);
            result.info = "register_event_type";
            result.events.push_back(
                make_event("provenance.event_type_registered",
                           {{"event_type", op.event_type}}));
            return result;
          },
          [&](const set_product_active_t& op) -> transaction_result_t {
            auto product = load_product(op.product_id);
            if (!product) {
              return fail(transaction_error_code::product_missing,
                          "product not found", op.product_id);
            }
            if (auto denied = check_owner(product.value(), tx.signer)) {
              return fail(denied.value(),
                          "only the owner may change product status",
                          to_string(tx.signer));
            }
            auto result = transaction_result_t{};
            result.info = "set_product_active";
            if (product->active == op.active) {
              result.data = encoder_.encode(product.value());
              result.log = "status unchanged";
              return result;
            }
            product->active = op.active;
            state.put(key::make_product_key(encoder_, op.product_id),
                      product.value());
            append_governance(product.value(),
                              governance_event_type_t::product_status,
                              encoder_.encode(op.active));

            result.data = encoder_.encode(product.value());
            result.events.push_back(make_event(
                "provenance.product_status_changed",
                {{"product_id", op.product_id},
                 {"active", op.active ? "true" : "false"}}));
            return result;
          }},
      tx.payload);
}

block_result_t engine::finalize_block(uint64_t height,
                                      timestamp_milliseconds_t time_ms,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  return finalize_locked(height, time_ms, txs);
}

block_result_t engine::finalize_locked(uint64_t height,
                                       timestamp_milliseconds_t time_ms,
                                       const std::vector<bytes_t>& txs) {
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());

  if (height <= static_cast<uint64_t>(last_committed_height_)) {
    spdlog::error("Rejecting block {} at or below committed height {}", height,
                  last_committed_height_);
    for (size_t i = 0; i < txs.size(); ++i) {
      result.tx_results.push_back(make_error_result(
          transaction_error_code::invalid_transaction, "stale block height",
          fmt::format("committed height is {}", last_committed_height_),
          kFinalizeCodespace));
    }
    result.state_root = last_committed_state_root_;
    return result;
  }

  // A re-finalized height replaces the previous candidate block.
  pending_writes_.clear();
  current_block_height_ = height;
  current_block_time_ms_ = time_ms;

  auto rolling_root = last_committed_state_root_;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto raw_tx = make_bytes_view(txs[i]);
    auto tx_result = transaction_result_t{};
    auto decode_error = std::string{};
    auto maybe_tx = decode_transaction(raw_tx, decode_error);
    if (!maybe_tx) {
      tx_result = make_error_result(transaction_error_code::invalid_transaction,
                                    "invalid transaction", decode_error,
                                    kFinalizeCodespace);
    } else {
      auto block_state = state_view{encoder_, storage_, &pending_writes_, nullptr};
      tx_result = validate_transaction(maybe_tx.value(), block_state,
                                       kFinalizeCodespace, true);
      if (tx_result.code == 0) {
        // An executed transaction consumes its nonce even when the operation
        // fails, so the same signed bytes can never be replayed later.
        pending_writes_.put(key::make_nonce_key(encoder_, maybe_tx->signer),
                            encoder_.encode(maybe_tx->nonce));

        auto tx_writes = write_buffer{};
        auto tx_state =
            state_view{encoder_, storage_, &pending_writes_, &tx_writes};
        tx_result = execute_operation(maybe_tx.value(), tx_state);
        if (tx_result.code == 0) {
          pending_writes_.merge(std::move(tx_writes));
          rolling_root = fold_state_root(rolling_root, txs[i], height, i);
        }
      }
    }

    if (tx_result.code != 0) {
      spdlog::debug("Transaction {} in block {} failed with code {}: {} ({})",
                    i, height, tx_result.code, tx_result.log, tx_result.info);
    }

    auto entry = history_entry_t{};
    entry.height = height;
    entry.index = static_cast<uint32_t>(i);
    entry.code = tx_result.code;
    entry.tx = txs[i];
    pending_writes_.put(
        key::make_history_key(encoder_, height, static_cast<uint32_t>(i)),
        encoder_.encode(entry));

    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  return commit_locked();
}

bool engine::has_pending_block() const {
  auto lock = std::scoped_lock{mutex_};
  return pending_height_ != 0;
}

std::optional<committed_block> engine::execute_and_commit(
    timestamp_milliseconds_t time_ms,
    const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_ != 0) {
    spdlog::warn("Refusing to replace finalized block {} awaiting commit",
                 pending_height_);
    return std::nullopt;
  }
  auto height = static_cast<uint64_t>(last_committed_height_) + 1;
  auto block = finalize_locked(height, time_ms, txs);
  return committed_block{.block = std::move(block), .commit = commit_locked()};
}

commit_result_t engine::commit_locked() {
  if (pending_height_ > 0) {
    storage_.commit(pending_writes_.entries(),
                    provenance::storage::committed_state{
                        .height = pending_height_,
                        .state_root = pending_state_root_});
    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_height_ = 0;
    pending_writes_.clear();
    spdlog::info("Committed block {} state_root={}", last_committed_height_,
                 to_hex(last_committed_state_root_));
  }

  auto result = commit_result_t{};
  result.retain_height = 0;
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  result.chain_id = chain_id_;
  return result;
}

std::optional<product_state_t> engine::product(
    const product_id_t& product_id) const {
  auto lock = std::scoped_lock{mutex_};
  return storage_.get<product_state_t>(
      encoder_, make_bytes_view(key::make_product_key(encoder_, product_id)));
}

std::optional<bool> engine::is_authorized(const product_id_t& product_id,
                                          const signer_id_t& identity) const {
  auto found = product(product_id);
  if (!found) {
    return std::nullopt;
  }
  return !check_write_access(found.value(), identity).has_value();
}

std::optional<uint64_t> engine::log_size(event_log log,
                                         const product_id_t& product_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto counter_key = log == event_log::governance
                         ? key::make_governance_sequence_key(encoder_, product_id)
                         : key::make_event_sequence_key(encoder_, product_id);
  return storage_.get<uint64_t>(encoder_, make_bytes_view(counter_key));
}

std::optional<event_reader> engine::make_reader(
    event_log log,
    const product_id_t& product_id,
    uint64_t from,
    std::optional<uint64_t> limit) const {
  auto size = log_size(log, product_id);
  if (!size) {
    return std::nullopt;
  }
  return event_reader{encoder_, storage_, log, product_id, from,
                      page_end(size.value(), from, limit)};
}

std::optional<event_page_t> engine::page(event_log log,
                                         const product_id_t& product_id,
                                         uint64_t from,
                                         uint64_t limit) const {
  auto size = log_size(log, product_id);
  if (!size) {
    return std::nullopt;
  }
  auto reader = event_reader{encoder_, storage_, log, product_id, from,
                             page_end(size.value(), from, limit)};
  auto result = event_page_t{};
  result.total_count = size.value();
  result.events.reserve(reader.size());
  for (const auto& event : reader) {
    result.events.push_back(event);
  }
  result.has_more = has_more_after(result, from);
  return result;
}

std::optional<event_page_t> engine::find_events(const product_id_t& product_id,
                                                const event_filter_t& filter,
                                                uint64_t from,
                                                uint64_t limit) const {
  auto reader = events(product_id);
  if (!reader) {
    return std::nullopt;
  }
  auto result = event_page_t{};
  for (const auto& event : reader.value()) {
    if (!matches(filter, event)) {
      continue;
    }
    if (result.total_count >= from && result.events.size() < limit) {
      result.events.push_back(event);
    }
    ++result.total_count;
  }
  result.has_more = has_more_after(result, from);
  return result;
}

std::optional<uint64_t> engine::count_events(
    const product_id_t& product_id,
    const std::optional<std::string>& event_type) const {
  if (!event_type) {
    return log_size(event_log::custody, product_id);
  }
  auto filter = event_filter_t{};
  filter.event_type = event_type;
  auto found = find_events(product_id, filter, 0, 0);
  if (!found) {
    return std::nullopt;
  }
  return found->total_count;
}

std::optional<event_reader> engine::events(const product_id_t& product_id,
                                           uint64_t from,
                                           std::optional<uint64_t> limit) const {
  return make_reader(event_log::custody, product_id, from, limit);
}

std::optional<event_reader> engine::governance(
    const product_id_t& product_id,
    uint64_t from,
    std::optional<uint64_t> limit) const {
  return make_reader(event_log::governance, product_id, from, limit);
}

std::optional<event_type_record_t> engine::event_type(
    std::string_view event_type) const {
  auto lock = std::scoped_lock{mutex_};
  return storage_.get<event_type_record_t>(
      encoder_,
      make_bytes_view(key::make_event_type_key(encoder_, event_type)));
}

uint64_t engine::nonce(const signer_id_t& signer) const {
  auto lock = std::scoped_lock{mutex_};
  return storage_
      .get<uint64_t>(encoder_,
                     make_bytes_view(key::make_nonce_key(encoder_, signer)))
      .value_or(0);
}

std::vector<history_entry_t> engine::history(uint64_t from_height,
                                             uint64_t to_height) const {
  auto lock = std::scoped_lock{mutex_};
  auto entries = std::vector<history_entry_t>{};
  to_height = std::min(to_height, static_cast<uint64_t>(last_committed_height_));
  if (from_height <= to_height && to_height - from_height >= kMaxQueryPage) {
    to_height = from_height + kMaxQueryPage - 1;
  }
  for (auto height = from_height; height <= to_height; ++height) {
    auto prefix = key::make_history_height_prefix(encoder_, height);
    for (const auto& [row_key, value] :
         storage_.list_by_prefix(make_bytes_view(prefix))) {
      if (!key::parse_history_key(encoder_, make_bytes_view(row_key))) {
        continue;
      }
      entries.push_back(
          encoder_.decode<history_entry_t>(make_bytes_view(value)));
    }
    if (height == to_height) {
      break;
    }
  }
  std::sort(std::begin(entries), std::end(entries),
            [](const history_entry_t& lhs, const history_entry_t& rhs) {
              return std::tie(lhs.height, lhs.index) <
                     std::tie(rhs.height, rhs.index);
            });
  return entries;
}

query_result_t engine::query(std::string_view path, const bytes_view_t& data) {
  auto height = info().last_block_height;
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = height;
  result.codespace = std::string{kQueryCodespace};

  auto invalid_key = [&](std::string log) {
    return make_query_error(query_error_code::invalid_key, std::move(log), data,
                            height);
  };
  auto not_found = [&](std::string log) {
    return make_query_error(query_error_code::not_found, std::move(log), data,
                            height);
  };

  auto page_size = [](const std::optional<uint64_t>& limit) {
    return std::min(limit.value_or(kMaxQueryPage), kMaxQueryPage);
  };

  if (path == "/engine/info") {
    auto current = info();
    result.value = encoder_.encode(std::tuple{
        current.last_block_height, current.last_block_state_root, chain_id_});
    return result;
  }

  if (path == "/state/product") {
    auto product_id = encoder_.try_decode<std::string>(data);
    if (!product_id) {
      return invalid_key("expected SCALE product id");
    }
    auto found = product(product_id.value());
    if (!found) {
      return not_found("product not found");
    }
    result.value = encoder_.encode(found.value());
    return result;
  }

  if (path == "/state/events" || path == "/state/governance") {
    auto request = encoder_.try_decode<
        std::tuple<std::string, uint64_t, std::optional<uint64_t>>>(data);
    if (!request) {
      return invalid_key("expected SCALE (product_id, from, limit?)");
    }
    const auto& [product_id, from, limit] = request.value();
    auto log = path == "/state/events" ? event_log::custody
                                       : event_log::governance;
    auto found = page(log, product_id, from, page_size(limit));
    if (!found) {
      return not_found("product not found");
    }
    result.value = encoder_.encode(found.value());
    return result;
  }

  if (path == "/state/events/by_type" || path == "/state/events/filter") {
    auto filter = event_filter_t{};
    auto product_id = std::string{};
    auto from = uint64_t{};
    auto limit = std::optional<uint64_t>{};
    if (path == "/state/events/by_type") {
      auto request = encoder_.try_decode<std::tuple<
          std::string, std::string, uint64_t, std::optional<uint64_t>>>(data);
      if (!request) {
        return invalid_key(
            "expected SCALE (product_id, event_type, from, limit?)");
      }
      std::tie(product_id, std::ignore, from, limit) = request.value();
      filter.event_type = std::get<1>(request.value());
    } else {
      auto request = encoder_.try_decode<std::tuple<
          std::string, event_filter_t, uint64_t, std::optional<uint64_t>>>(
          data);
      if (!request) {
        return invalid_key("expected SCALE (product_id, filter, from, limit?)");
      }
      std::tie(product_id, filter, from, limit) = request.value();
    }
    auto found = find_events(product_id, filter, from, page_size(limit));
    if (!found) {
      return not_found("product not found");
    }
    result.value = encoder_.encode(found.value());
    return result;
  }

  if (path == "/state/event_count") {
    auto request = encoder_.try_decode<
        std::tuple<std::string, std::optional<std::string>>>(data);
    if (!request) {
      return invalid_key("expected SCALE (product_id, event_type?)");
    }
    auto count =
        count_events(std::get<0>(request.value()), std::get<1>(request.value()));
    if (!count) {
      return not_found("product not found");
    }
    result.value = encoder_.encode(count.value());
    return result;
  }

  if (path == "/state/event") {
    auto request = encoder_.try_decode<std::tuple<std::string, uint64_t>>(data);
    if (!request) {
      return invalid_key("expected SCALE (product_id, sequence)");
    }
    const auto& [product_id, sequence] = request.value();
    auto reader = events(product_id, sequence, 1);
    if (!reader) {
      return not_found("product not found");
    }
    auto event = reader->at(sequence);
    if (!event) {
      return not_found("event not found");
    }
    result.value = encoder_.encode(event.value());
    return result;
  }

  if (path == "/state/authorized") {
    auto request =
        encoder_.try_decode<std::tuple<std::string, signer_id_t>>(data);
    if (!request) {
      return invalid_key("expected SCALE (product_id, signer)");
    }
    auto allowed =
        is_authorized(std::get<0>(request.value()), std::get<1>(request.value()));
    if (!allowed) {
      return not_found("product not found");
    }
    result.value = encoder_.encode(allowed.value());
    return result;
  }

  if (path == "/state/event_type") {
    auto tag = encoder_.try_decode<std::string>(data);
    if (!tag) {
      return invalid_key("expected SCALE event type");
    }
    auto record = event_type(tag.value());
    if (!record) {
      return not_found("event type not registered");
    }
    result.value = encoder_.encode(record.value());
    return result;
  }

  if (path == "/state/nonce") {
    auto signer = encoder_.try_decode<signer_id_t>(data);
    if (!signer) {
      return invalid_key("expected SCALE signer");
    }
    result.value = encoder_.encode(nonce(signer.value()));
    return result;
  }

  if (path == "/history/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range) {
      return invalid_key("expected SCALE (from_height, to_height)");
    }
    const auto& [from_height, to_height] = range.value();
    if (from_height > to_height) {
      return invalid_key("from_height is above to_height");
    }
    result.value = encoder_.encode(history(from_height, to_height));
    return result;
  }

  return make_query_error(query_error_code::unsupported_path,
                          "unsupported path", data, height);
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
    pending_state_root_ = committed->state_root;
  }

  auto chain_key = key::make_chain_id_key(encoder_);
  auto stored_chain = storage_.get<hash32_t>(encoder_, make_bytes_view(chain_key));
  if (!stored_chain) {
    storage_.put(encoder_, make_bytes_view(chain_key), chain_id_);
  } else if (stored_chain.value() != chain_id_) {
    provenance::common::critical(
        "chain id does not match the store",
        fmt::format("store belongs to chain {} but '{}' hashes to {}",
                    to_hex(stored_chain.value()), options_.chain_id,
                    to_hex(chain_id_)));
  }
}

}  // namespace provenance::execution
