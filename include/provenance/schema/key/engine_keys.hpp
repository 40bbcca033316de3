#pragma once

#include <provenance/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>
#include <utility>

// Schema key type: engine keys.
// Ledger workflow: Canonical key prefixes and key codecs for product state,
// custody and governance logs, the event type registry, nonces and history.
namespace provenance::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kChainIdKeyPrefix{"SYS|STATE|CHAIN_ID|"};
inline constexpr std::string_view kProductKeyPrefix{"SYS|STATE|PRODUCT|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kGovernanceSeqKeyPrefix{
    "SYS|STATE|GOVERNANCE_SEQ|"};
inline constexpr std::string_view kEventTypeKeyPrefix{"SYS|STATE|EVENT_TYPE|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};
inline constexpr std::string_view kGovernancePrefix{"SYS|GOVERNANCE|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};

template <typename Encoder, typename T>
provenance::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                              std::string_view prefix,
                                              const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
provenance::schema::bytes_t make_prefix_key(Encoder& encoder,
                                            std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
provenance::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const provenance::schema::signer_id_t& signer) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, signer);
}

template <typename Encoder>
provenance::schema::bytes_t make_chain_id_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kChainIdKeyPrefix,
                           std::string_view{"CURRENT"});
}

template <typename Encoder>
provenance::schema::bytes_t make_product_key(
    Encoder& encoder,
    const provenance::schema::product_id_t& product_id) {
  return make_prefixed_key(encoder, kProductKeyPrefix, product_id);
}

template <typename Encoder>
provenance::schema::bytes_t make_event_sequence_key(
    Encoder& encoder,
    const provenance::schema::product_id_t& product_id) {
  return make_prefixed_key(encoder, kEventSeqKeyPrefix, product_id);
}

template <typename Encoder>
provenance::schema::bytes_t make_governance_sequence_key(
    Encoder& encoder,
    const provenance::schema::product_id_t& product_id) {
  return make_prefixed_key(encoder, kGovernanceSeqKeyPrefix, product_id);
}

template <typename Encoder>
provenance::schema::bytes_t make_event_key(
    Encoder& encoder,
    const provenance::schema::product_id_t& product_id,
    uint64_t sequence) {
  return make_prefixed_key(encoder, kEventPrefix,
                           std::tuple{product_id, sequence});
}

template <typename Encoder>
provenance::schema::bytes_t make_governance_key(
    Encoder& encoder,
    const provenance::schema::product_id_t& product_id,
    uint64_t sequence) {
  return make_prefixed_key(encoder, kGovernancePrefix,
                           std::tuple{product_id, sequence});
}

template <typename Encoder>
provenance::schema::bytes_t make_event_type_key(Encoder& encoder,
                                                std::string_view event_type) {
  return make_prefixed_key(encoder, kEventTypeKeyPrefix, event_type);
}

template <typename Encoder>
provenance::schema::bytes_t make_history_key(Encoder& encoder,
                                             uint64_t height,
                                             uint32_t index) {
  return make_prefixed_key(encoder, kHistoryPrefix, std::tuple{height, index});
}

/// Prefix shared by every history row of one block.
template <typename Encoder>
provenance::schema::bytes_t make_history_height_prefix(Encoder& encoder,
                                                       uint64_t height) {
  return make_prefixed_key(encoder, kHistoryPrefix, height);
}

template <typename Encoder>
std::optional<std::pair<uint64_t, uint32_t>> parse_history_key(
    Encoder& encoder,
    const provenance::schema::bytes_view_t& key) {
  auto decoded = encoder.template try_decode<
      std::tuple<std::string, std::tuple<uint64_t, uint32_t>>>(key);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  if (std::get<0>(decoded.value()) != kHistoryPrefix) {
    return std::nullopt;
  }
  return std::pair<uint64_t, uint32_t>{
      std::get<0>(std::get<1>(decoded.value())),
      std::get<1>(std::get<1>(decoded.value()))};
}

}  // namespace provenance::schema::key
