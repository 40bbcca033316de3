#pragma once
#include <provenance/common/critical.hpp>
#include <provenance/schema/encoding/encoder.hpp>
#include <provenance/schema/encoding/scale/add_authorized_actor.hpp>
#include <provenance/schema/encoding/scale/add_tracking_event.hpp>
#include <provenance/schema/encoding/scale/add_tracking_events_batch.hpp>
#include <provenance/schema/encoding/scale/app_info.hpp>
#include <provenance/schema/encoding/scale/block_result.hpp>
#include <provenance/schema/encoding/scale/commit_result.hpp>
#include <provenance/schema/encoding/scale/custom_field.hpp>
#include <provenance/schema/encoding/scale/event_filter.hpp>
#include <provenance/schema/encoding/scale/event_input.hpp>
#include <provenance/schema/encoding/scale/event_page.hpp>
#include <provenance/schema/encoding/scale/event_type_record.hpp>
#include <provenance/schema/encoding/scale/history_entry.hpp>
#include <provenance/schema/encoding/scale/primitives.hpp>
#include <provenance/schema/encoding/scale/product_state.hpp>
#include <provenance/schema/encoding/scale/query_result.hpp>
#include <provenance/schema/encoding/scale/register_event_type.hpp>
#include <provenance/schema/encoding/scale/register_product.hpp>
#include <provenance/schema/encoding/scale/remove_authorized_actor.hpp>
#include <provenance/schema/encoding/scale/set_product_active.hpp>
#include <provenance/schema/encoding/scale/tracking_event.hpp>
#include <provenance/schema/encoding/scale/transaction.hpp>
#include <provenance/schema/encoding/scale/transaction_event.hpp>
#include <provenance/schema/encoding/scale/transaction_event_attribute.hpp>
#include <provenance/schema/encoding/scale/transaction_result.hpp>
#include <provenance/schema/encoding/scale/transfer_ownership.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace provenance::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  provenance::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, provenance::schema::bytes_t& out);

  template <typename T>
  T decode(const provenance::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const provenance::schema::bytes_view_t& bytes);
};

template <typename T>
provenance::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    provenance::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        provenance::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const provenance::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    provenance::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

// Untrusted input (transactions, query keys) goes through here; a malformed
// buffer is a rejected request, not a node fault.
template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const provenance::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace provenance::schema::encoding
