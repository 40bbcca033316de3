#pragma once
#include <provenance/schema/add_authorized_actor.hpp>
#include <provenance/schema/add_tracking_event.hpp>
#include <provenance/schema/add_tracking_events_batch.hpp>
#include <provenance/schema/primitives.hpp>
#include <provenance/schema/register_event_type.hpp>
#include <provenance/schema/register_product.hpp>
#include <provenance/schema/remove_authorized_actor.hpp>
#include <provenance/schema/set_product_active.hpp>
#include <provenance/schema/transfer_ownership.hpp>
#include <variant>

namespace provenance::schema {

using transaction_payload_t = std::variant<register_product_t,
                                           add_tracking_event_t,
                                           add_tracking_events_batch_t,
                                           transfer_ownership_t,
                                           add_authorized_actor_t,
                                           remove_authorized_actor_t,
                                           register_event_type_t,
                                           set_product_active_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  signer_id_t signer{};
  transaction_payload_t payload{};
  signature_t signature;
};

using transaction_t = transaction<1>;

}  // namespace provenance::schema
