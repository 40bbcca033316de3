#pragma once
#include <provenance/schema/event_input.hpp>
#include <provenance/schema/primitives.hpp>
#include <cstdint>

// Schema type: add tracking event.
// Ledger workflow: Append one custody event; the signer is the acting party.
namespace provenance::schema {

template <uint16_t Version>
struct add_tracking_event;

template <>
struct add_tracking_event<1> final {
  uint16_t version{1};
  product_id_t product_id;
  event_input_t event;
};

using add_tracking_event_t = add_tracking_event<1>;

}  // namespace provenance::schema
