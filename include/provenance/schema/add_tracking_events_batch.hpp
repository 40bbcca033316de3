#pragma once
#include <provenance/schema/event_input.hpp>
#include <provenance/schema/primitives.hpp>
#include <cstdint>
#include <vector>

// Schema type: add tracking events batch.
// Ledger workflow: All-or-nothing append of an ordered list of custody events
// to one product. Authorization is checked once for the whole batch.
namespace provenance::schema {

template <uint16_t Version>
struct add_tracking_events_batch;

template <>
struct add_tracking_events_batch<1> final {
  uint16_t version{1};
  product_id_t product_id;
  std::vector<event_input_t> events;
};

using add_tracking_events_batch_t = add_tracking_events_batch<1>;

}  // namespace provenance::schema
