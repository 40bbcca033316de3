#pragma once
#include <provenance/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: event type record.
// Ledger workflow: Stored display registry entry for an event tag.
namespace provenance::schema {

template <uint16_t Version>
struct event_type_record;

template <>
struct event_type_record<1> final {
  uint16_t version{1};
  std::string event_type;
  std::string label;
  signer_id_t registered_by{};
  timestamp_milliseconds_t registered_at{};
};

using event_type_record_t = event_type_record<1>;

}  // namespace provenance::schema
