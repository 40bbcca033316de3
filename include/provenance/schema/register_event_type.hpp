#pragma once
#include <cstdint>
#include <string>

// Schema type: register event type.
// Ledger workflow: Publish a display label for an event tag. Tags never need
// to be registered before use.
namespace provenance::schema {

template <uint16_t Version>
struct register_event_type;

template <>
struct register_event_type<1> final {
  uint16_t version{1};
  std::string event_type;
  std::string label;
};

using register_event_type_t = register_event_type<1>;

}  // namespace provenance::schema
