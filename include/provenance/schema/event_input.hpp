#pragma once
#include <provenance/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: event input.
// Ledger workflow: Caller supplied part of a tracking event, used by single
// and batch appends.
namespace provenance::schema {

template <uint16_t Version>
struct event_input;

template <>
struct event_input<1> final {
  uint16_t version{1};
  std::string event_type;
  std::string location;
  bytes_t metadata;
  std::optional<hash32_t> data_hash;
};

using event_input_t = event_input<1>;

}  // namespace provenance::schema
