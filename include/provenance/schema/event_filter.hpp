#pragma once
#include <provenance/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: event filter.
// Ledger workflow: Read side selection over a product's custody log. Unset
// fields match everything; the time window is inclusive on both ends.
namespace provenance::schema {

template <uint16_t Version>
struct event_filter;

template <>
struct event_filter<1> final {
  uint16_t version{1};
  std::optional<std::string> event_type;
  std::optional<timestamp_milliseconds_t> start_time;
  std::optional<timestamp_milliseconds_t> end_time;
  std::optional<std::string> location;
};

using event_filter_t = event_filter<1>;

}  // namespace provenance::schema
