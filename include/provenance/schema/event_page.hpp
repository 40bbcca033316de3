#pragma once
#include <provenance/schema/tracking_event.hpp>
#include <cstdint>
#include <vector>

// Schema type: event page.
// Ledger workflow: One page of a product log. `total_count` counts every
// matching record, not just the ones in `events`.
namespace provenance::schema {

template <uint16_t Version>
struct event_page;

template <>
struct event_page<1> final {
  uint16_t version{1};
  std::vector<tracking_event_t> events;
  uint64_t total_count{};
  bool has_more{};
};

using event_page_t = event_page<1>;

}  // namespace provenance::schema
