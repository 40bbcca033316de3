#pragma once
#include <provenance/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: tracking event.
// Ledger workflow: One immutable custody/handling record of a product. The
// ledger assigns `sequence`, `timestamp` and `height`; nothing ever rewrites a
// stored event.
namespace provenance::schema {

template <uint16_t Version>
struct tracking_event;

template <>
struct tracking_event<1> final {
  uint16_t version{1};
  product_id_t product_id;
  uint64_t sequence{};
  signer_id_t actor{};
  std::string event_type;
  std::string location;
  bytes_t metadata;  // opaque to the ledger
  std::optional<hash32_t> data_hash;
  timestamp_milliseconds_t timestamp{};
  uint64_t height{};
};

using tracking_event_t = tracking_event<1>;

}  // namespace provenance::schema
