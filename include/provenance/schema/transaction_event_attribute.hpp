#pragma once

#include <cstdint>
#include <string>

// Schema type: transaction event attribute.
// Ledger workflow: Key/value attribute of a transaction event, with an index
// flag for downstream indexers.
namespace provenance::schema {

template <uint16_t Version>
struct transaction_event_attribute;

template <>
struct transaction_event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using transaction_event_attribute_t = transaction_event_attribute<1>;

}  // namespace provenance::schema
