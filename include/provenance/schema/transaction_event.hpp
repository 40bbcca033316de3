#pragma once

#include <provenance/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: transaction event.
// Ledger workflow: Notification emitted by a successful transaction (for
// example `provenance.product_registered`) so off-chain indexers can follow the
// ledger without decoding state.
namespace provenance::schema {

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

}  // namespace provenance::schema
