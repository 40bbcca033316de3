#pragma once
#include <provenance/schema/primitives.hpp>
#include <cstdint>

// Schema type: set product active.
// Ledger workflow: Owner retires (or reinstates) a product. An inactive
// product keeps its history but accepts no new custody events.
namespace provenance::schema {

template <uint16_t Version>
struct set_product_active;

template <>
struct set_product_active<1> final {
  uint16_t version{1};
  product_id_t product_id;
  bool active{true};
};

using set_product_active_t = set_product_active<1>;

}  // namespace provenance::schema
