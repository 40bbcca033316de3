#pragma once
#include <provenance/schema/primitives.hpp>
#include <cstdint>

// Schema type: transfer ownership.
// Ledger workflow: Hand over control of a product. Only the current owner may
// sign it; the previous owner loses write access unless re-added.
namespace provenance::schema {

template <uint16_t Version>
struct transfer_ownership;

template <>
struct transfer_ownership<1> final {
  uint16_t version{1};
  product_id_t product_id;
  signer_id_t new_owner{};
};

using transfer_ownership_t = transfer_ownership<1>;

}  // namespace provenance::schema
