#pragma once
#include <provenance/schema/primitives.hpp>
#include <cstdint>

// Schema type: remove authorized actor.
// Ledger workflow: Owner revokes an identity's permission to append events.
namespace provenance::schema {

template <uint16_t Version>
struct remove_authorized_actor;

template <>
struct remove_authorized_actor<1> final {
  uint16_t version{1};
  product_id_t product_id;
  signer_id_t actor{};
};

using remove_authorized_actor_t = remove_authorized_actor<1>;

}  // namespace provenance::schema
