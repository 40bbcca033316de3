#pragma once
#include <provenance/schema/primitives.hpp>
#include <cstdint>

// Schema type: add authorized actor.
// Ledger workflow: Owner grants an identity permission to append events.
namespace provenance::schema {

template <uint16_t Version>
struct add_authorized_actor;

template <>
struct add_authorized_actor<1> final {
  uint16_t version{1};
  product_id_t product_id;
  signer_id_t actor{};
};

using add_authorized_actor_t = add_authorized_actor<1>;

}  // namespace provenance::schema
