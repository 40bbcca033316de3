#pragma once
#include <provenance/schema/custom_field.hpp>
#include <provenance/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: register product.
// Ledger workflow: Producer onboarding of a physical item. The transaction
// signer becomes the owner and the only initial authorized actor.
namespace provenance::schema {

template <uint16_t Version>
struct register_product;

template <>
struct register_product<1> final {
  uint16_t version{1};
  product_id_t product_id;
  std::string name;
  std::string origin;
  std::string description;
  std::string category;
  std::vector<std::string> tags;
  std::vector<hash32_t> certifications;
  std::vector<hash32_t> media_hashes;
  std::vector<custom_field_t> custom;
};

using register_product_t = register_product<1>;

}  // namespace provenance::schema
