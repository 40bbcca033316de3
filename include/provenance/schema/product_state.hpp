#pragma once
#include <provenance/schema/custom_field.hpp>
#include <provenance/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: product state.
// Ledger workflow: Registered physical item. Identity and descriptive fields
// are fixed at registration; only `owner`, `authorized_actors` and `active`
// change, each through its dedicated operation.
namespace provenance::schema {

template <uint16_t Version>
struct product_state;

template <>
struct product_state<1> final {
  uint16_t version{1};
  product_id_t product_id;
  std::string name;
  std::string origin;
  std::string description;
  std::string category;
  std::vector<std::string> tags;
  std::vector<hash32_t> certifications;  // hashes of off chain certificates
  std::vector<hash32_t> media_hashes;
  std::vector<custom_field_t> custom;  // sorted by key
  signer_id_t owner{};
  timestamp_milliseconds_t created_at{};
  uint64_t created_height{};
  std::vector<signer_id_t> authorized_actors;  // insertion ordered, unique
  bool active{true};
};

using product_state_t = product_state<1>;

}  // namespace provenance::schema
