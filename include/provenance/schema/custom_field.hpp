#pragma once
#include <cstdint>
#include <string>

// Schema type: custom field.
// Ledger workflow: Free form key/value attribute attached to a product at
// registration. Keys are unique per product and stored in key order.
namespace provenance::schema {

template <uint16_t Version>
struct custom_field;

template <>
struct custom_field<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
};

using custom_field_t = custom_field<1>;

}  // namespace provenance::schema
