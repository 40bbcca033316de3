#pragma once

#include <cstdint>

namespace provenance::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  invalid_signature_type = 5,
  signature_verification_failed = 6,
  product_exists = 10,
  product_missing = 11,
  authorization_denied = 12,
  invalid_batch = 13,
  batch_too_large = 14,
  invalid_product = 15,
  invalid_event = 16,
  event_type_exists = 17,
  event_type_reserved = 18,
  product_inactive = 19,
};

}  // namespace provenance::schema
