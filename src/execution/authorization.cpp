#include <provenance/execution/authorization.hpp>

#include <algorithm>

namespace provenance::execution {

bool is_authorized_actor(const provenance::schema::product_state_t& product,
                         const provenance::schema::signer_id_t& identity) {
  return std::find(std::begin(product.authorized_actors),
                   std::end(product.authorized_actors),
                   identity) != std::end(product.authorized_actors);
}

std::optional<provenance::schema::transaction_error_code> check_write_access(
    const provenance::schema::product_state_t& product,
    const provenance::schema::signer_id_t& identity) {
  if (identity == product.owner || is_authorized_actor(product, identity)) {
    return std::nullopt;
  }
  return provenance::schema::transaction_error_code::authorization_denied;
}

std::optional<provenance::schema::transaction_error_code> check_owner(
    const provenance::schema::product_state_t& product,
    const provenance::schema::signer_id_t& identity) {
  if (identity == product.owner) {
    return std::nullopt;
  }
  return provenance::schema::transaction_error_code::authorization_denied;
}

}  // namespace provenance::execution
