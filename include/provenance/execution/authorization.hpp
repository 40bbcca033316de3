#pragma once

#include <provenance/schema/primitives.hpp>
#include <provenance/schema/product_state.hpp>
#include <provenance/schema/transaction_error_code.hpp>
#include <optional>

// Pure access rules over a loaded product. A std::nullopt result means the
// identity is allowed; otherwise the error code to report.
namespace provenance::execution {

/// Owner or any authorized actor may append events.
std::optional<provenance::schema::transaction_error_code> check_write_access(
    const provenance::schema::product_state_t& product,
    const provenance::schema::signer_id_t& identity);

/// Only the current owner may transfer or edit the access list.
std::optional<provenance::schema::transaction_error_code> check_owner(
    const provenance::schema::product_state_t& product,
    const provenance::schema::signer_id_t& identity);

bool is_authorized_actor(const provenance::schema::product_state_t& product,
                         const provenance::schema::signer_id_t& identity);

}  // namespace provenance::execution
