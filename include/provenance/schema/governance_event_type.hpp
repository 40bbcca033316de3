#pragma once

#include <provenance/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Reserved event types written by the ledger itself into a product's
// governance log. User supplied events may not carry these tags.
namespace provenance::schema {

enum class governance_event_type_t : uint8_t {
  ownership_transfer = 0,
  access_granted = 1,
  access_revoked = 2,
  product_status = 3,
};

inline constexpr auto kGovernanceEventTypes =
    enum_names<governance_event_type_t, 4>{std::array{
        std::pair<std::string_view, governance_event_type_t>{
            "OWNERSHIP_TRANSFER", governance_event_type_t::ownership_transfer},
        std::pair<std::string_view, governance_event_type_t>{
            "ACCESS_GRANTED", governance_event_type_t::access_granted},
        std::pair<std::string_view, governance_event_type_t>{
            "ACCESS_REVOKED", governance_event_type_t::access_revoked},
        std::pair<std::string_view, governance_event_type_t>{
            "PRODUCT_STATUS", governance_event_type_t::product_status},
    }};

inline constexpr std::string_view to_string(
    const governance_event_type_t value) {
  return kGovernanceEventTypes.name(value).value_or("unknown");
}

inline constexpr std::optional<governance_event_type_t>
parse_governance_event_type(const std::string_view tag) {
  return kGovernanceEventTypes.parse(tag);
}

inline constexpr bool is_reserved_event_type(const std::string_view tag) {
  return parse_governance_event_type(tag).has_value();
}

}  // namespace provenance::schema
