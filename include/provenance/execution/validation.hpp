#pragma once

#include <provenance/schema/event_input.hpp>
#include <provenance/schema/register_event_type.hpp>
#include <provenance/schema/register_product.hpp>
#include <cstddef>
#include <optional>
#include <string>

// Structural bounds on caller supplied records. Each check returns a human
// readable reason when the input is rejected.
namespace provenance::execution {

inline constexpr std::size_t kMaxProductIdBytes{64};
inline constexpr std::size_t kMaxNameBytes{128};
inline constexpr std::size_t kMaxOriginBytes{256};
inline constexpr std::size_t kMaxCategoryBytes{64};
inline constexpr std::size_t kMaxDescriptionBytes{2048};
inline constexpr std::size_t kMaxTags{20};
inline constexpr std::size_t kMaxTagBytes{64};
inline constexpr std::size_t kMaxCertifications{50};
inline constexpr std::size_t kMaxMediaHashes{50};
inline constexpr std::size_t kMaxCustomFields{20};
inline constexpr std::size_t kMaxCustomKeyBytes{32};
inline constexpr std::size_t kMaxCustomValueBytes{512};
inline constexpr std::size_t kMaxEventTypeBytes{64};
inline constexpr std::size_t kMaxLocationBytes{256};
inline constexpr std::size_t kMaxEventTypeLabelBytes{128};

std::optional<std::string> validate_product(
    const provenance::schema::register_product_t& product);

std::optional<std::string> validate_event_input(
    const provenance::schema::event_input_t& event,
    std::size_t max_metadata_bytes);

std::optional<std::string> validate_event_type(
    const provenance::schema::register_event_type_t& event_type);

}  // namespace provenance::execution
