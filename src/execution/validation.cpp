#include <spdlog/fmt/fmt.h>
#include <provenance/execution/validation.hpp>
#include <provenance/schema/governance_event_type.hpp>

#include <algorithm>

namespace provenance::execution {

namespace {

std::optional<std::string> check_length(std::string_view field,
                                        std::string_view value,
                                        std::size_t min,
                                        std::size_t max) {
  if (value.size() < min) {
    return fmt::format("{} must not be empty", field);
  }
  if (value.size() > max) {
    return fmt::format("{} exceeds {} bytes", field, max);
  }
  return std::nullopt;
}

}  // namespace

std::optional<std::string> validate_product(
    const provenance::schema::register_product_t& product) {
  if (auto error =
          check_length("product_id", product.product_id, 1, kMaxProductIdBytes)) {
    return error;
  }
  if (auto error = check_length("name", product.name, 1, kMaxNameBytes)) {
    return error;
  }
  if (auto error = check_length("origin", product.origin, 1, kMaxOriginBytes)) {
    return error;
  }
  if (auto error =
          check_length("category", product.category, 1, kMaxCategoryBytes)) {
    return error;
  }
  if (auto error = check_length("description", product.description, 0,
                                kMaxDescriptionBytes)) {
    return error;
  }
  if (product.tags.size() > kMaxTags) {
    return fmt::format("more than {} tags", kMaxTags);
  }
  for (const auto& tag : product.tags) {
    if (auto error = check_length("tag", tag, 0, kMaxTagBytes)) {
      return error;
    }
  }
  if (product.certifications.size() > kMaxCertifications) {
    return fmt::format("more than {} certifications", kMaxCertifications);
  }
  if (product.media_hashes.size() > kMaxMediaHashes) {
    return fmt::format("more than {} media hashes", kMaxMediaHashes);
  }
  if (product.custom.size() > kMaxCustomFields) {
    return fmt::format("more than {} custom fields", kMaxCustomFields);
  }
  for (auto it = std::begin(product.custom); it != std::end(product.custom);
       ++it) {
    if (auto error = check_length("custom key", it->key, 1, kMaxCustomKeyBytes)) {
      return error;
    }
    if (auto error =
            check_length("custom value", it->value, 0, kMaxCustomValueBytes)) {
      return error;
    }
    auto duplicate = std::find_if(
        std::begin(product.custom), it,
        [&](const provenance::schema::custom_field_t& field) {
          return field.key == it->key;
        });
    if (duplicate != it) {
      return fmt::format("custom key '{}' appears twice", it->key);
    }
  }
  return std::nullopt;
}

std::optional<std::string> validate_event_input(
    const provenance::schema::event_input_t& event,
    std::size_t max_metadata_bytes) {
  if (auto error = check_length("event_type", event.event_type, 1,
                                kMaxEventTypeBytes)) {
    return error;
  }
  if (provenance::schema::is_reserved_event_type(event.event_type)) {
    return fmt::format("event_type '{}' is reserved", event.event_type);
  }
  if (auto error =
          check_length("location", event.location, 0, kMaxLocationBytes)) {
    return error;
  }
  if (event.metadata.size() > max_metadata_bytes) {
    return fmt::format("metadata exceeds {} bytes", max_metadata_bytes);
  }
  return std::nullopt;
}

std::optional<std::string> validate_event_type(
    const provenance::schema::register_event_type_t& event_type) {
  if (auto error = check_length("event_type", event_type.event_type, 1,
                                kMaxEventTypeBytes)) {
    return error;
  }
  return check_length("label", event_type.label, 1, kMaxEventTypeLabelBytes);
}

}  // namespace provenance::execution
