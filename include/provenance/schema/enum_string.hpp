#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

namespace provenance::schema {

/// Fixed two-way table between enum values and the tags stored on chain.
template <typename Enum, std::size_t N>
struct enum_names final {
  std::array<std::pair<std::string_view, Enum>, N> entries;

  constexpr std::optional<Enum> parse(const std::string_view tag) const {
    for (const auto& [name, value] : entries) {
      if (name == tag) {
        return value;
      }
    }
    return std::nullopt;
  }

  constexpr std::optional<std::string_view> name(const Enum value) const {
    for (const auto& [name, entry] : entries) {
      if (entry == value) {
        return name;
      }
    }
    return std::nullopt;
  }
};

}  // namespace provenance::schema
