#pragma once

#include <provenance/schema/primitives.hpp>
#include <cstdint>

// Schema type: history entry.
// Ledger workflow: Audit row holding the exact signed transaction bytes of a
// block position plus its execution code, so consumers can re-verify every
// signature without trusting the node.
namespace provenance::schema {

template <uint16_t Version>
struct history_entry;

template <>
struct history_entry<1> final {
  uint16_t version{1};
  uint64_t height{};
  uint32_t index{};
  uint32_t code{};
  bytes_t tx;
};

using history_entry_t = history_entry<1>;

}  // namespace provenance::schema
