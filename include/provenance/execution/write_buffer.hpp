#pragma once

#include <provenance/schema/primitives.hpp>
#include <provenance/storage/storage.hpp>
#include <iterator>
#include <map>
#include <optional>
#include <vector>

namespace provenance::execution {

/// Ordered set of staged writes. A transaction stages into its own buffer
/// layered over the block's buffer and is merged only when it succeeds, so a
/// failure anywhere in an operation leaves no partial writes behind.
class write_buffer final {
 public:
  std::optional<provenance::schema::bytes_t> find(
      const provenance::schema::bytes_t& key) const {
    auto it = entries_.find(key);
    if (it == std::end(entries_)) {
      return std::nullopt;
    }
    return it->second;
  }

  void put(provenance::schema::bytes_t key, provenance::schema::bytes_t value) {
    entries_.insert_or_assign(std::move(key), std::move(value));
  }

  /// Later writes win.
  void merge(write_buffer&& other) {
    for (auto& [key, value] : other.entries_) {
      entries_.insert_or_assign(key, std::move(value));
    }
    other.entries_.clear();
  }

  std::vector<provenance::storage::key_value_entry_t> entries() const {
    return {std::begin(entries_), std::end(entries_)};
  }

  bool empty() const { return entries_.empty(); }
  std::size_t size() const { return entries_.size(); }
  void clear() { entries_.clear(); }

 private:
  std::map<provenance::schema::bytes_t, provenance::schema::bytes_t> entries_;
};

}  // namespace provenance::execution
