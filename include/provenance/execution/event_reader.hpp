#pragma once

#include <provenance/schema/encoding/scale/encoder.hpp>
#include <provenance/schema/event_filter.hpp>
#include <provenance/schema/tracking_event.hpp>
#include <provenance/storage/rocksdb/storage.hpp>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>

namespace provenance::execution {

/// Which per-product append-only log a reader walks.
enum class event_log : uint8_t {
  custody,
  governance,
};

/// Whether `event` passes every field set in `filter`.
bool matches(const provenance::schema::event_filter_t& filter,
             const provenance::schema::tracking_event_t& event);

/// Lazy, finite view over the committed events of one product in
/// `[from, to)`. Each step is a single point read; nothing is materialized up
/// front, and `begin()` may be called again to restart. The bound is fixed
/// when the reader is created, so events committed afterwards are not seen.
class event_reader final {
 public:
  using encoder_t = provenance::schema::encoding::encoder<
      provenance::schema::encoding::scale_encoder_tag>;
  using storage_t =
      provenance::storage::storage<provenance::storage::rocksdb_storage_tag>;

  class iterator final {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = provenance::schema::tracking_event_t;
    using difference_type = std::ptrdiff_t;
    using pointer = const value_type*;
    using reference = const value_type&;

    iterator() = default;

    reference operator*() const;
    pointer operator->() const;
    iterator& operator++();
    void operator++(int);
    bool operator==(const iterator& other) const;

   private:
    friend class event_reader;
    iterator(const event_reader* reader, uint64_t sequence);
    void load();

    const event_reader* reader_{};
    uint64_t sequence_{};
    std::optional<provenance::schema::tracking_event_t> current_;
  };

  event_reader(encoder_t& encoder,
               const storage_t& storage,
               event_log log,
               provenance::schema::product_id_t product_id,
               uint64_t from,
               uint64_t to);

  iterator begin() const;
  iterator end() const;

  uint64_t from() const { return from_; }
  uint64_t to() const { return to_; }
  std::size_t size() const { return static_cast<std::size_t>(to_ - from_); }
  bool empty() const { return from_ == to_; }

  /// Point read of one sequence inside the reader's bounds.
  std::optional<provenance::schema::tracking_event_t> at(
      uint64_t sequence) const;

 private:
  provenance::schema::bytes_t key_for(uint64_t sequence) const;

  encoder_t* encoder_;
  const storage_t* storage_;
  event_log log_;
  provenance::schema::product_id_t product_id_;
  uint64_t from_{};
  uint64_t to_{};
};

}  // namespace provenance::execution
