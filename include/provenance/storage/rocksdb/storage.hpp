#pragma once
#include <rocksdb/db.h>
#include <rocksdb/env.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <provenance/common/critical.hpp>
#include <provenance/schema/encoding/scale/encoder.hpp>
#include <provenance/storage/storage.hpp>
#include <memory>
#include <scale/scale.hpp>
#include <string_view>
#include <tuple>

namespace provenance::storage {

namespace detail {

using encoder_t = provenance::schema::encoding::encoder<
    provenance::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|APP|COMMITTED_STATE"};

inline provenance::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const provenance::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline provenance::schema::bytes_t encode_committed_state(
    const committed_state& state) {
  auto encoder = encoder_t{};
  return encoder.encode(std::tuple{state.height, state.state_root});
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  // Declared before the database so an in-memory Env outlives it.
  std::unique_ptr<ROCKSDB_NAMESPACE::Env> env;
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const provenance::schema::bytes_view_t& key) const;

  std::optional<provenance::schema::bytes_t> load(
      const provenance::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const provenance::schema::bytes_view_t& key,
           const T& value);

  void commit(const std::vector<key_value_entry_t>& entries,
              const committed_state& state);
  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state);
  std::vector<key_value_entry_t> list_by_prefix(
      const provenance::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <>
storage<rocksdb_storage_tag> make_memory_storage<rocksdb_storage_tag>();

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const provenance::schema::bytes_view_t& key) const {
  auto value = load(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      provenance::schema::make_bytes_view(value.value()))};
}

inline std::optional<provenance::schema::bytes_t>
storage<rocksdb_storage_tag>::load(
    const provenance::schema::bytes_view_t& key) const {
  if (!database) {
    provenance::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    provenance::common::critical("Failed to get value from RocksDB",
                                 status.ToString());
  }
  return provenance::schema::make_bytes(value);
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const provenance::schema::bytes_view_t& key,
    const T& value) {
  if (!database) {
    provenance::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(provenance::schema::make_bytes_view(encoded_value)));
  if (!status.ok()) {
    provenance::common::critical("Failed to put value into RocksDB",
                                 status.ToString());
  }
}

inline void storage<rocksdb_storage_tag>::commit(
    const std::vector<key_value_entry_t>& entries,
    const committed_state& state) {
  if (!database) {
    provenance::common::critical("RocksDB database is not initialized");
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(provenance::schema::make_bytes_view(key)),
                  detail::to_slice(provenance::schema::make_bytes_view(value)));
    if (!put_status.ok()) {
      provenance::common::critical("failed staging key for commit",
                                   put_status.ToString());
    }
  }
  auto encoded = detail::encode_committed_state(state);
  auto state_status = batch.Put(
      std::string{detail::kCommittedStateKey},
      detail::to_slice(provenance::schema::make_bytes_view(encoded)));
  if (!state_status.ok()) {
    provenance::common::critical("failed staging committed state",
                                 state_status.ToString());
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = env == nullptr;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    provenance::common::critical("failed to commit block",
                                 write_status.ToString());
  }
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto committed_raw = load(provenance::schema::make_bytes_view(
      std::string_view{detail::kCommittedStateKey}));
  if (!committed_raw) {
    return std::nullopt;
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, provenance::schema::hash32_t>>(
          provenance::schema::make_bytes_view(committed_raw.value()));
  if (!decoded.has_value()) {
    provenance::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

inline void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) {
  commit({}, state);
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const provenance::schema::bytes_view_t& prefix) const {
  if (!database) {
    provenance::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string = provenance::schema::make_string(prefix);

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    provenance::common::critical("RocksDB iteration failed",
                                 iterator->status().ToString());
  }
  return entries;
}

}  // namespace provenance::storage
