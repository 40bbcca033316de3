#include <provenance/storage/storage.hpp>
#include <provenance/storage/rocksdb/storage.hpp>
#include <provenance/schema/encoding/scale/encoder.hpp>
#include <provenance/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using provenance::testing::make_db_path;
using provenance::testing::make_hash;
using provenance::testing::remove_path;
using encoder_t = provenance::testing::scale_encoder_t;

provenance::schema::bytes_t key_of(std::string_view text) {
  return provenance::schema::make_bytes(text);
}

provenance::schema::bytes_view_t view(const provenance::schema::bytes_t& bytes) {
  return provenance::schema::bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

TEST(storage_types, defaults_are_stable) {
  auto committed = provenance::storage::committed_state{};
  EXPECT_EQ(committed.height, 0);

  auto entry = provenance::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST(storage_types, committed_state_round_trips) {
  auto db = make_db_path("provenance_storage_committed");
  {
    auto storage = provenance::storage::make_storage<
        provenance::storage::rocksdb_storage_tag>(db);
    EXPECT_FALSE(storage.load_committed_state().has_value());
    auto state = provenance::storage::committed_state{
        .height = 42, .state_root = make_hash(10)};
    storage.save_committed_state(state);

    auto loaded = storage.load_committed_state();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->height, state.height);
    EXPECT_EQ(loaded->state_root, state.state_root);
  }
  remove_path(db);
}

TEST(storage_types, typed_values_round_trip_in_memory) {
  auto storage = provenance::storage::make_memory_storage<
      provenance::storage::rocksdb_storage_tag>();
  auto encoder = encoder_t{};
  auto key = key_of("SEQ|COFFEE-001");

  EXPECT_FALSE(storage.get<uint64_t>(encoder, view(key)).has_value());
  storage.put(encoder, view(key), uint64_t{7});
  EXPECT_EQ(storage.get<uint64_t>(encoder, view(key)), std::optional<uint64_t>{7});

  auto raw = storage.load(view(key));
  ASSERT_TRUE(raw.has_value());
  EXPECT_EQ(raw.value(), encoder.encode(uint64_t{7}));
}

TEST(storage_types, commit_applies_entries_and_checkpoint_together) {
  auto storage = provenance::storage::make_memory_storage<
      provenance::storage::rocksdb_storage_tag>();
  auto encoder = encoder_t{};

  auto entries = std::vector<provenance::storage::key_value_entry_t>{
      {key_of("A|one"), encoder.encode(uint64_t{1})},
      {key_of("A|two"), encoder.encode(uint64_t{2})}};
  storage.commit(entries, provenance::storage::committed_state{
                              .height = 3, .state_root = make_hash(4)});

  auto committed = storage.load_committed_state();
  ASSERT_TRUE(committed.has_value());
  EXPECT_EQ(committed->height, 3);
  EXPECT_EQ(committed->state_root, make_hash(4));
  auto key = key_of("A|two");
  EXPECT_EQ(storage.get<uint64_t>(encoder, view(key)), std::optional<uint64_t>{2});
}

TEST(storage_types, list_by_prefix_returns_ordered_keyspace_only) {
  auto storage = provenance::storage::make_memory_storage<
      provenance::storage::rocksdb_storage_tag>();
  auto encoder = encoder_t{};
  auto a2 = key_of("A|two");
  auto a1 = key_of("A|one");
  auto b1 = key_of("B|one");
  storage.put(encoder, view(a2), uint64_t{2});
  storage.put(encoder, view(a1), uint64_t{1});
  storage.put(encoder, view(b1), uint64_t{9});

  auto prefix = key_of("A|");
  auto rows = storage.list_by_prefix(view(prefix));
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].first, a1);
  EXPECT_EQ(rows[1].first, a2);
  auto value = encoder.try_decode<uint64_t>(view(rows[1].second));
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(value.value(), 2u);
}

TEST(storage_types, disk_store_survives_reopen) {
  auto db = make_db_path("provenance_storage_reopen");
  auto encoder = encoder_t{};
  auto key = key_of("PRODUCT|COFFEE-001");
  {
    auto storage = provenance::storage::make_storage<
        provenance::storage::rocksdb_storage_tag>(db);
    storage.commit({{key, encoder.encode(std::string{"coffee"})}},
                   provenance::storage::committed_state{
                       .height = 1, .state_root = make_hash(1)});
  }
  {
    auto storage = provenance::storage::make_storage<
        provenance::storage::rocksdb_storage_tag>(db);
    EXPECT_EQ(storage.get<std::string>(encoder, view(key)),
              std::optional<std::string>{"coffee"});
    auto committed = storage.load_committed_state();
    ASSERT_TRUE(committed.has_value());
    EXPECT_EQ(committed->height, 1);
  }
  remove_path(db);
}
