#include <gtest/gtest.h>
#include <provenance/execution/event_reader.hpp>
#include <provenance/schema/key/engine_keys.hpp>
#include <provenance/testing/common.hpp>

#include <vector>

namespace {

using provenance::execution::event_log;
using provenance::execution::event_reader;
using provenance::execution::matches;

class event_reader_test : public ::testing::Test {
 protected:
  void SetUp() override {
    auto entries = std::vector<provenance::storage::key_value_entry_t>{};
    for (uint64_t sequence = 0; sequence < 5; ++sequence) {
      auto event = provenance::schema::tracking_event_t{};
      event.product_id = "COFFEE-001";
      event.sequence = sequence;
      event.event_type = "STEP";
      entries.emplace_back(provenance::schema::key::make_event_key(
                               encoder_, event.product_id, sequence),
                           encoder_.encode(event));
    }
    auto governance = provenance::schema::tracking_event_t{};
    governance.product_id = "COFFEE-001";
    governance.event_type = "ACCESS_GRANTED";
    entries.emplace_back(provenance::schema::key::make_governance_key(
                             encoder_, governance.product_id, 0),
                         encoder_.encode(governance));
    storage_.commit(entries, provenance::storage::committed_state{
                                 .height = 1, .state_root = {}});
  }

  std::vector<uint64_t> sequences(const event_reader& reader) {
    auto out = std::vector<uint64_t>{};
    for (const auto& event : reader) {
      out.push_back(event.sequence);
    }
    return out;
  }

  provenance::testing::scale_encoder_t encoder_;
  provenance::storage::storage<provenance::storage::rocksdb_storage_tag>
      storage_{provenance::storage::make_memory_storage<
          provenance::storage::rocksdb_storage_tag>()};
};

}  // namespace

TEST_F(event_reader_test, walks_requested_window) {
  auto reader = event_reader{encoder_, storage_, event_log::custody,
                             "COFFEE-001", 1, 4};
  EXPECT_EQ(reader.size(), 3u);
  EXPECT_EQ(sequences(reader), (std::vector<uint64_t>{1, 2, 3}));
  // Restartable.
  EXPECT_EQ(sequences(reader), (std::vector<uint64_t>{1, 2, 3}));
}

TEST_F(event_reader_test, empty_when_from_is_past_end) {
  auto reader = event_reader{encoder_, storage_, event_log::custody,
                             "COFFEE-001", 9, 5};
  EXPECT_TRUE(reader.empty());
  EXPECT_TRUE(sequences(reader).empty());
  EXPECT_EQ(reader.begin(), reader.end());
}

TEST_F(event_reader_test, point_reads_respect_bounds) {
  auto reader = event_reader{encoder_, storage_, event_log::custody,
                             "COFFEE-001", 2, 5};
  auto event = reader.at(4);
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->sequence, 4u);
  EXPECT_FALSE(reader.at(1).has_value());
  EXPECT_FALSE(reader.at(5).has_value());
}

TEST_F(event_reader_test, governance_log_is_separate) {
  auto reader = event_reader{encoder_, storage_, event_log::governance,
                             "COFFEE-001", 0, 1};
  auto it = reader.begin();
  ASSERT_NE(it, reader.end());
  EXPECT_EQ(it->event_type, "ACCESS_GRANTED");
  ++it;
  EXPECT_EQ(it, reader.end());
}

TEST(event_filter, unset_fields_match_everything) {
  auto event = provenance::schema::tracking_event_t{};
  event.event_type = "SHIPPED";
  event.location = "Cartagena";
  event.timestamp = 500;

  auto filter = provenance::schema::event_filter_t{};
  EXPECT_TRUE(matches(filter, event));

  filter.event_type = "SHIPPED";
  filter.location = "Cartagena";
  EXPECT_TRUE(matches(filter, event));
  filter.location = "cartagena";
  EXPECT_FALSE(matches(filter, event));
}

TEST(event_filter, time_window_is_inclusive) {
  auto event = provenance::schema::tracking_event_t{};
  event.timestamp = 500;

  auto filter = provenance::schema::event_filter_t{};
  filter.start_time = 500;
  filter.end_time = 500;
  EXPECT_TRUE(matches(filter, event));
  filter.start_time = 501;
  EXPECT_FALSE(matches(filter, event));
  filter.start_time = std::nullopt;
  filter.end_time = 499;
  EXPECT_FALSE(matches(filter, event));
}
