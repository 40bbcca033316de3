#include <gtest/gtest.h>
#include <provenance/execution/write_buffer.hpp>

namespace {

provenance::schema::bytes_t bytes(std::string_view text) {
  return provenance::schema::make_bytes(text);
}

}  // namespace

TEST(write_buffer, later_writes_win) {
  auto buffer = provenance::execution::write_buffer{};
  EXPECT_TRUE(buffer.empty());
  buffer.put(bytes("k"), bytes("one"));
  buffer.put(bytes("k"), bytes("two"));
  EXPECT_EQ(buffer.size(), 1u);
  EXPECT_EQ(buffer.find(bytes("k")), std::optional{bytes("two")});
  EXPECT_FALSE(buffer.find(bytes("missing")).has_value());
}

TEST(write_buffer, merge_moves_entries_and_keeps_key_order) {
  auto block = provenance::execution::write_buffer{};
  block.put(bytes("b"), bytes("block"));
  block.put(bytes("c"), bytes("kept"));

  auto tx = provenance::execution::write_buffer{};
  tx.put(bytes("b"), bytes("tx"));
  tx.put(bytes("a"), bytes("new"));
  block.merge(std::move(tx));

  auto entries = block.entries();
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0].first, bytes("a"));
  EXPECT_EQ(entries[1].second, bytes("tx"));
  EXPECT_EQ(entries[2].second, bytes("kept"));

  block.clear();
  EXPECT_TRUE(block.empty());
}
