#include <gtest/gtest.h>
#include <provenance/blake3/hash.hpp>

#include <string_view>

TEST(blake3_hash, matches_reference_vector_for_empty_input) {
  auto digest = provenance::blake3::hash(std::string_view{});
  EXPECT_EQ(provenance::schema::to_hex(digest),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(blake3_hash, string_and_byte_inputs_agree) {
  auto text = std::string_view{"provenance-local"};
  auto bytes = provenance::schema::make_bytes(text);
  EXPECT_EQ(provenance::blake3::hash(text),
            provenance::blake3::hash(provenance::schema::make_bytes_view(bytes)));
  EXPECT_NE(provenance::blake3::hash(text),
            provenance::blake3::hash(std::string_view{"provenance-main"}));
}
