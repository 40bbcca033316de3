#pragma once

#include <provenance/crypto/sign.hpp>
#include <provenance/schema/encoding/scale/encoder.hpp>
#include <provenance/schema/primitives.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace provenance::testing {

using scale_encoder_t = provenance::schema::encoding::encoder<
    provenance::schema::encoding::scale_encoder_tag>;

inline provenance::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = provenance::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline provenance::schema::signer_id_t make_named_signer(const uint8_t seed) {
  auto named = provenance::schema::named_signer_t{};
  named[0] = seed;
  return provenance::schema::signer_id_t{named};
}

/// Deterministic Ed25519 key: every seed byte is `seed`.
inline provenance::crypto::ed25519_keypair make_keypair(const uint8_t seed) {
  auto bytes = provenance::crypto::ed25519_seed_t{};
  bytes.fill(seed);
  auto keypair = provenance::crypto::make_ed25519_keypair(bytes);
  EXPECT_TRUE(keypair.has_value());
  return keypair.value_or(provenance::crypto::ed25519_keypair{});
}

inline provenance::schema::signer_id_t identity(
    const provenance::crypto::ed25519_keypair& keypair) {
  return provenance::schema::signer_id_t{keypair.signer};
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace provenance::testing
