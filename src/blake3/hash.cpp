#include <blake3.h>
#include <provenance/blake3/hash.hpp>

namespace provenance::blake3 {

namespace {

provenance::schema::hash32_t digest(const void* data, size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = provenance::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<provenance::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

provenance::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

provenance::schema::hash32_t hash(
    const provenance::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace provenance::blake3
