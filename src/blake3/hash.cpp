#include <blake3.h>
#include <ballot/blake3/hash.hpp>

namespace ballot::blake3 {

namespace {

ballot::schema::hash32_t finalize(blake3_hasher& hasher) {
  auto output = ballot::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<ballot::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

ballot::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  return finalize(hasher);
}

ballot::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  return finalize(hasher);
}

}  // namespace ballot::blake3
