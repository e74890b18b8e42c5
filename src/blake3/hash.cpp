#include <blake3.h>
#include <ballot/blake3/hash.hpp>

namespace ballot::blake3 {

namespace {

ballot::schema::hash32_t digest(const void* data, const std::size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = ballot::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<ballot::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

ballot::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

ballot::schema::hash32_t hash(const ballot::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace ballot::blake3
