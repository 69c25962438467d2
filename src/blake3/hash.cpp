#include <blake3.h>
#include <gatepass/blake3/hash.hpp>
#include <string>

namespace gatepass::blake3 {

namespace {

gatepass::schema::hash32_t finalize(blake3_hasher& hasher) {
  // BLAKE3_OUT_LEN
  auto output = gatepass::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

gatepass::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  return finalize(hasher);
}

gatepass::schema::hash32_t hash(const gatepass::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  return finalize(hasher);
}

gatepass::schema::hash32_t keyed_hash(
    const gatepass::schema::secret_key_t& key,
    const gatepass::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init_keyed(&hasher, key.data());
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  return finalize(hasher);
}

gatepass::schema::secret_key_t derive_key(
    const std::string_view& context,
    const gatepass::schema::secret_key_t& root) {
  // blake3 wants a NUL-terminated context.
  auto context_string = std::string{context};
  auto hasher = blake3_hasher{};
  blake3_hasher_init_derive_key(&hasher, context_string.c_str());
  blake3_hasher_update(&hasher, root.data(), root.size());
  return finalize(hasher);
}

}  // namespace gatepass::blake3
