#include <gatepass/schema/key/store_keys.hpp>

#include <boost/endian/buffers.hpp>

#include <algorithm>
#include <cstring>
#include <iterator>

namespace gatepass::schema::key {

gatepass::schema::bytes_t make_prefix_key(std::string_view prefix) {
  return gatepass::schema::make_bytes(prefix);
}

gatepass::schema::bytes_t make_prefixed_key(
    std::string_view prefix,
    const gatepass::schema::bytes_view_t& id) {
  auto key = gatepass::schema::make_bytes(prefix);
  key.reserve(key.size() + id.size());
  key.insert(std::end(key), std::begin(id), std::end(id));
  return key;
}

gatepass::schema::bytes_t make_credential_key(
    const gatepass::schema::credential_id_t& credential_id) {
  return make_prefixed_key(
      kCredentialKeyPrefix,
      gatepass::schema::bytes_view_t{credential_id.data(),
                                     credential_id.size()});
}

gatepass::schema::bytes_t make_attempt_key(const uint64_t sequence) {
  auto big_endian = boost::endian::big_uint64_buf_t{sequence};
  return make_prefixed_key(
      kAttemptKeyPrefix,
      gatepass::schema::bytes_view_t{big_endian.data(), sizeof(uint64_t)});
}

std::optional<uint64_t> parse_attempt_key(
    const gatepass::schema::bytes_view_t& key) {
  if (key.size() != kAttemptKeyPrefix.size() + sizeof(uint64_t)) {
    return std::nullopt;
  }
  if (!std::equal(std::begin(kAttemptKeyPrefix), std::end(kAttemptKeyPrefix),
                  std::begin(key),
                  [](const char lhs, const uint8_t rhs) {
                    return static_cast<uint8_t>(lhs) == rhs;
                  })) {
    return std::nullopt;
  }
  auto big_endian = boost::endian::big_uint64_buf_t{};
  std::memcpy(&big_endian, key.data() + kAttemptKeyPrefix.size(),
              sizeof(uint64_t));
  return big_endian.value();
}

}  // namespace gatepass::schema::key
