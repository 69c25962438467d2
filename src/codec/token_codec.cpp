#include <gatepass/blake3/hash.hpp>
#include <gatepass/codec/token_codec.hpp>
#include <gatepass/crypto/base64.hpp>
#include <gatepass/crypto/key_file.hpp>
#include <gatepass/crypto/random.hpp>

#include <boost/endian/buffers.hpp>

#include <algorithm>
#include <cstring>
#include <iterator>

namespace gatepass::codec {

namespace {

inline constexpr auto kIdOffset = size_t{1};
inline constexpr auto kExpiryOffset = kIdOffset + 32;
inline constexpr auto kTagOffset = kExpiryOffset + 8;

gatepass::schema::bytes_t make_signed_body(
    const gatepass::schema::credential_reference_t& reference) {
  auto body = gatepass::schema::bytes_t{};
  body.reserve(kTokenBodySize);
  body.push_back(reference.version);
  body.insert(std::end(body), std::begin(reference.id), std::end(reference.id));
  auto expiry = boost::endian::big_uint64_buf_t{reference.expires_at};
  body.insert(std::end(body), expiry.data(), expiry.data() + sizeof(uint64_t));
  return body;
}

bool is_digits(const std::string_view value) {
  return !value.empty() && std::all_of(std::begin(value), std::end(value),
                                       [](const char c) {
                                         return c >= '0' && c <= '9';
                                       });
}

}  // namespace

token_codec::token_codec(const gatepass::schema::secret_key_t& tag_key)
    : tag_key_{tag_key} {}

token_codec token_codec::from_root_secret(
    const gatepass::schema::secret_key_t& root_secret) {
  return token_codec{gatepass::blake3::derive_key(
      gatepass::crypto::kTokenTagKeyContext, root_secret)};
}

gatepass::schema::integrity_tag_t token_codec::tag(
    const gatepass::schema::credential_reference_t& reference) const {
  auto body = make_signed_body(reference);
  return gatepass::blake3::keyed_hash(tag_key_,
                                      gatepass::schema::make_bytes_view(body));
}

std::string token_codec::encode(
    const gatepass::schema::credential_reference_t& reference) const {
  auto body = make_signed_body(reference);
  auto integrity_tag = gatepass::blake3::keyed_hash(
      tag_key_, gatepass::schema::make_bytes_view(body));
  body.insert(std::end(body), std::begin(integrity_tag),
              std::end(integrity_tag));
  auto payload = std::string{kPayloadPrefix};
  payload.append(
      gatepass::crypto::base64url_encode(gatepass::schema::make_bytes_view(body)));
  return payload;
}

decode_result_t token_codec::decode(const std::string_view payload) const {
  if (!payload.starts_with(kPayloadPrefix)) {
    // "GP<n>." with another format number is a known but unsupported format.
    auto dot = payload.find('.');
    if (payload.starts_with("GP") && dot != std::string_view::npos &&
        is_digits(payload.substr(2, dot - 2))) {
      return gatepass::schema::decode_error_t::unsupported;
    }
    return gatepass::schema::decode_error_t::malformed;
  }

  auto body =
      gatepass::crypto::base64url_decode(payload.substr(kPayloadPrefix.size()));
  if (!body || body->empty()) {
    return gatepass::schema::decode_error_t::malformed;
  }
  if (body->size() != kTokenBodySize) {
    return gatepass::schema::decode_error_t::malformed;
  }
  if ((*body)[0] != kTokenVersion) {
    return gatepass::schema::decode_error_t::unsupported;
  }

  auto reference = gatepass::schema::credential_reference_t{};
  reference.version = (*body)[0];
  std::copy_n(body->data() + kIdOffset, reference.id.size(),
              std::begin(reference.id));
  auto expiry = boost::endian::big_uint64_buf_t{};
  std::memcpy(&expiry, body->data() + kExpiryOffset, sizeof(uint64_t));
  reference.expires_at = expiry.value();

  auto expected = tag(reference);
  auto presented = gatepass::schema::bytes_view_t{body->data() + kTagOffset,
                                                  expected.size()};
  if (!gatepass::crypto::constant_time_equal(
          gatepass::schema::bytes_view_t{expected.data(), expected.size()},
          presented)) {
    return gatepass::schema::decode_error_t::tag_mismatch;
  }
  return reference;
}

}  // namespace gatepass::codec
