#pragma once
#include <gatepass/common/critical.hpp>
#include <gatepass/schema/encoding/encoder.hpp>
#include <gatepass/schema/encoding/scale/credential.hpp>
#include <gatepass/schema/encoding/scale/credential_status.hpp>
#include <gatepass/schema/encoding/scale/denial_reason.hpp>
#include <gatepass/schema/encoding/scale/scan_attempt.hpp>
#include <gatepass/schema/encoding/scale/scan_outcome.hpp>
#include <gatepass/schema/encoding/scale/scan_source.hpp>
#include <exception>
#include <iterator>
#include <scale/scale.hpp>
#include <stdexcept>

namespace gatepass::schema::encoding {

struct scale_encoder_tag {};

/// Raised by decode() when stored or received bytes are not a valid record.
struct decode_failure final : std::runtime_error {
  using std::runtime_error::runtime_error;
};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  gatepass::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, gatepass::schema::bytes_t& out);

  template <typename T>
  T decode(const gatepass::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const gatepass::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
gatepass::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    gatepass::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        gatepass::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const gatepass::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    throw decode_failure{"failed to decode SCALE bytes"};
  }
  return std::move(decoded).value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const gatepass::schema::bytes_view_t& bytes) {
  try {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return std::move(decoded).value();
  } catch (const std::exception&) {
    // Enum range checks surface as exceptions from inside the decoder.
    return std::nullopt;
  }
}

}  // namespace gatepass::schema::encoding
