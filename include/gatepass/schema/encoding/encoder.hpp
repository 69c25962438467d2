#pragma once
#include <gatepass/schema/primitives.hpp>
#include <optional>
#include <span>

namespace gatepass::schema::encoding {

// Encoders are selected at build time by tag (see scale_encoder_tag). Record
// layouts are versioned through the schema templates, so swapping the wire
// library only touches the specialization.
template <typename Library>
struct encoder {
  template <typename T>
  gatepass::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, gatepass::schema::bytes_t& out);

  template <typename T>
  T decode(const gatepass::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const gatepass::schema::bytes_view_t& bytes);
};

}  // namespace gatepass::schema::encoding
