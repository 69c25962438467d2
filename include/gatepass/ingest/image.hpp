#pragma once

#include <gatepass/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>

namespace gatepass::ingest {

enum class pixel_format_t : uint8_t {
  /// Compressed container bytes (PNG, JPEG, ...); width/height unused.
  encoded = 0,
  gray8 = 1,
  bgr24 = 2
};

struct image final {
  pixel_format_t format{pixel_format_t::encoded};
  uint32_t width{};
  uint32_t height{};
  gatepass::schema::bytes_t data;
};

/// Bytes per pixel for raw formats, 0 for encoded.
size_t bytes_per_pixel(pixel_format_t format);

/// Raw buffers must match width * height * bytes_per_pixel exactly.
bool is_well_formed(const image& frame);

}  // namespace gatepass::ingest
