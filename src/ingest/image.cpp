#include <gatepass/ingest/image.hpp>

namespace gatepass::ingest {

size_t bytes_per_pixel(const pixel_format_t format) {
  switch (format) {
    case pixel_format_t::encoded:
      return 0;
    case pixel_format_t::gray8:
      return 1;
    case pixel_format_t::bgr24:
      return 3;
  }
  return 0;
}

bool is_well_formed(const image& frame) {
  if (frame.data.empty()) {
    return false;
  }
  if (frame.format == pixel_format_t::encoded) {
    return true;
  }
  if (frame.width == 0 || frame.height == 0) {
    return false;
  }
  return frame.data.size() == static_cast<size_t>(frame.width) *
                                  frame.height *
                                  bytes_per_pixel(frame.format);
}

}  // namespace gatepass::ingest
