#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gatepass::render {

/// Module grid of an encoded QR symbol, row major, 1 = dark.
struct qr_matrix final {
  int modules{};
  int quiet{4};
  std::vector<uint8_t> bits;

  bool dark(int x, int y) const;
};

/// Encode with error correction level M in 8-bit mode. std::nullopt when the
/// text does not fit in a QR symbol.
std::optional<qr_matrix> make_qr_matrix(std::string_view text, int quiet = 4);

/// Standalone SVG document, one rect per dark module.
std::string render_svg(const qr_matrix& matrix, int module_pixels = 8);

}  // namespace gatepass::render
