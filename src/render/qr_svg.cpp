#include <gatepass/render/qr_svg.hpp>

#include <fmt/format.h>
#include <qrencode.h>

#include <iterator>
#include <string>

namespace gatepass::render {

bool qr_matrix::dark(const int x, const int y) const {
  return bits[static_cast<size_t>(y * modules + x)] != 0;
}

std::optional<qr_matrix> make_qr_matrix(const std::string_view text,
                                        const int quiet) {
  auto input = std::string{text};
  auto* code = QRcode_encodeString(input.c_str(), 0, QR_ECLEVEL_M, QR_MODE_8, 1);
  if (code == nullptr) {
    return std::nullopt;
  }
  auto out = qr_matrix{};
  out.modules = code->width;
  out.quiet = quiet;
  out.bits.resize(static_cast<size_t>(out.modules * out.modules));
  const auto* p = code->data;
  for (auto& bit : out.bits) {
    bit = (*p++ & 0x01) ? 1 : 0;
  }
  QRcode_free(code);
  return out;
}

std::string render_svg(const qr_matrix& matrix, const int module_pixels) {
  auto total = (matrix.modules + 2 * matrix.quiet) * module_pixels;
  auto svg = std::string{};
  auto out = std::back_inserter(svg);
  fmt::format_to(out,
                 "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"{0}\" "
                 "height=\"{0}\" viewBox=\"0 0 {0} {0}\" "
                 "shape-rendering=\"crispEdges\">\n",
                 total);
  fmt::format_to(out, "<rect width=\"{0}\" height=\"{0}\" fill=\"#fff\"/>\n",
                 total);
  for (auto y = 0; y < matrix.modules; ++y) {
    for (auto x = 0; x < matrix.modules; ++x) {
      if (!matrix.dark(x, y)) {
        continue;
      }
      fmt::format_to(out,
                     "<rect x=\"{0}\" y=\"{1}\" width=\"{2}\" height=\"{2}\" "
                     "fill=\"#000\"/>\n",
                     (x + matrix.quiet) * module_pixels,
                     (y + matrix.quiet) * module_pixels, module_pixels);
    }
  }
  svg.append("</svg>\n");
  return svg;
}

}  // namespace gatepass::render
