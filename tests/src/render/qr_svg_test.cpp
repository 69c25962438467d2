#include <gtest/gtest.h>
#include <gatepass/render/qr_svg.hpp>

#include <string>

TEST(qr_svg, matrix_has_finder_patterns) {
  auto matrix = gatepass::render::make_qr_matrix("GP1.example-payload");
  ASSERT_TRUE(matrix.has_value());
  // Version 1 is 21 modules; every version adds 4.
  EXPECT_GE(matrix->modules, 21);
  EXPECT_EQ((matrix->modules - 21) % 4, 0);
  EXPECT_EQ(matrix->bits.size(),
            static_cast<size_t>(matrix->modules * matrix->modules));

  // Top-left finder: dark 7x7 border, light ring, dark 3x3 core.
  for (auto i = 0; i < 7; ++i) {
    EXPECT_TRUE(matrix->dark(i, 0));
    EXPECT_TRUE(matrix->dark(0, i));
    EXPECT_TRUE(matrix->dark(i, 6));
    EXPECT_TRUE(matrix->dark(6, i));
  }
  EXPECT_FALSE(matrix->dark(1, 1));
  EXPECT_TRUE(matrix->dark(3, 3));
  EXPECT_FALSE(matrix->dark(7, 7));
}

TEST(qr_svg, too_much_text_does_not_fit) {
  EXPECT_FALSE(
      gatepass::render::make_qr_matrix(std::string(4000, 'x')).has_value());
}

TEST(qr_svg, svg_scales_with_the_quiet_zone) {
  auto matrix = gatepass::render::make_qr_matrix("GP1.a", 2);
  ASSERT_TRUE(matrix.has_value());
  auto svg = gatepass::render::render_svg(*matrix, 3);

  auto total = std::to_string((matrix->modules + 4) * 3);
  EXPECT_EQ(svg.rfind("<svg", 0), 0u);
  EXPECT_NE(svg.find("width=\"" + total + "\""), std::string::npos);
  // The top-left dark module sits right after the quiet zone.
  EXPECT_NE(svg.find("<rect x=\"6\" y=\"6\" width=\"3\" height=\"3\""),
            std::string::npos);
  EXPECT_NE(svg.find("</svg>"), std::string::npos);

  auto dark = 0;
  for (auto bit : matrix->bits) {
    dark += bit;
  }
  auto rects = 0;
  for (auto at = svg.find("fill=\"#000\""); at != std::string::npos;
       at = svg.find("fill=\"#000\"", at + 1)) {
    ++rects;
  }
  EXPECT_EQ(rects, dark);
}
