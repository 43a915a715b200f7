#include <dynart/content/composer.hpp>
#include <dynart/content/seed_deriver.hpp>
#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <vector>

namespace {

using dynart::schema::seed_t;

std::size_t count_of(const std::string& haystack, const std::string& needle) {
  auto count = std::size_t{0};
  for (auto pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

}  // namespace

TEST(composer, colors_render_low_24_bits_as_hex) {
  EXPECT_EQ(dynart::content::make_color(seed_t{0}), "#000000");
  EXPECT_EQ(dynart::content::make_color(seed_t{0xABCDEF}), "#abcdef");
  EXPECT_EQ(dynart::content::make_color(seed_t{0x1000001}), "#000001");
  EXPECT_EQ(dynart::content::make_color(std::numeric_limits<seed_t>::max()),
            "#ffffff");
}

TEST(composer, palette_uses_both_seeds_and_their_xor) {
  auto palette =
      dynart::content::make_palette(seed_t{0x00FF00}, seed_t{0x0F0F0F});
  EXPECT_EQ(palette[0], "#00ff00");
  EXPECT_EQ(palette[1], "#0f0f0f");
  EXPECT_EQ(palette[2], "#0ff00f");
}

TEST(composer, counts_stay_in_range_for_all_residues) {
  const auto seeds = std::vector<seed_t>{
      0, 1, 2, 3, 4, 5, 6, 7, 8, 19, 20, 999, std::numeric_limits<seed_t>::max()};
  for (const auto& seed_a : seeds) {
    for (const auto& seed_b : seeds) {
      auto image = dynart::content::compose(17, seed_a, seed_b);
      EXPECT_GE(image.circles.size(), 3u);
      EXPECT_LE(image.circles.size(), 7u);
      EXPECT_GE(image.rects.size(), 1u);
      EXPECT_LE(image.rects.size(), 4u);
    }
  }

  EXPECT_EQ(dynart::content::compose(1, seed_t{0}, seed_t{0}).circles.size(),
            3u);
  EXPECT_EQ(dynart::content::compose(1, seed_t{4}, seed_t{0}).circles.size(),
            7u);
  EXPECT_EQ(dynart::content::compose(1, seed_t{0}, seed_t{3}).rects.size(), 4u);
}

TEST(composer, circle_geometry_follows_identifier) {
  auto image = dynart::content::compose(1, seed_t{4}, seed_t{1});
  ASSERT_EQ(image.circles.size(), 7u);
  for (uint32_t i = 0; i < image.circles.size(); ++i) {
    const auto& circle = image.circles[i];
    EXPECT_EQ(circle.radius, 60 + ((i + 7) % 420));
    EXPECT_EQ(circle.stroke_width, 6 + (i % 10));
    EXPECT_EQ(circle.stroke, image.palette[i % 3]);
    EXPECT_GE(circle.cx, 412u);
    EXPECT_LE(circle.cx, 611u);
    EXPECT_GE(circle.cy, 412u);
    EXPECT_LE(circle.cy, 611u);
  }
}

TEST(composer, rect_geometry_follows_identifier) {
  auto image = dynart::content::compose(100, seed_t{0}, seed_t{3});
  ASSERT_EQ(image.rects.size(), 4u);
  for (uint32_t j = 0; j < image.rects.size(); ++j) {
    const auto& rect = image.rects[j];
    EXPECT_EQ(rect.x, (100 * (j + 3)) % 700);
    EXPECT_EQ(rect.y, (100 * (j + 11)) % 700);
    EXPECT_EQ(rect.width, 120 + (j * 70));
    EXPECT_EQ(rect.height, 80 + (j * 60));
    EXPECT_EQ(rect.fill, image.palette[1 + (j % 2)]);
  }
}

TEST(composer, large_identifiers_do_not_wrap) {
  const auto id = std::numeric_limits<uint64_t>::max();
  auto image = dynart::content::compose(id, seed_t{0}, seed_t{0});
  EXPECT_EQ(image.circles[0].radius, 60u + 105u);
  EXPECT_EQ(image.rects[0].x, 45u);
  EXPECT_EQ(image.rects[0].y, 165u);
}

TEST(composer, svg_paints_background_then_circles_then_rects) {
  auto image = dynart::content::compose(5, seed_t{2}, seed_t{1});
  auto svg = dynart::content::to_svg(image);

  EXPECT_TRUE(svg.starts_with(
      "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"1024\" "
      "height=\"1024\" viewBox=\"0 0 1024 1024\">"
      "<rect width=\"1024\" height=\"1024\" fill=\"#0b0b12\"/>"));
  EXPECT_TRUE(svg.ends_with("</svg>"));
  EXPECT_EQ(count_of(svg, "<circle "), image.circles.size());
  EXPECT_EQ(count_of(svg, "rx=\"12\""), image.rects.size());
  EXPECT_EQ(count_of(svg, "opacity=\"0.85\""), image.circles.size());
  EXPECT_EQ(count_of(svg, "opacity=\"0.16\""), image.rects.size());
  EXPECT_LT(svg.rfind("<circle "), svg.find("rx=\"12\""));
}

TEST(composer, first_circle_serializes_exactly) {
  auto image = dynart::content::compose(1, seed_t{0}, seed_t{0});
  const auto& circle = image.circles.front();
  auto expected = "<circle cx=\"" + std::to_string(circle.cx) + "\" cy=\"" +
                  std::to_string(circle.cy) +
                  "\" r=\"67\" fill=\"none\" stroke=\"#000000\" "
                  "stroke-width=\"6\" opacity=\"0.85\"/>";
  EXPECT_NE(dynart::content::to_svg(image).find(expected), std::string::npos);
}
