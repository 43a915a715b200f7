#include <dynart/content/composer.hpp>
#include <dynart/content/seed_deriver.hpp>

using namespace dynart::schema;

namespace {

constexpr uint32_t kMinCircles = 3;
constexpr uint32_t kCircleSpread = 5;
constexpr uint32_t kMinRects = 1;
constexpr uint32_t kRectSpread = 4;

uint32_t reduce(const seed_t& value, const uint32_t modulus) {
  return seed_t{value % modulus}.convert_to<uint32_t>();
}

// Product is taken at 256-bit width so large ids never wrap.
uint32_t scaled(const token_id_t token_id,
                const uint32_t factor,
                const uint32_t modulus) {
  return reduce(seed_t{token_id} * factor, modulus);
}

void append_attribute(std::string& out,
                      const std::string_view name,
                      const std::string_view value) {
  out.push_back(' ');
  out.append(name);
  out.append("=\"");
  out.append(value);
  out.push_back('"');
}

void append_attribute(std::string& out,
                      const std::string_view name,
                      const uint32_t value) {
  append_attribute(out, name, std::to_string(value));
}

}  // namespace

namespace dynart::content {

std::string make_color(const seed_t& seed) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto rgb = seed_t{seed & 0xFFFFFF}.convert_to<uint32_t>();
  auto out = std::string{"#000000"};
  for (auto i = size_t{6}; i > 0; --i) {
    out[i] = kHex[rgb & 0x0Fu];
    rgb >>= 4u;
  }
  return out;
}

palette_t make_palette(const seed_t& seed_a, const seed_t& seed_b) {
  return palette_t{make_color(seed_a), make_color(seed_b),
                   make_color(seed_a ^ seed_b)};
}

image_description compose(const token_id_t token_id,
                          const seed_t& seed_a,
                          const seed_t& seed_b) {
  auto image = image_description{};
  image.palette = make_palette(seed_a, seed_b);

  const auto circle_count = kMinCircles + reduce(seed_a, kCircleSpread);
  const auto rect_count = kMinRects + reduce(seed_b, kRectSpread);

  image.circles.reserve(circle_count);
  for (auto i = uint32_t{0}; i < circle_count; ++i) {
    image.circles.push_back(circle_t{
        .cx = 412 + reduce(hash_words(token_id, i), 200),
        .cy = 412 + reduce(hash_words(i, token_id), 200),
        .radius = 60 + scaled(token_id, i + 7, 420),
        .stroke_width = 6 + (i % 10),
        .stroke = image.palette[i % 3]});
  }

  image.rects.reserve(rect_count);
  for (auto j = uint32_t{0}; j < rect_count; ++j) {
    image.rects.push_back(rect_t{.x = scaled(token_id, j + 3, 700),
                                 .y = scaled(token_id, j + 11, 700),
                                 .width = 120 + (j * 70),
                                 .height = 80 + (j * 60),
                                 .fill = image.palette[1 + (j % 2)]});
  }

  return image;
}

std::string to_svg(const image_description& image) {
  auto out = std::string{"<svg"};
  append_attribute(out, "xmlns", "http://www.w3.org/2000/svg");
  append_attribute(out, "width", image.width);
  append_attribute(out, "height", image.height);
  append_attribute(out, "viewBox",
                   "0 0 " + std::to_string(image.width) + " " +
                       std::to_string(image.height));
  out.push_back('>');

  out.append("<rect");
  append_attribute(out, "width", image.width);
  append_attribute(out, "height", image.height);
  append_attribute(out, "fill", image.background);
  out.append("/>");

  for (const auto& circle : image.circles) {
    out.append("<circle");
    append_attribute(out, "cx", circle.cx);
    append_attribute(out, "cy", circle.cy);
    append_attribute(out, "r", circle.radius);
    append_attribute(out, "fill", "none");
    append_attribute(out, "stroke", circle.stroke);
    append_attribute(out, "stroke-width", circle.stroke_width);
    append_attribute(out, "opacity", kCircleOpacity);
    out.append("/>");
  }

  for (const auto& rect : image.rects) {
    out.append("<rect");
    append_attribute(out, "x", rect.x);
    append_attribute(out, "y", rect.y);
    append_attribute(out, "width", rect.width);
    append_attribute(out, "height", rect.height);
    append_attribute(out, "rx", kRectCornerRadius);
    append_attribute(out, "fill", rect.fill);
    append_attribute(out, "opacity", kRectOpacity);
    out.append("/>");
  }

  out.append("</svg>");
  return out;
}

}  // namespace dynart::content
