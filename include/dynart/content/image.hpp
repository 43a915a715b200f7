#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Ordered vector-image description. Shapes are painted in vector order,
// circles before rectangles, over the background.
namespace dynart::content {

inline constexpr uint32_t kCanvasSize = 1024;
inline constexpr auto kBackgroundColor = std::string_view{"#0b0b12"};
inline constexpr auto kCircleOpacity = std::string_view{"0.85"};
inline constexpr auto kRectOpacity = std::string_view{"0.16"};
inline constexpr uint32_t kRectCornerRadius = 12;

using palette_t = std::array<std::string, 3>;

struct circle_t final {
  uint32_t cx{};
  uint32_t cy{};
  uint32_t radius{};
  uint32_t stroke_width{};
  std::string stroke;
};

struct rect_t final {
  uint32_t x{};
  uint32_t y{};
  uint32_t width{};
  uint32_t height{};
  std::string fill;
};

struct image_description final {
  uint32_t width{kCanvasSize};
  uint32_t height{kCanvasSize};
  std::string background{kBackgroundColor};
  palette_t palette;
  std::vector<circle_t> circles;
  std::vector<rect_t> rects;
};

}  // namespace dynart::content
