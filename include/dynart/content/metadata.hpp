#pragma once
#include <dynart/content/image.hpp>
#include <dynart/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dynart::content {

inline constexpr auto kNamePrefix = std::string_view{"AI Dynamic #"};
inline constexpr auto kDescription = std::string_view{
    "Generative artwork recomputed from block entropy on every read."};
inline constexpr auto kSvgDataPrefix =
    std::string_view{"data:image/svg+xml;base64,"};
inline constexpr auto kJsonDataPrefix =
    std::string_view{"data:application/json;base64,"};

using trait_value_t = std::variant<uint64_t, std::string>;

struct trait_t final {
  std::string trait_type;
  trait_value_t value;
};

/// Canonical, order-preserving asset description. Field order here is the
/// serialization order.
struct canonical_record final {
  std::string name;
  std::string description;
  std::string image;
  std::vector<trait_t> attributes;
};

canonical_record assemble(dynart::schema::token_id_t token_id,
                          const image_description& image,
                          uint64_t circle_count,
                          uint64_t rect_count,
                          const palette_t& palette);

/// Compact JSON, no insignificant whitespace.
std::string to_json(const canonical_record& record);

/// `data:application/json;base64,` reference wrapping `to_json(record)`.
std::string to_data_uri(const canonical_record& record);

}  // namespace dynart::content
