#include <dynart/content/composer.hpp>
#include <dynart/content/metadata.hpp>
#include <dynart/encoding/base64.hpp>

using namespace dynart::schema;

namespace {

void append_json_string(std::string& out, const std::string_view value) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  out.push_back('"');
  for (const auto ch : value) {
    const auto uc = static_cast<unsigned char>(ch);
    switch (ch) {
      case '"':
        out.append("\\\"");
        break;
      case '\\':
        out.append("\\\\");
        break;
      case '\n':
        out.append("\\n");
        break;
      case '\r':
        out.append("\\r");
        break;
      case '\t':
        out.append("\\t");
        break;
      default:
        if (uc < 0x20u) {
          out.append("\\u00");
          out.push_back(kHex[(uc >> 4u) & 0x0Fu]);
          out.push_back(kHex[uc & 0x0Fu]);
        } else {
          out.push_back(ch);
        }
    }
  }
  out.push_back('"');
}

void append_field(std::string& out,
                  const std::string_view key,
                  const std::string_view value) {
  append_json_string(out, key);
  out.push_back(':');
  append_json_string(out, value);
}

}  // namespace

namespace dynart::content {

canonical_record assemble(const token_id_t token_id,
                          const image_description& image,
                          const uint64_t circle_count,
                          const uint64_t rect_count,
                          const palette_t& palette) {
  auto record = canonical_record{};
  record.name = std::string{kNamePrefix} + std::to_string(token_id);
  record.description = std::string{kDescription};
  record.image = std::string{kSvgDataPrefix} +
                 dynart::encoding::to_base64(std::string_view{to_svg(image)});
  record.attributes.push_back(
      trait_t{.trait_type = "Circles", .value = circle_count});
  record.attributes.push_back(
      trait_t{.trait_type = "Rects", .value = rect_count});
  record.attributes.push_back(trait_t{
      .trait_type = "Palette",
      .value = palette[0] + "|" + palette[1] + "|" + palette[2]});
  return record;
}

std::string to_json(const canonical_record& record) {
  auto out = std::string{"{"};
  append_field(out, "name", record.name);
  out.push_back(',');
  append_field(out, "description", record.description);
  out.push_back(',');
  append_field(out, "image", record.image);
  out.push_back(',');
  append_json_string(out, "attributes");
  out.append(":[");
  for (std::size_t i = 0; i < record.attributes.size(); ++i) {
    const auto& trait = record.attributes[i];
    if (i != 0) {
      out.push_back(',');
    }
    out.push_back('{');
    append_field(out, "trait_type", trait.trait_type);
    out.push_back(',');
    append_json_string(out, "value");
    out.push_back(':');
    if (const auto* number = std::get_if<uint64_t>(&trait.value)) {
      out.append(std::to_string(*number));
    } else {
      append_json_string(out, std::get<std::string>(trait.value));
    }
    out.push_back('}');
  }
  out.append("]}");
  return out;
}

std::string to_data_uri(const canonical_record& record) {
  return std::string{kJsonDataPrefix} +
         dynart::encoding::to_base64(std::string_view{to_json(record)});
}

}  // namespace dynart::content
