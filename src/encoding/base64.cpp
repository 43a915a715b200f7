#include <dynart/encoding/base64.hpp>

#include <array>

using namespace dynart::schema;

namespace dynart::encoding {

namespace {

constexpr auto kTable = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};
constexpr auto kInvalid = uint8_t{0xFF};

constexpr std::array<uint8_t, 256> make_reverse_table() {
  auto table = std::array<uint8_t, 256>{};
  table.fill(kInvalid);
  for (std::size_t i = 0; i < kTable.size(); ++i) {
    table[static_cast<unsigned char>(kTable[i])] = static_cast<uint8_t>(i);
  }
  return table;
}

constexpr auto kReverse = make_reverse_table();

uint8_t lookup(const char ch) {
  return kReverse[static_cast<unsigned char>(ch)];
}

}  // namespace

std::string to_base64(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);

  auto index = size_t{0};
  while ((index + 3) <= bytes.size()) {
    auto value = (static_cast<uint32_t>(bytes[index]) << 16u) |
                 (static_cast<uint32_t>(bytes[index + 1]) << 8u) |
                 static_cast<uint32_t>(bytes[index + 2]);
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    out.push_back(kTable[(value >> 12u) & 0x3Fu]);
    out.push_back(kTable[(value >> 6u) & 0x3Fu]);
    out.push_back(kTable[value & 0x3Fu]);
    index += 3;
  }

  if (index < bytes.size()) {
    auto value = static_cast<uint32_t>(bytes[index]) << 16u;
    if ((index + 1) < bytes.size()) {
      value |= static_cast<uint32_t>(bytes[index + 1]) << 8u;
      out.push_back(kTable[(value >> 18u) & 0x3Fu]);
      out.push_back(kTable[(value >> 12u) & 0x3Fu]);
      out.push_back(kTable[(value >> 6u) & 0x3Fu]);
      out.push_back('=');
    } else {
      out.push_back(kTable[(value >> 18u) & 0x3Fu]);
      out.push_back(kTable[(value >> 12u) & 0x3Fu]);
      out.push_back('=');
      out.push_back('=');
    }
  }

  return out;
}

std::string to_base64(const bytes_t& bytes) {
  return to_base64(bytes_view_t{bytes.data(), bytes.size()});
}

std::string to_base64(const std::string_view& text) {
  return to_base64(make_bytes_view(text));
}

std::optional<bytes_t> try_from_base64(const std::string_view encoded) {
  if ((encoded.size() % 4) != 0) {
    return std::nullopt;
  }

  auto out = bytes_t{};
  out.reserve((encoded.size() / 4) * 3);

  for (size_t i = 0; i < encoded.size(); i += 4) {
    const auto is_last_chunk = (i + 4) == encoded.size();
    const auto c2 = encoded[i + 2];
    const auto c3 = encoded[i + 3];

    auto v0 = lookup(encoded[i]);
    auto v1 = lookup(encoded[i + 1]);
    if (v0 == kInvalid || v1 == kInvalid) {
      return std::nullopt;
    }

    if (c2 == '=') {
      if (c3 != '=' || !is_last_chunk) {
        return std::nullopt;
      }
      auto value = (static_cast<uint32_t>(v0) << 18u) |
                   (static_cast<uint32_t>(v1) << 12u);
      out.push_back(static_cast<uint8_t>((value >> 16u) & 0xFFu));
      continue;
    }

    auto v2 = lookup(c2);
    if (v2 == kInvalid) {
      return std::nullopt;
    }
    if (c3 == '=') {
      if (!is_last_chunk) {
        return std::nullopt;
      }
      auto value = (static_cast<uint32_t>(v0) << 18u) |
                   (static_cast<uint32_t>(v1) << 12u) |
                   (static_cast<uint32_t>(v2) << 6u);
      out.push_back(static_cast<uint8_t>((value >> 16u) & 0xFFu));
      out.push_back(static_cast<uint8_t>((value >> 8u) & 0xFFu));
      continue;
    }

    auto v3 = lookup(c3);
    if (v3 == kInvalid) {
      return std::nullopt;
    }
    auto value = (static_cast<uint32_t>(v0) << 18u) |
                 (static_cast<uint32_t>(v1) << 12u) |
                 (static_cast<uint32_t>(v2) << 6u) | static_cast<uint32_t>(v3);
    out.push_back(static_cast<uint8_t>((value >> 16u) & 0xFFu));
    out.push_back(static_cast<uint8_t>((value >> 8u) & 0xFFu));
    out.push_back(static_cast<uint8_t>(value & 0xFFu));
  }

  return out;
}

}  // namespace dynart::encoding
