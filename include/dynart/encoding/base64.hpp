#pragma once
#include <dynart/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>

// Standard-alphabet base64 with '=' padding. Output length is always
// 4 * ceil(n / 3); empty input encodes to the empty string.
namespace dynart::encoding {

std::string to_base64(const dynart::schema::bytes_view_t& bytes);
std::string to_base64(const dynart::schema::bytes_t& bytes);
std::string to_base64(const std::string_view& text);

/// Strict decode: rejects characters outside the alphabet, misplaced padding
/// and lengths that are not a multiple of four.
std::optional<dynart::schema::bytes_t> try_from_base64(
    const std::string_view encoded);

}  // namespace dynart::encoding
