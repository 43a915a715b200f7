#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dynart::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using identity_t = hash32_t;  // All-zero is the null identity
using token_id_t = uint64_t;
using seed_t = boost::multiprecision::uint256_t;
using timestamp_seconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);
std::string make_string(const bytes_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

identity_t make_null_identity();
bool is_null(const identity_t& identity);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// Interpret a 32-byte digest as a big-endian unsigned 256-bit integer.
seed_t make_seed(const hash32_t& digest);

/// Big-endian 32-byte rendering of a 256-bit integer.
hash32_t to_hash32(const seed_t& value);

}  // namespace dynart::schema
