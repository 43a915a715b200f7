#pragma once
#include <dynart/schema/primitives.hpp>
#include <string_view>

namespace dynart::blake3 {

dynart::schema::hash32_t hash(const std::string_view& str);
dynart::schema::hash32_t hash(const dynart::schema::bytes_view_t& bytes);

}  // namespace dynart::blake3
