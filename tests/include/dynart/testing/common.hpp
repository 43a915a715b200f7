#pragma once

#include <dynart/schema/entropy.hpp>
#include <dynart/schema/primitives.hpp>

#include <cstdint>

namespace dynart::testing {

inline dynart::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = dynart::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline dynart::schema::identity_t make_identity(const uint8_t seed) {
  auto identity = dynart::schema::identity_t{};
  identity[0] = seed;
  return identity;
}

inline dynart::schema::entropy_t make_entropy(const uint64_t current_time) {
  return dynart::schema::entropy_t{.current_time = current_time,
                                   .previous_hash = make_hash(0x40),
                                   .producer = make_identity(0x7A),
                                   .difficulty = 1'000'000};
}

}  // namespace dynart::testing
