#pragma once
#include <dynart/schema/primitives.hpp>

// Schema type: entropy inputs.
// Supplied by the hosting context on every content query; never read or
// retained by the core.
namespace dynart::schema {

template <uint16_t Version>
struct entropy;

template <>
struct entropy<1> final {
  uint16_t version{1};
  timestamp_seconds_t current_time{};
  hash32_t previous_hash{};
  identity_t producer{};
  // Opaque difficulty-like value; may be constant or zero on some hosts.
  seed_t difficulty{};
};

using entropy_t = entropy<1>;

}  // namespace dynart::schema
