#pragma once
#include <dynart/schema/entropy.hpp>
#include <dynart/schema/primitives.hpp>

namespace dynart::content {

struct seed_pair final {
  dynart::schema::seed_t seed_a;
  dynart::schema::seed_t seed_b;
};

/// BLAKE3 over the SCALE encoding of the arguments, read as a big-endian
/// 256-bit integer. Shared by seed derivation and shape placement.
dynart::schema::seed_t hash_words(dynart::schema::token_id_t first,
                                  uint64_t second);

/// seed_a = H(id, current_time, previous_hash)
/// seed_b = H(seed_a, producer, difficulty)
///
/// Pure: identical inputs always give identical seeds.
seed_pair derive_seeds(dynart::schema::token_id_t token_id,
                       const dynart::schema::entropy_t& entropy);

}  // namespace dynart::content
