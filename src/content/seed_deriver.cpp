#include <dynart/blake3/hash.hpp>
#include <dynart/content/seed_deriver.hpp>
#include <dynart/schema/encoding/scale/encoder.hpp>
#include <tuple>

using namespace dynart::schema;

namespace {

using encoder_t =
    dynart::schema::encoding::encoder<dynart::schema::encoding::scale_encoder_tag>;

template <typename... Args>
seed_t hash_tuple(const Args&... args) {
  auto encoder = encoder_t{};
  auto material = encoder.encode(std::tuple{args...});
  return make_seed(dynart::blake3::hash(
      dynart::schema::bytes_view_t{material.data(), material.size()}));
}

}  // namespace

namespace dynart::content {

seed_t hash_words(const token_id_t first, const uint64_t second) {
  return hash_tuple(first, second);
}

seed_pair derive_seeds(const token_id_t token_id, const entropy_t& entropy) {
  auto result = seed_pair{};
  result.seed_a =
      hash_tuple(token_id, entropy.current_time, entropy.previous_hash);
  result.seed_b = hash_tuple(to_hash32(result.seed_a), entropy.producer,
                             to_hash32(entropy.difficulty));
  return result;
}

}  // namespace dynart::content
