#include <blake3.h>
#include <dynart/blake3/hash.hpp>

namespace dynart::blake3 {

namespace {

dynart::schema::hash32_t digest(const void* data, const size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  // BLAKE3_OUT_LEN
  auto output = dynart::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

dynart::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

dynart::schema::hash32_t hash(const dynart::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace dynart::blake3
