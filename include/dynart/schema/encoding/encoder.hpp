#pragma once
#include <dynart/schema/primitives.hpp>
#include <optional>

namespace dynart::schema::encoding {

// Build-time selection of the wire encoding. Call sites name the library
// through a tag, e.g. encoder<scale_encoder_tag>, so swapping codecs does not
// touch the code that hashes or snapshots state.
template <typename Library>
struct encoder {
  template <typename T>
  dynart::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, dynart::schema::bytes_t& out);

  template <typename T>
  T decode(const dynart::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const dynart::schema::bytes_view_t& bytes);
};

}  // namespace dynart::schema::encoding
