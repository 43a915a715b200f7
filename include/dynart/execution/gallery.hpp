#pragma once

#include <dynart/execution/entropy_provider.hpp>
#include <dynart/execution/registry.hpp>
#include <dynart/schema/entropy.hpp>
#include <dynart/schema/query_result.hpp>
#include <string>
#include <string_view>

namespace dynart::execution {

inline constexpr auto kGalleryCodespace = std::string_view{"dynart.gallery"};

/// Read-only content facade over a registry.
///
/// Nothing is cached: every call checks existence, then regenerates seeds,
/// image and metadata from the identifier and the supplied entropy.
class gallery final {
 public:
  explicit gallery(const registry& assets,
                   entropy_provider_t entropy_provider = {});

  /// `data:application/json;base64,...` description of `token_id`, or
  /// not_found when the identifier was never allocated.
  dynart::schema::query_result<std::string> describe_asset(
      dynart::schema::token_id_t token_id,
      const dynart::schema::entropy_t& entropy) const;

  /// Same, with entropy pulled from the installed provider.
  dynart::schema::query_result<std::string> describe_asset(
      dynart::schema::token_id_t token_id) const;

  void set_entropy_provider(entropy_provider_t entropy_provider);

 private:
  const registry& registry_;
  entropy_provider_t entropy_provider_;
};

}  // namespace dynart::execution
