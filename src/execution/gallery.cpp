#include <spdlog/spdlog.h>
#include <dynart/common/critical.hpp>
#include <dynart/content/composer.hpp>
#include <dynart/content/metadata.hpp>
#include <dynart/content/seed_deriver.hpp>
#include <dynart/execution/gallery.hpp>

using namespace dynart::schema;

namespace dynart::execution {

namespace {

query_result<std::string> make_not_found(const token_id_t token_id) {
  auto result = query_result<std::string>{};
  result.code = to_code(registry_error_code::not_found);
  result.log = "token " + std::to_string(token_id) + " does not exist";
  result.codespace = std::string{kGalleryCodespace};
  return result;
}

}  // namespace

gallery::gallery(const registry& assets, entropy_provider_t entropy_provider)
    : registry_{assets}, entropy_provider_{std::move(entropy_provider)} {}

query_result<std::string> gallery::describe_asset(
    const token_id_t token_id,
    const entropy_t& entropy) const {
  if (!registry_.exists(token_id)) {
    return make_not_found(token_id);
  }

  auto seeds = dynart::content::derive_seeds(token_id, entropy);
  auto image = dynart::content::compose(token_id, seeds.seed_a, seeds.seed_b);
  auto record = dynart::content::assemble(token_id, image,
                                          image.circles.size(),
                                          image.rects.size(), image.palette);
  spdlog::debug("Rendered token {} with {} circle(s), {} rect(s)", token_id,
                image.circles.size(), image.rects.size());

  auto result = query_result<std::string>{};
  result.value = dynart::content::to_data_uri(record);
  return result;
}

query_result<std::string> gallery::describe_asset(
    const token_id_t token_id) const {
  if (!entropy_provider_) {
    dynart::common::critical("describe_asset called without entropy provider");
  }
  // Existence first: the host is not asked for entropy on a missing token.
  if (!registry_.exists(token_id)) {
    return make_not_found(token_id);
  }
  return describe_asset(token_id, entropy_provider_());
}

void gallery::set_entropy_provider(entropy_provider_t entropy_provider) {
  entropy_provider_ = std::move(entropy_provider);
}

}  // namespace dynart::execution
