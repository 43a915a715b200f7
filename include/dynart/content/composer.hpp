#pragma once
#include <dynart/content/image.hpp>
#include <dynart/schema/primitives.hpp>
#include <string>

namespace dynart::content {

/// Lower-case `#rrggbb` rendering of the low 24 bits of `seed`.
std::string make_color(const dynart::schema::seed_t& seed);

/// Derive the three palette colors from seed_a, seed_b and seed_a ^ seed_b.
palette_t make_palette(const dynart::schema::seed_t& seed_a,
                       const dynart::schema::seed_t& seed_b);

/// Build the image for `token_id`. Between 3 and 7 circles and between 1 and
/// 4 rectangles; every coordinate is a function of the id and the seeds only.
image_description compose(dynart::schema::token_id_t token_id,
                          const dynart::schema::seed_t& seed_a,
                          const dynart::schema::seed_t& seed_b);

/// Serialize to a single-line SVG document.
std::string to_svg(const image_description& image);

}  // namespace dynart::content
