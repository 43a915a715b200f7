#pragma once
#include <dynart/schema/primitives.hpp>

// Schema type: asset state.
// One registry entry: current owner plus the single approved spender, which
// is null whenever no approval is outstanding.
namespace dynart::schema {

template <uint16_t Version>
struct asset_state;

template <>
struct asset_state<1> final {
  uint16_t version{1};
  token_id_t token_id{};
  identity_t owner{};
  identity_t approved{};
};

using asset_state_t = asset_state<1>;

}  // namespace dynart::schema
