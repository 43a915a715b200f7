#pragma once

#include <dynart/schema/primitives.hpp>
#include <functional>

namespace dynart::execution {

/// Recipient-acceptance capability consulted by safe_transfer only.
///
/// Arguments are (operator, from, to, token_id, extra_data). Returning false
/// rejects the transfer. Runs while the registry write lock is held and must
/// not call back into the registry.
using recipient_check_t =
    std::function<bool(const dynart::schema::identity_t& operator_id,
                       const dynart::schema::identity_t& from,
                       const dynart::schema::identity_t& to,
                       dynart::schema::token_id_t token_id,
                       const dynart::schema::bytes_view_t& extra_data)>;

}  // namespace dynart::execution
