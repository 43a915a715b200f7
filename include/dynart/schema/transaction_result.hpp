#pragma once

#include <dynart/schema/primitives.hpp>
#include <dynart/schema/transaction_event.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: transaction result.
// Outcome of a registry mutation. `code` is zero on success, otherwise a
// registry_error_code; a failed mutation never carries events.
namespace dynart::schema {

template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::optional<token_id_t> token_id;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<transaction_event_t> events;

  bool ok() const { return code == 0; }
};

using transaction_result_t = transaction_result<1>;

}  // namespace dynart::schema
