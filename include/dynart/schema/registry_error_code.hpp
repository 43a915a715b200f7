#pragma once

#include <dynart/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Registry failure taxonomy: stable numeric codes shared by mutation and
// query results. Zero is success and is never a member.
namespace dynart::schema {

enum class registry_error_code : uint32_t {
  not_found = 1,
  unauthorized = 2,
  invalid_recipient = 3,
  invalid_owner = 4,
  already_exists = 5,
  unsafe_recipient = 6,
  invalid_snapshot = 7,
};

inline constexpr auto kRegistryErrorCodeNames =
    std::array<std::pair<std::string_view, registry_error_code>, 7>{{
        {"not_found", registry_error_code::not_found},
        {"unauthorized", registry_error_code::unauthorized},
        {"invalid_recipient", registry_error_code::invalid_recipient},
        {"invalid_owner", registry_error_code::invalid_owner},
        {"already_exists", registry_error_code::already_exists},
        {"unsafe_recipient", registry_error_code::unsafe_recipient},
        {"invalid_snapshot", registry_error_code::invalid_snapshot},
    }};

constexpr std::optional<std::string_view> to_string(
    const registry_error_code value) {
  return to_string(value, kRegistryErrorCodeNames);
}

template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value);

template <>
inline std::optional<registry_error_code> try_from_string(
    const std::string_view value) {
  return from_string(value, kRegistryErrorCodeNames);
}

constexpr uint32_t to_code(const registry_error_code value) {
  return static_cast<uint32_t>(value);
}

}  // namespace dynart::schema
