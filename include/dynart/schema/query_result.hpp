#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Schema type: query result.
// Read-path envelope: either a value with code zero, or an error code with a
// log line and no value.
namespace dynart::schema {

template <typename T>
struct query_result final {
  uint32_t code{};
  std::optional<T> value;
  std::string log;
  std::string codespace;

  bool ok() const { return code == 0 && value.has_value(); }
};

}  // namespace dynart::schema
