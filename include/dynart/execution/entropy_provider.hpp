#pragma once

#include <dynart/schema/entropy.hpp>
#include <functional>

namespace dynart::execution {

/// Host capability returning the entropy inputs for the current call.
using entropy_provider_t = std::function<dynart::schema::entropy_t()>;

}  // namespace dynart::execution
