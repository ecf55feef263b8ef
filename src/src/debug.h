#pragma once

#include <cstdlib>

namespace cf {
namespace detail {

// Tracing to std::cerr is enabled by setting CF_VALIDATE_DEBUG.
inline bool debug_enabled() { return std::getenv("CF_VALIDATE_DEBUG") != nullptr; }

}  // namespace detail
}  // namespace cf
