#pragma once

#include <string_view>

// Injected by CMake via -DCLEWDR_VERSION_STRING=...
#ifndef CLEWDR_VERSION_STRING
#define CLEWDR_VERSION_STRING "0.1.0-dev"
#endif

namespace clewdr {

inline constexpr std::string_view kVersion = CLEWDR_VERSION_STRING;

/// Identification text returned to client connection tests.
inline constexpr std::string_view kTitle = "clewdr++ v" CLEWDR_VERSION_STRING;

} // namespace clewdr
