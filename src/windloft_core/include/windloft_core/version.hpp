#pragma once

#include <string>
#include <string_view>

#ifndef WINDLOFT_CORE_VERSION_STR
#define WINDLOFT_CORE_VERSION_STR "0.0.0-dev"
#endif

namespace windloft::core {
inline constexpr std::string_view kVersion = WINDLOFT_CORE_VERSION_STR;

inline std::string version() {
  return std::string(kVersion);
}

// True when grid transforms and farm layout run under OpenMP.
inline bool openmp_enabled() {
#if defined(_OPENMP)
  return true;
#else
  return false;
#endif
}
}  // namespace windloft::core
