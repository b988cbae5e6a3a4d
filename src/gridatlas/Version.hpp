#pragma once

#include <string>

// Build/version metadata.
//
// CMake defines these for every target through gridatlas_core's PUBLIC compile
// definitions; the fallbacks keep the header usable outside CMake.

#ifndef GRIDATLAS_VERSION_MAJOR
#define GRIDATLAS_VERSION_MAJOR 0
#endif

#ifndef GRIDATLAS_VERSION_MINOR
#define GRIDATLAS_VERSION_MINOR 0
#endif

#ifndef GRIDATLAS_VERSION_PATCH
#define GRIDATLAS_VERSION_PATCH 0
#endif

#ifndef GRIDATLAS_VERSION_STRING
#define GRIDATLAS_VERSION_STRING "0.0.0"
#endif

#ifndef GRIDATLAS_GIT_SHA
#define GRIDATLAS_GIT_SHA "unknown"
#endif

namespace gridatlas {

inline constexpr const char* GridAtlasVersionString() { return GRIDATLAS_VERSION_STRING; }

inline std::string GridAtlasFullVersionString()
{
  std::string s = GridAtlasVersionString();
  const std::string sha = GRIDATLAS_GIT_SHA;
  if (!sha.empty() && sha != "unknown") s += " (" + sha + ")";
  return s;
}

} // namespace gridatlas
