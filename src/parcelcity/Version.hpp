#pragma once

#include <string>

// Build/version metadata for ParcelCity.
//
// CMake defines these macros for all targets via parcelcity_core's PUBLIC
// compile definitions. The fallbacks keep the header usable outside CMake.

#ifndef PARCELCITY_VERSION_MAJOR
#define PARCELCITY_VERSION_MAJOR 0
#endif

#ifndef PARCELCITY_VERSION_MINOR
#define PARCELCITY_VERSION_MINOR 0
#endif

#ifndef PARCELCITY_VERSION_PATCH
#define PARCELCITY_VERSION_PATCH 0
#endif

#ifndef PARCELCITY_VERSION_STRING
#define PARCELCITY_VERSION_STRING "0.0.0"
#endif

namespace parcelcity {

struct ParcelCityVersion {
  int major;
  int minor;
  int patch;
};

inline constexpr ParcelCityVersion ParcelCityVersionNumbers()
{
  return ParcelCityVersion{PARCELCITY_VERSION_MAJOR, PARCELCITY_VERSION_MINOR, PARCELCITY_VERSION_PATCH};
}

inline constexpr const char* ParcelCityVersionString()
{
  return PARCELCITY_VERSION_STRING;
}

inline std::string ParcelCityFullVersionString()
{
  return std::string("parcelcity ") + ParcelCityVersionString() + " (built " + __DATE__ + ")";
}

} // namespace parcelcity
