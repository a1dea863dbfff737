#pragma once

#include <string>

// Version metadata. CMake sets these as PUBLIC compile definitions on
// wangpaint_core; the fallbacks keep the header usable without it.

#ifndef WANGPAINT_VERSION_MAJOR
#define WANGPAINT_VERSION_MAJOR 0
#endif

#ifndef WANGPAINT_VERSION_MINOR
#define WANGPAINT_VERSION_MINOR 0
#endif

#ifndef WANGPAINT_VERSION_PATCH
#define WANGPAINT_VERSION_PATCH 0
#endif

#ifndef WANGPAINT_VERSION_STRING
#define WANGPAINT_VERSION_STRING "0.0.0"
#endif

#ifndef WANGPAINT_GIT_SHA
#define WANGPAINT_GIT_SHA "unknown"
#endif

namespace wangpaint {

struct WangPaintVersion {
  int major;
  int minor;
  int patch;
};

inline constexpr WangPaintVersion WangPaintVersionNumbers()
{
  return WangPaintVersion{WANGPAINT_VERSION_MAJOR, WANGPAINT_VERSION_MINOR, WANGPAINT_VERSION_PATCH};
}

inline constexpr const char* WangPaintVersionString()
{
  return WANGPAINT_VERSION_STRING;
}

// "1.2.3" or "1.2.3 (abc1234)" when the build knows its git revision.
inline std::string WangPaintFullVersionString()
{
  std::string s = WangPaintVersionString();
  const std::string sha = WANGPAINT_GIT_SHA;
  if (!sha.empty() && sha != "unknown") s += " (" + sha + ")";
  return s;
}

} // namespace wangpaint
