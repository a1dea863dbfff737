#pragma once

// Argument parsing helpers for the wangpaint command-line tool.
//
// All parsers are strict: the whole string must parse, floats must be finite,
// and on failure the output is left untouched.

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace wangpaint::cli {

inline bool EnsureParentDir(const std::filesystem::path& file)
{
  if (file.empty()) return false;
  std::error_code ec;
  const std::filesystem::path parent = file.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) return false;
  }
  return true;
}

inline bool ParseI32(std::string_view s, int* out)
{
  if (!out) return false;
  // from_chars rejects a leading '+' on some standard libraries.
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return false;

  int v = 0;
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, v, 10);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

inline bool ParseU32(std::string_view s, std::uint32_t* out)
{
  if (!out) return false;
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return false;

  std::uint32_t v = 0;
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, v, 10);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

inline bool ParseF64(std::string_view s, double* out)
{
  if (!out) return false;
  if (s.empty()) return false;

  const std::string tmp(s);
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(tmp.c_str(), &end);
  if (errno != 0) return false;
  if (!end || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

inline bool ParseF32(std::string_view s, float* out)
{
  if (!out) return false;
  double v = 0.0;
  if (!ParseF64(s, &v)) return false;
  if (std::fabs(v) > static_cast<double>(std::numeric_limits<float>::max())) return false;
  *out = static_cast<float>(v);
  return true;
}

// "64x32" -> (64, 32). Both sides must be positive.
inline bool ParseWxH(std::string_view s, int* outW, int* outH)
{
  if (!outW || !outH) return false;
  const std::size_t pos = s.find_first_of("xX");
  if (pos == std::string_view::npos) return false;
  int w = 0;
  int h = 0;
  if (!ParseI32(s.substr(0, pos), &w)) return false;
  if (!ParseI32(s.substr(pos + 1), &h)) return false;
  if (w <= 0 || h <= 0) return false;
  *outW = w;
  *outH = h;
  return true;
}

// "3,4" -> (3, 4), unsigned.
inline bool ParseU32Pair(std::string_view s, std::uint32_t* outA, std::uint32_t* outB)
{
  if (!outA || !outB) return false;
  const std::size_t pos = s.find(',');
  if (pos == std::string_view::npos) return false;
  std::uint32_t a = 0;
  std::uint32_t b = 0;
  if (!ParseU32(s.substr(0, pos), &a)) return false;
  if (!ParseU32(s.substr(pos + 1), &b)) return false;
  *outA = a;
  *outB = b;
  return true;
}

// "1.5,-2" -> (1.5, -2).
inline bool ParseF32Pair(std::string_view s, float* outA, float* outB)
{
  if (!outA || !outB) return false;
  const std::size_t pos = s.find(',');
  if (pos == std::string_view::npos) return false;
  float a = 0.0f;
  float b = 0.0f;
  if (!ParseF32(s.substr(0, pos), &a)) return false;
  if (!ParseF32(s.substr(pos + 1), &b)) return false;
  *outA = a;
  *outB = b;
  return true;
}

// "x0,y0:x1,y1" -> two signed points.
inline bool ParseI32Segment(std::string_view s, int* x0, int* y0, int* x1, int* y1)
{
  if (!x0 || !y0 || !x1 || !y1) return false;
  const std::size_t colon = s.find(':');
  if (colon == std::string_view::npos) return false;

  const auto pair = [](std::string_view p, int* a, int* b) {
    const std::size_t comma = p.find(',');
    if (comma == std::string_view::npos) return false;
    return ParseI32(p.substr(0, comma), a) && ParseI32(p.substr(comma + 1), b);
  };

  int ax = 0;
  int ay = 0;
  int bx = 0;
  int by = 0;
  if (!pair(s.substr(0, colon), &ax, &ay)) return false;
  if (!pair(s.substr(colon + 1), &bx, &by)) return false;
  *x0 = ax;
  *y0 = ay;
  *x1 = bx;
  *y1 = by;
  return true;
}

inline std::string HexU64(std::uint64_t v)
{
  std::ostringstream oss;
  oss << "0x" << std::hex << std::setw(16) << std::setfill('0') << v;
  return oss.str();
}

} // namespace wangpaint::cli
