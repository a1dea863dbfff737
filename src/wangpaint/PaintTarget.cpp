#include "wangpaint/PaintTarget.hpp"

#include "wangpaint/WangId.hpp"

#include <algorithm>
#include <cctype>
#include <climits>
#include <cmath>
#include <sstream>

namespace wangpaint {

namespace {

static std::string LowerCopy(std::string s)
{
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

inline std::uint32_t ClampCoord(int v)
{
  return static_cast<std::uint32_t>(std::max(0, v));
}

// floor() saturated to [INT_MIN, INT_MAX - 1] so the +1 of a snap cannot
// overflow.
inline int FloorToTile(float f)
{
  const double t = std::floor(static_cast<double>(f));
  const double lo = static_cast<double>(INT_MIN);
  const double hi = static_cast<double>(INT_MAX - 1);
  return static_cast<int>(std::clamp(t, lo, hi));
}

// Lower side for local < 0.5, upper side otherwise.
inline int Snap(int tile, float local)
{
  return (local < 0.5f) ? tile : tile + 1;
}

// Fractional part in [0,1). A negative fraction (negative world coordinate)
// wraps by +1 so it lines up with floor().
inline float LocalFraction(float f)
{
  float local = f - std::trunc(f);
  if (local < 0.0f) local += 1.0f;
  return local;
}

inline int Zone(float local)
{
  if (local < 0.33f) return 0;
  if (local < 0.67f) return 1;
  return 2;
}

constexpr std::uint64_t kHorizontalEdgeSeedBits = 0x1000000000000000ULL;
constexpr std::uint64_t kVerticalEdgeSeedBits = 0x2000000000000000ULL;

} // namespace

const char* ToString(PaintTargetKind k)
{
  switch (k) {
  case PaintTargetKind::Corner: return "corner";
  case PaintTargetKind::HorizontalEdge: return "hedge";
  case PaintTargetKind::VerticalEdge: return "vedge";
  default: return "corner";
  }
}

bool ParsePaintTargetKind(const std::string& s, PaintTargetKind& out)
{
  const std::string t = LowerCopy(s);
  if (t.empty()) return false;

  if (t == "corner" || t == "c") {
    out = PaintTargetKind::Corner;
    return true;
  }
  if (t == "hedge" || t == "horizontal" || t == "horizontal_edge" || t == "h") {
    out = PaintTargetKind::HorizontalEdge;
    return true;
  }
  if (t == "vedge" || t == "vertical" || t == "vertical_edge" || t == "v") {
    out = PaintTargetKind::VerticalEdge;
    return true;
  }
  return false;
}

std::string ToString(const PaintTarget& t)
{
  std::ostringstream oss;
  oss << ToString(t.kind) << '(' << t.x << ',' << t.y << ')';
  return oss.str();
}

PaintTarget ResolvePaintTarget(float worldX, float worldY, float tileSize, TerrainSetType type)
{
  if (!(tileSize > 0.0f) || !std::isfinite(tileSize)) tileSize = 1.0f;
  if (!std::isfinite(worldX)) worldX = 0.0f;
  if (!std::isfinite(worldY)) worldY = 0.0f;

  const float fx = worldX / tileSize;
  const float fy = worldY / tileSize;

  const int tileX = FloorToTile(fx);
  const int tileY = FloorToTile(fy);
  const float localX = LocalFraction(fx);
  const float localY = LocalFraction(fy);

  if (type == TerrainSetType::Corner) {
    return PaintTarget::Corner(ClampCoord(Snap(tileX, localX)), ClampCoord(Snap(tileY, localY)));
  }

  if (type == TerrainSetType::Edge) {
    const float distH = std::fabs(localY - 0.5f);
    const float distV = std::fabs(localX - 0.5f);
    if (distH < distV) {
      return PaintTarget::HorizontalEdge(ClampCoord(tileX), ClampCoord(Snap(tileY, localY)));
    }
    return PaintTarget::VerticalEdge(ClampCoord(Snap(tileX, localX)), ClampCoord(tileY));
  }

  // Mixed: 3x3 zones.
  const int zx = Zone(localX);
  const int zy = Zone(localY);

  if (zx != 1 && zy != 1) {
    // Outer corner zones.
    return PaintTarget::Corner(ClampCoord(zx == 0 ? tileX : tileX + 1), ClampCoord(zy == 0 ? tileY : tileY + 1));
  }
  if (zx == 1 && zy != 1) {
    return PaintTarget::HorizontalEdge(ClampCoord(tileX), ClampCoord(zy == 0 ? tileY : tileY + 1));
  }
  if (zx != 1 && zy == 1) {
    return PaintTarget::VerticalEdge(ClampCoord(zx == 0 ? tileX : tileX + 1), ClampCoord(tileY));
  }

  // Centre zone: re-normalise into the zone and take the nearest corner.
  const float cx = (localX - 0.33f) / 0.34f;
  const float cy = (localY - 0.33f) / 0.34f;
  return PaintTarget::Corner(ClampCoord(Snap(tileX, cx)), ClampCoord(Snap(tileY, cy)));
}

std::vector<AffectedCell> AffectedCells(const PaintTarget& target, int width, int height)
{
  // 64-bit so huge unsigned target coordinates cannot wrap into the grid.
  const std::int64_t tx = static_cast<std::int64_t>(target.x);
  const std::int64_t ty = static_cast<std::int64_t>(target.y);

  struct Raw {
    std::int64_t x;
    std::int64_t y;
    WangPosition pos;
  };

  Raw raw[4];
  int count = 0;

  switch (target.kind) {
  case PaintTargetKind::Corner:
    raw[count++] = Raw{tx - 1, ty - 1, WangPosition::TopRight};
    raw[count++] = Raw{tx, ty - 1, WangPosition::TopLeft};
    raw[count++] = Raw{tx - 1, ty, WangPosition::BottomRight};
    raw[count++] = Raw{tx, ty, WangPosition::BottomLeft};
    break;
  case PaintTargetKind::HorizontalEdge:
    raw[count++] = Raw{tx, ty - 1, WangPosition::Top};
    raw[count++] = Raw{tx, ty, WangPosition::Bottom};
    break;
  case PaintTargetKind::VerticalEdge:
    raw[count++] = Raw{tx - 1, ty, WangPosition::Right};
    raw[count++] = Raw{tx, ty, WangPosition::Left};
    break;
  }

  std::vector<AffectedCell> out;
  out.reserve(static_cast<std::size_t>(count));
  for (int i = 0; i < count; ++i) {
    const Raw& r = raw[i];
    if (r.x < 0 || r.y < 0 || r.x >= width || r.y >= height) continue;
    out.push_back(AffectedCell{Point{static_cast<int>(r.x), static_cast<int>(r.y)}, WangIndex(r.pos)});
  }
  return out;
}

std::uint64_t PaintSeed(const PaintTarget& target)
{
  const std::uint64_t base = (static_cast<std::uint64_t>(target.x) << 32) | static_cast<std::uint64_t>(target.y);
  switch (target.kind) {
  case PaintTargetKind::Corner: return base;
  case PaintTargetKind::HorizontalEdge: return base | kHorizontalEdgeSeedBits;
  case PaintTargetKind::VerticalEdge: return base | kVerticalEdgeSeedBits;
  }
  return base;
}

} // namespace wangpaint
