#include "wangpaint/WangId.hpp"

namespace wangpaint {

const char* ToString(WangPosition p)
{
  switch (p) {
  case WangPosition::Top: return "top";
  case WangPosition::TopRight: return "top_right";
  case WangPosition::Right: return "right";
  case WangPosition::BottomRight: return "bottom_right";
  case WangPosition::Bottom: return "bottom";
  case WangPosition::BottomLeft: return "bottom_left";
  case WangPosition::Left: return "left";
  case WangPosition::TopLeft: return "top_left";
  }
  return "top";
}

} // namespace wangpaint
