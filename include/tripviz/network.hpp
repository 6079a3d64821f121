#pragma once
#include <algorithm>
#include <limits>
#include <string>
#include <vector>

namespace tripviz {

// Default lane width (m) when the network does not declare one.
inline constexpr double kDefaultLaneWidth = 3.2;

// Planar point in data units (x = longitude, y = latitude for geographic data).
struct Vec2 {
  double x{};
  double y{};

  bool operator==(const Vec2&) const = default;
};

// Closed ring: front() == back().
using Ring = std::vector<Vec2>;

// Outer ring counter-clockwise, holes clockwise.
struct Polygon {
  Ring outer;
  std::vector<Ring> holes;

  bool empty() const { return outer.empty(); }
  bool operator==(const Polygon&) const = default;
};

struct Bounds {
  double min_x{ std::numeric_limits<double>::infinity()};
  double min_y{ std::numeric_limits<double>::infinity()};
  double max_x{-std::numeric_limits<double>::infinity()};
  double max_y{-std::numeric_limits<double>::infinity()};

  bool valid() const { return min_x <= max_x && min_y <= max_y; }
  void extend(const Vec2& p) {
    min_x = std::min(min_x, p.x); max_x = std::max(max_x, p.x);
    min_y = std::min(min_y, p.y); max_y = std::max(max_y, p.y);
  }
  Vec2 center() const { return {0.5 * (min_x + max_x), 0.5 * (min_y + max_y)}; }
};

// Attributes carried from a source lane onto everything derived from it.
struct LaneAttrs {
  std::string id;
  std::vector<std::string> allow;   // allowed vehicle classes
  double width{kDefaultLaneWidth};  // meters
  bool tunnel{false};

  bool allows(const std::string& cls) const {
    return std::find(allow.begin(), allow.end(), cls) != allow.end();
  }
  bool operator==(const LaneAttrs&) const = default;
};

struct RawLane {
  LaneAttrs attrs;
  bool has_width{false};    // false -> width is the default
  std::vector<Vec2> line;   // centerline, in travel direction
};

struct RawJunction {
  std::string id;
  std::vector<Vec2> points;
};

// Raw network as loaded from GeoJSON (lanes + junctions only).
struct RawNetwork {
  std::vector<RawLane> lanes;
  std::vector<RawJunction> junctions;
};

} // namespace tripviz
