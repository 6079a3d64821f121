#pragma once
#include <array>
#include <string>
#include <vector>
#include <tripviz/network.hpp>

namespace tripviz {

struct LanePolygon {
  LaneAttrs attrs;
  Ring ring;               // closed, counter-clockwise
  std::vector<Ring> holes; // closed, clockwise (self-overlapping centerlines)

  bool operator==(const LanePolygon&) const = default;
};

struct JunctionPolygon {
  std::string id;
  Ring ring;  // closed, counter-clockwise

  bool operator==(const JunctionPolygon&) const = default;
};

// Direction marker at the downstream end of a lane.
struct ArrowMarker {
  LaneAttrs attrs;
  Ring head;        // triangle {tip, left, right, tip}
  Vec2 stem_base{};
  Vec2 stem_tip{};  // == head tip

  bool operator==(const ArrowMarker&) const = default;
};

// Derived, read-only geometry for one raw network.
struct NetworkGeometry {
  std::vector<LanePolygon> lanes;
  std::vector<JunctionPolygon> junctions;
  std::vector<ArrowMarker> arrows;

  bool empty() const { return lanes.empty() && junctions.empty() && arrows.empty(); }
  Bounds bounds() const;

  bool operator==(const NetworkGeometry&) const = default;
};

struct DeriveOptions {
  double default_width{kDefaultLaneWidth};  // meters
  double arrow_size{0.000025};              // data units
  bool geographic{true};                    // buffer in meters around lon/lat data
  std::vector<std::string> allowed_classes{"bus", "private"};
};

// Pure: identical input yields identical output.
NetworkGeometry derive_network_geometry(const RawNetwork& net, const DeriveOptions& opt = {});

// Buffer one centerline by half_width with flat end caps and miter joins.
// Every part of the result, in data units; empty if the line is degenerate.
std::vector<Polygon> buffer_lane_parts(const std::vector<Vec2>& line, double half_width, bool geographic);

// Largest part of buffer_lane_parts(); empty polygon if there is none.
Polygon buffer_lane(const std::vector<Vec2>& line, double half_width, bool geographic);

// Part with the largest area (outer minus holes); empty polygon if none.
Polygon largest_part(std::vector<Polygon> parts);

// Lane polygon from buffered parts: keeps the largest part, carries attrs.
LanePolygon make_lane_polygon(const LaneAttrs& attrs, std::vector<Polygon> parts);

ArrowMarker make_arrow(const LaneAttrs& attrs, const std::vector<Vec2>& line, double size);

// Shoelace area; positive for counter-clockwise rings.
double ring_area(const Ring& ring);
// Unsigned area of the outer ring minus its holes.
double polygon_area(const Polygon& poly);

// Filled triangles of a polygon with holes (mapbox earcut).
std::vector<std::array<Vec2, 3>> triangulate_polygon(const Polygon& poly);

} // namespace tripviz
