#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <numbers>

#include <tripviz/network_geom.hpp>
#include "log_capture.hpp"

using Catch::Approx;
using namespace tripviz;

static RawLane make_lane(std::string id, std::vector<std::string> allow, std::vector<Vec2> line) {
  RawLane l;
  l.attrs.id = std::move(id);
  l.attrs.allow = std::move(allow);
  l.line = std::move(line);
  return l;
}

static double triangles_area(const std::vector<std::array<Vec2, 3>>& tris) {
  double a = 0.0;
  for (const auto& t : tris) a += std::abs(ring_area({t[0], t[1], t[2], t[0]}));
  return a;
}

static Polygon square(double x0, double y0, double side) {
  return Polygon{{{x0, y0}, {x0 + side, y0}, {x0 + side, y0 + side}, {x0, y0 + side}, {x0, y0}}, {}};
}

TEST_CASE("buffer_lane on planar data yields a width x length rectangle") {
  const Polygon poly = buffer_lane({{0.0, 0.0}, {100.0, 0.0}}, 2.0, /*geographic*/ false);
  REQUIRE(poly.holes.empty());
  const Ring& r = poly.outer;
  REQUIRE(r.size() >= 4);
  REQUIRE(r.front() == r.back());
  REQUIRE(ring_area(r) == Approx(400.0).epsilon(1e-6));

  const Bounds b = [&]{ Bounds x; for (const auto& p : r) x.extend(p); return x; }();
  REQUIRE(b.min_x == Approx(0.0).margin(1e-9));
  REQUIRE(b.max_x == Approx(100.0));
  REQUIRE(b.min_y == Approx(-2.0));
  REQUIRE(b.max_y == Approx(2.0));
}

TEST_CASE("buffer_lane on lon/lat data buffers in meters") {
  // ~111 m east along the equator
  const Ring r = buffer_lane({{0.0, 0.0}, {0.001, 0.0}}, 1.6, /*geographic*/ true).outer;
  REQUIRE_FALSE(r.empty());
  const double m_per_deg = 6371008.8 * std::numbers::pi / 180.0;
  const double area_m2 = ring_area(r) * m_per_deg * m_per_deg;
  REQUIRE(area_m2 == Approx(0.001 * m_per_deg * 3.2).epsilon(1e-3));
}

TEST_CASE("buffer_lane rejects degenerate centerlines") {
  REQUIRE(buffer_lane({{1.0, 1.0}}, 1.0, false).empty());
  REQUIRE(buffer_lane({{1.0, 1.0}, {1.0, 1.0}}, 1.0, false).empty());
  REQUIRE(buffer_lane({{0.0, 0.0}, {1.0, 0.0}}, 0.0, false).empty());
}

TEST_CASE("buffer_lane keeps the hole of a centerline that closes on itself") {
  const Polygon loop = buffer_lane({{0, 0}, {100, 0}, {100, 100}, {0, 100}, {0, 0}}, 2.0, false);
  REQUIRE_FALSE(loop.empty());
  REQUIRE(loop.holes.size() == 1);
  const Ring& hole = loop.holes[0];
  REQUIRE(hole.front() == hole.back());
  REQUIRE(ring_area(hole) < 0.0);
  REQUIRE(ring_area(loop.outer) > 0.0);
  // a 4 m band around a 100 m square
  REQUIRE(polygon_area(loop) == Approx(1600.0).epsilon(0.01));

  REQUIRE(triangles_area(triangulate_polygon(loop)) == Approx(polygon_area(loop)).epsilon(1e-6));
}

TEST_CASE("largest_part keeps the biggest disjoint part") {
  std::vector<Polygon> parts{square(0, 0, 1), square(10, 10, 2), square(20, 0, 1.5)};
  const Polygon best = largest_part(parts);
  REQUIRE(best == parts[1]);
  REQUIRE(polygon_area(best) == Approx(4.0));
  REQUIRE(largest_part({}).empty());

  LaneAttrs attrs;
  attrs.id = "split_0";
  attrs.allow = {"bus"};
  attrs.width = 3.0;
  const LanePolygon lane = make_lane_polygon(attrs, parts);
  REQUIRE(lane.attrs == attrs);
  REQUIRE(lane.ring == parts[1].outer);
  REQUIRE(lane.holes.empty());
}

TEST_CASE("polygon_area subtracts holes") {
  Polygon p = square(0, 0, 4);
  p.holes.push_back(Ring{{1, 1}, {1, 2}, {2, 2}, {2, 1}, {1, 1}});
  REQUIRE(polygon_area(p) == Approx(15.0));
}

TEST_CASE("derive_network_geometry filters lanes by allowed class") {
  LogCapture log;
  RawNetwork net;
  net.lanes.push_back(make_lane("bus_0", {"bus"}, {{0, 0}, {50, 0}}));
  net.lanes.push_back(make_lane("car_0", {"private", "taxi"}, {{0, 10}, {50, 10}}));
  net.lanes.push_back(make_lane("rail_0", {"rail"}, {{0, 20}, {50, 20}}));

  DeriveOptions opt;
  opt.geographic = false;
  const NetworkGeometry g = derive_network_geometry(net, opt);
  REQUIRE(g.lanes.size() == 2);
  REQUIRE(g.arrows.size() == 2);
  REQUIRE(g.lanes[0].attrs.id == "bus_0");
  REQUIRE(g.lanes[1].attrs.id == "car_0");
  REQUIRE(log.contains("lane 'rail_0': no allowed vehicle class"));
  REQUIRE(log.contains("1 without an allowed class"));
}

TEST_CASE("derive_network_geometry applies the default width") {
  RawNetwork net;
  net.lanes.push_back(make_lane("a_0", {"bus"}, {{0, 0}, {10, 0}}));
  RawLane bad = make_lane("b_0", {"bus"}, {{0, 10}, {10, 10}});
  bad.has_width = true;
  bad.attrs.width = -1.0;
  net.lanes.push_back(bad);
  RawLane wide = make_lane("c_0", {"bus"}, {{0, 20}, {10, 20}});
  wide.has_width = true;
  wide.attrs.width = 6.0;
  net.lanes.push_back(wide);

  DeriveOptions opt;
  opt.geographic = false;
  const NetworkGeometry g = derive_network_geometry(net, opt);
  REQUIRE(g.lanes.size() == 3);
  REQUIRE(ring_area(g.lanes[0].ring) == Approx(10.0 * kDefaultLaneWidth));
  REQUIRE(g.lanes[1].attrs.width == Approx(kDefaultLaneWidth));
  REQUIRE(ring_area(g.lanes[2].ring) == Approx(60.0));
}

TEST_CASE("derive_network_geometry skips lanes it cannot buffer") {
  RawNetwork net;
  net.lanes.push_back(make_lane("single_0", {"bus"}, {{0, 0}}));
  net.lanes.push_back(make_lane("dup_0", {"bus"}, {{3, 3}, {3, 3}}));
  DeriveOptions opt;
  opt.geographic = false;
  const NetworkGeometry g = derive_network_geometry(net, opt);
  REQUIRE(g.lanes.empty());
  // A two-point degenerate lane still gets its direction marker.
  REQUIRE(g.arrows.size() == 1);
  REQUIRE(g.arrows[0].attrs.id == "dup_0");
}

TEST_CASE("derive_network_geometry builds closed CCW junction rings") {
  RawNetwork net;
  // clockwise square with a repeated vertex
  net.junctions.push_back(RawJunction{"j1", {{0, 0}, {0, 1}, {0, 1}, {1, 1}, {1, 0}}});
  net.junctions.push_back(RawJunction{"j2", {{0, 0}, {1, 1}, {0, 0}}});
  const NetworkGeometry g = derive_network_geometry(net, {});
  REQUIRE(g.junctions.size() == 1);
  const Ring& r = g.junctions[0].ring;
  REQUIRE(g.junctions[0].id == "j1");
  REQUIRE(r.size() == 5);
  REQUIRE(r.front() == r.back());
  REQUIRE(ring_area(r) == Approx(1.0));
}

TEST_CASE("derive_network_geometry is deterministic") {
  RawNetwork net;
  net.lanes.push_back(make_lane("e1_0", {"bus"}, {{6.13, 49.61}, {6.131, 49.611}, {6.133, 49.611}}));
  net.junctions.push_back(RawJunction{"j", {{6.13, 49.61}, {6.1301, 49.61}, {6.1301, 49.6101}}});
  const NetworkGeometry a = derive_network_geometry(net, {});
  const NetworkGeometry b = derive_network_geometry(net, {});
  REQUIRE_FALSE(a.empty());
  REQUIRE(a == b);
}

TEST_CASE("make_arrow points along the last segment") {
  const ArrowMarker m = make_arrow(LaneAttrs{}, {{0, 0}, {5, 0}, {10, 0}}, 1.0);
  REQUIRE(m.head.size() == 4);
  REQUIRE(m.head.front() == m.head.back());
  REQUIRE(m.stem_tip.x == Approx(9.0));
  REQUIRE(m.stem_tip.y == Approx(0.0));
  REQUIRE(m.stem_base.x == Approx(7.0));
  REQUIRE(m.head[1].x == Approx(8.0));
  REQUIRE(m.head[1].y == Approx(0.6));
  REQUIRE(m.head[2].y == Approx(-0.6));
  REQUIRE(ring_area(m.head) > 0.0);
}

TEST_CASE("make_arrow skips repeated end points and falls back to +x") {
  const ArrowMarker up = make_arrow(LaneAttrs{}, {{0, 0}, {0, 4}, {0, 4}}, 1.0);
  REQUIRE(up.stem_tip.x == Approx(0.0).margin(1e-12));
  REQUIRE(up.stem_tip.y == Approx(3.0));

  const ArrowMarker flat = make_arrow(LaneAttrs{}, {{5, 5}, {5, 5}}, 1.0);
  REQUIRE(flat.stem_tip.x == Approx(4.0));
  REQUIRE(flat.stem_tip.y == Approx(5.0));
}

TEST_CASE("ring_area sign follows winding") {
  const Ring ccw{{0, 0}, {2, 0}, {2, 2}, {0, 2}, {0, 0}};
  const Ring cw{{0, 0}, {0, 2}, {2, 2}, {2, 0}, {0, 0}};
  REQUIRE(ring_area(ccw) == Approx(4.0));
  REQUIRE(ring_area(cw) == Approx(-4.0));
}

TEST_CASE("triangulate_polygon covers convex and concave rings") {
  auto t = triangulate_polygon(square(0, 0, 1));
  REQUIRE(t.size() == 2);
  REQUIRE(triangles_area(t) == Approx(1.0));

  // L-shape, clockwise on input
  const Ring ell{{0, 0}, {0, 2}, {1, 2}, {1, 1}, {2, 1}, {2, 0}, {0, 0}};
  t = triangulate_polygon(Polygon{ell, {}});
  REQUIRE(t.size() == 4);
  REQUIRE(triangles_area(t) == Approx(3.0));
  for (const auto& tri : t) REQUIRE(ring_area({tri[0], tri[1], tri[2], tri[0]}) > 0.0);

  REQUIRE(triangulate_polygon(Polygon{{{0, 0}, {1, 1}, {0, 0}}, {}}).empty());
}

TEST_CASE("triangulate_polygon leaves holes uncovered") {
  Polygon p = square(0, 0, 4);
  p.holes.push_back(Ring{{1, 1}, {1, 3}, {3, 3}, {3, 1}, {1, 1}});
  const auto t = triangulate_polygon(p);
  REQUIRE(t.size() == 8);
  REQUIRE(triangles_area(t) == Approx(12.0));
  for (const auto& tri : t) {
    const Vec2 c{(tri[0].x + tri[1].x + tri[2].x) / 3.0, (tri[0].y + tri[1].y + tri[2].y) / 3.0};
    const bool in_hole = c.x > 1.0 && c.x < 3.0 && c.y > 1.0 && c.y < 3.0;
    REQUIRE_FALSE(in_hole);
  }
}
