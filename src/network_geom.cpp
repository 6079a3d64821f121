#include <tripviz/network_geom.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <numbers>
#include <set>
#include <utility>

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <mapbox/earcut.hpp>
#include <spdlog/spdlog.h>

namespace tripviz {

namespace {

namespace bg = boost::geometry;
using BgPoint   = bg::model::d2::point_xy<double>;
using BgLine    = bg::model::linestring<BgPoint>;
using BgPolygon = bg::model::polygon<BgPoint, /*ClockWise*/ false, /*Closed*/ true>;
using BgMulti   = bg::model::multi_polygon<BgPolygon>;

inline constexpr double kEarthRadiusM = 6371008.8;
inline constexpr double kDegToRad = std::numbers::pi_v<double> / 180.0;

// Local equirectangular frame in meters around an origin (identity for planar data).
struct LocalFrame {
  double x0{0.0};
  double y0{0.0};
  double kx{1.0};
  double ky{1.0};

  static LocalFrame around(const Vec2& origin) {
    const double k = kEarthRadiusM * kDegToRad;
    return LocalFrame{origin.x, origin.y, k * std::cos(origin.y * kDegToRad), k};
  }
  Vec2 to_local(const Vec2& p) const { return {(p.x - x0) * kx, (p.y - y0) * ky}; }
  Vec2 to_data(const Vec2& q) const { return {x0 + q.x / kx, y0 + q.y / ky}; }
};

void close_ring(Ring& r) {
  if (!r.empty() && !(r.front() == r.back())) r.push_back(r.front());
}

// Closed and counter-clockwise (GeoJSON exterior winding).
void normalize_ring(Ring& r) {
  close_ring(r);
  if (ring_area(r) < 0.0) std::reverse(r.begin(), r.end());
}

// Holes wind clockwise.
void normalize_hole(Ring& r) {
  close_ring(r);
  if (ring_area(r) > 0.0) std::reverse(r.begin(), r.end());
}

template <class BgRing>
Ring to_data_ring(const BgRing& in, const LocalFrame& frame) {
  Ring out;
  out.reserve(in.size() + 1);
  for (const auto& p : in) out.push_back(frame.to_data({p.x(), p.y()}));
  return out;
}

bool is_restricted(const LaneAttrs& a, const DeriveOptions& opt) {
  for (const auto& cls : opt.allowed_classes) if (a.allows(cls)) return true;
  return false;
}

std::size_t distinct_count(const std::vector<Vec2>& pts) {
  std::set<std::pair<double, double>> seen;
  for (const auto& p : pts) seen.emplace(p.x, p.y);
  return seen.size();
}

} // namespace

Bounds NetworkGeometry::bounds() const {
  Bounds b;
  for (const auto& l : lanes)     for (const auto& p : l.ring) b.extend(p);
  for (const auto& j : junctions) for (const auto& p : j.ring) b.extend(p);
  for (const auto& a : arrows)    for (const auto& p : a.head) b.extend(p);
  return b;
}

double ring_area(const Ring& ring) {
  double A = 0.0;
  for (std::size_t i = 0; i + 1 < ring.size(); ++i) {
    A += ring[i].x * ring[i+1].y - ring[i+1].x * ring[i].y;
  }
  return 0.5 * A;
}

double polygon_area(const Polygon& poly) {
  double a = std::abs(ring_area(poly.outer));
  for (const auto& h : poly.holes) a -= std::abs(ring_area(h));
  return a;
}

std::vector<Polygon> buffer_lane_parts(const std::vector<Vec2>& line, double half_width, bool geographic) {
  if (line.size() < 2 || !(half_width > 0.0)) return {};
  const LocalFrame frame = geographic ? LocalFrame::around(line.front()) : LocalFrame{};

  BgLine ls;
  ls.reserve(line.size());
  for (const auto& p : line) {
    const Vec2 q = frame.to_local(p);
    if (!ls.empty() && ls.back().x() == q.x && ls.back().y() == q.y) continue;
    ls.emplace_back(q.x, q.y);
  }
  if (ls.size() < 2) return {};

  bg::strategy::buffer::distance_symmetric<double> distance(half_width);
  bg::strategy::buffer::side_straight side;
  bg::strategy::buffer::join_miter join;
  bg::strategy::buffer::end_flat end;
  bg::strategy::buffer::point_square point;

  BgMulti buffered;
  bg::buffer(ls, buffered, distance, side, join, end, point);

  std::vector<Polygon> parts;
  parts.reserve(buffered.size());
  for (const auto& part : buffered) {
    Polygon poly;
    poly.outer = to_data_ring(part.outer(), frame);
    if (poly.outer.size() < 4) continue;
    normalize_ring(poly.outer);
    // A centerline that closes on itself leaves an inner ring.
    for (const auto& inner : part.inners()) {
      Ring hole = to_data_ring(inner, frame);
      if (hole.size() < 4) continue;
      normalize_hole(hole);
      poly.holes.push_back(std::move(hole));
    }
    parts.push_back(std::move(poly));
  }
  return parts;
}

Polygon largest_part(std::vector<Polygon> parts) {
  if (parts.empty()) return {};
  std::size_t best = 0;
  double best_area = polygon_area(parts[0]);
  for (std::size_t i = 1; i < parts.size(); ++i) {
    const double a = polygon_area(parts[i]);
    if (a > best_area) { best = i; best_area = a; }
  }
  if (parts.size() > 1) {
    spdlog::debug("buffer produced {} parts, kept part {}", parts.size(), best);
  }
  return std::move(parts[best]);
}

Polygon buffer_lane(const std::vector<Vec2>& line, double half_width, bool geographic) {
  return largest_part(buffer_lane_parts(line, half_width, geographic));
}

LanePolygon make_lane_polygon(const LaneAttrs& attrs, std::vector<Polygon> parts) {
  Polygon best = largest_part(std::move(parts));
  return LanePolygon{attrs, std::move(best.outer), std::move(best.holes)};
}

ArrowMarker make_arrow(const LaneAttrs& attrs, const std::vector<Vec2>& line, double size) {
  ArrowMarker m{};
  m.attrs = attrs;
  if (line.empty()) return m;

  const Vec2 end = line.back();
  // Direction from the last two distinct points; +x when the line has none.
  double ux = 1.0, uy = 0.0;
  for (std::size_t i = line.size() - 1; i-- > 0;) {
    const double dx = end.x - line[i].x;
    const double dy = end.y - line[i].y;
    const double len = std::hypot(dx, dy);
    if (len > 0.0) { ux = dx / len; uy = dy / len; break; }
  }
  const double px = -uy, py = ux;
  const double width = size * 0.6;
  const double stem  = size * 2.0;

  const Vec2 tip   {end.x - ux * size, end.y - uy * size};
  const Vec2 left  {tip.x - ux * size + px * width, tip.y - uy * size + py * width};
  const Vec2 right {tip.x - ux * size - px * width, tip.y - uy * size - py * width};

  m.head      = {tip, left, right, tip};
  m.stem_tip  = tip;
  m.stem_base = {tip.x - ux * stem, tip.y - uy * stem};
  return m;
}

NetworkGeometry derive_network_geometry(const RawNetwork& net, const DeriveOptions& opt) {
  NetworkGeometry g;
  std::size_t skipped = 0;
  std::size_t filtered = 0;

  for (const auto& lane : net.lanes) {
    if (!is_restricted(lane.attrs, opt)) {
      spdlog::debug("lane '{}': no allowed vehicle class, skipped", lane.attrs.id);
      ++filtered;
      continue;
    }
    if (lane.line.size() < 2) {
      spdlog::warn("lane '{}': centerline has {} point(s), skipped", lane.attrs.id, lane.line.size());
      ++skipped;
      continue;
    }

    LaneAttrs attrs = lane.attrs;
    if (!lane.has_width) {
      attrs.width = opt.default_width;
    } else if (!(attrs.width > 0.0) || !std::isfinite(attrs.width)) {
      spdlog::warn("lane '{}': invalid width {}, using {}", attrs.id, attrs.width, opt.default_width);
      attrs.width = opt.default_width;
    }

    LanePolygon poly = make_lane_polygon(attrs, buffer_lane_parts(lane.line, attrs.width * 0.5, opt.geographic));
    if (poly.ring.empty()) {
      spdlog::warn("lane '{}': degenerate centerline, no polygon", attrs.id);
      ++skipped;
    } else {
      g.lanes.push_back(std::move(poly));
    }
    g.arrows.push_back(make_arrow(attrs, lane.line, opt.arrow_size));
  }

  for (const auto& j : net.junctions) {
    if (distinct_count(j.points) <= 2) {
      spdlog::debug("junction '{}': fewer than 3 distinct points, skipped", j.id);
      continue;
    }
    Ring ring;
    ring.reserve(j.points.size() + 1);
    for (const auto& p : j.points) {
      if (!ring.empty() && ring.back() == p) continue;
      ring.push_back(p);
    }
    normalize_ring(ring);
    g.junctions.push_back(JunctionPolygon{j.id, std::move(ring)});
  }

  spdlog::info("derived network geometry: {} lanes, {} junctions, {} arrows "
               "({} skipped, {} without an allowed class)",
               g.lanes.size(), g.junctions.size(), g.arrows.size(), skipped, filtered);
  return g;
}

std::vector<std::array<Vec2, 3>> triangulate_polygon(const Polygon& poly) {
  using EarPoint = std::array<double, 2>;
  std::vector<std::vector<EarPoint>> rings;
  std::vector<Vec2> verts; // earcut indexes rings back to back

  auto add_ring = [&](const Ring& r) {
    const std::size_t n = (r.size() >= 2 && r.front() == r.back()) ? r.size() - 1 : r.size();
    if (n < 3) return false;
    std::vector<EarPoint> ring;
    ring.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
      ring.push_back({r[i].x, r[i].y});
      verts.push_back(r[i]);
    }
    rings.push_back(std::move(ring));
    return true;
  };

  std::vector<std::array<Vec2, 3>> tris;
  if (!add_ring(poly.outer)) return tris;
  for (const auto& h : poly.holes) add_ring(h);

  const std::vector<std::uint32_t> idx = mapbox::earcut<std::uint32_t>(rings);
  tris.reserve(idx.size() / 3);
  for (std::size_t i = 0; i + 2 < idx.size(); i += 3) {
    const Vec2& a = verts[idx[i]];
    const Vec2& b = verts[idx[i+1]];
    const Vec2& c = verts[idx[i+2]];
    // counter-clockwise, like the outer ring
    const double turn = (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
    if (turn < 0.0) tris.push_back({a, c, b});
    else            tris.push_back({a, b, c});
  }
  return tris;
}

} // namespace tripviz
