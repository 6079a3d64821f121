#include <tripviz/layers.hpp>
#include <utility>

namespace tripviz {

namespace {

const Rgba kJunctionFill{60, 60, 60, 255};
const Rgba kMarkingColor{255, 255, 255, 255};

} // namespace

const char* scenario_name(Scenario s) {
  switch (s) {
    case Scenario::WithClosures:    return "with";
    case Scenario::WithoutClosures: return "without";
  }
  return "unknown";
}

std::string_view edge_id_of_lane(std::string_view lane_id) {
  const auto pos = lane_id.rfind('_');
  if (pos == std::string_view::npos || pos + 1 >= lane_id.size()) return lane_id;
  for (std::size_t i = pos + 1; i < lane_id.size(); ++i) {
    if (lane_id[i] < '0' || lane_id[i] > '9') return lane_id;
  }
  return lane_id.substr(0, pos);
}

bool lane_is_closed(const LaneAttrs& lane, const ClosedEdgeSet& closed) {
  if (closed.empty() || lane.id.empty()) return false;
  if (closed.count(lane.id)) return true;
  return closed.count(std::string(edge_id_of_lane(lane.id))) > 0;
}

LayerSet build_network_layers(const NetworkGeometry& geom,
                              const ClosedEdgeSet& closed,
                              const NetworkStyle& style) {
  Layer junctions{kJunctionLayerId, {}, {}, {}};
  junctions.polygons.reserve(geom.junctions.size());
  for (const auto& j : geom.junctions) {
    junctions.polygons.push_back(PolygonShape{j.ring, {}, kJunctionFill, Rgba{0, 0, 0, 0}, j.id});
  }

  const bool show_closures = style.scenario == Scenario::WithClosures;
  Layer lanes{kLaneLayerId, {}, {}, {}};
  lanes.polygons.reserve(geom.lanes.size());
  for (const auto& l : geom.lanes) {
    LaneStyleState st{style.selected_id, style.hovered_id,
                      show_closures && lane_is_closed(l.attrs, closed)};
    lanes.polygons.push_back(PolygonShape{l.ring, l.holes,
                                          lane_fill_color(l.attrs, st),
                                          lane_line_color(l.attrs, st),
                                          l.attrs.id});
  }

  // Arrowheads are filled, stems are stroked.
  Layer arrows{kArrowLayerId, {}, {}, {}};
  arrows.polygons.reserve(geom.arrows.size());
  arrows.lines.reserve(geom.arrows.size());
  for (const auto& a : geom.arrows) {
    arrows.polygons.push_back(PolygonShape{a.head, {}, kMarkingColor, Rgba{0, 0, 0, 0}, a.attrs.id});
    arrows.lines.push_back(LineShape{{a.stem_base, a.stem_tip}, kMarkingColor});
  }

  LayerSet out;
  out.reserve(3);
  out.push_back(std::move(junctions));
  out.push_back(std::move(lanes));
  out.push_back(std::move(arrows));
  return out;
}

std::uint32_t model_variant_for(std::string_view trip_id, std::uint32_t seed, std::uint32_t variants) {
  if (variants == 0) return 0;
  std::uint32_t h = 2166136261u ^ seed;
  for (unsigned char c : trip_id) {
    h ^= c;
    h *= 16777619u;
  }
  return h % variants;
}

Layer build_vehicle_layer(const std::vector<Trajectory>& trips, double t, const VehicleStyle& style) {
  Layer layer{kVehicleLayerId, {}, {}, {}};
  for (const auto& tr : trips) {
    const auto s = sample_at(tr, t);
    if (!s) continue; // not born yet or already arrived
    VehicleMarker m{};
    m.id = tr.id;
    m.position = {s->lon, s->lat};
    m.angle_deg = s->angle_deg;
    m.speed = s->speed;
    m.color = color_for_ratio(s->ratio.value_or(0.0));
    m.model_variant = model_variant_for(tr.id, style.variant_seed, style.variant_count);
    layer.markers.push_back(std::move(m));
  }
  return layer;
}

} // namespace tripviz
