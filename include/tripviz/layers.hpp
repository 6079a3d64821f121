#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>
#include <tripviz/color.hpp>
#include <tripviz/network_geom.hpp>
#include <tripviz/trajectory.hpp>

namespace tripviz {

enum class Scenario { WithClosures, WithoutClosures };

const char* scenario_name(Scenario s);

// Road-segment ids closed in a scenario. Styling only.
using ClosedEdgeSet = std::unordered_set<std::string>;

// Layer ids, in draw order.
inline constexpr const char* kJunctionLayerId = "network-junctions";
inline constexpr const char* kLaneLayerId     = "network-lanes";
inline constexpr const char* kArrowLayerId    = "network-arrows";
inline constexpr const char* kVehicleLayerId  = "vehicles";

struct PolygonShape {
  Ring ring;
  std::vector<Ring> holes;
  Rgba fill{};
  Rgba line{};
  std::string source_id;

  bool operator==(const PolygonShape&) const = default;
};

struct LineShape {
  std::vector<Vec2> points;
  Rgba color{};

  bool operator==(const LineShape&) const = default;
};

struct VehicleMarker {
  std::string id;
  Vec2 position{};
  double angle_deg{};
  double speed{};
  Rgba color{};
  std::uint32_t model_variant{}; // only the perspective backend uses it

  bool operator==(const VehicleMarker&) const = default;
};

// Backend-neutral drawable bundle: geometry with its resolved style.
struct Layer {
  std::string id;
  std::vector<PolygonShape> polygons;
  std::vector<LineShape> lines;
  std::vector<VehicleMarker> markers;

  bool operator==(const Layer&) const = default;
};

using LayerSet = std::vector<Layer>;

// SUMO lane ids are "<edge>_<index>".
std::string_view edge_id_of_lane(std::string_view lane_id);
bool lane_is_closed(const LaneAttrs& lane, const ClosedEdgeSet& closed);

struct NetworkStyle {
  Scenario scenario{Scenario::WithClosures};
  std::string selected_id;
  std::string hovered_id;
};

// [junctions, lanes, arrows]. Closed-lane coloring applies to WithClosures only.
LayerSet build_network_layers(const NetworkGeometry& geom,
                              const ClosedEdgeSet& closed,
                              const NetworkStyle& style);

// Deterministic model choice keyed by trip id (seeded FNV-1a), in [0, variants).
std::uint32_t model_variant_for(std::string_view trip_id, std::uint32_t seed, std::uint32_t variants);

struct VehicleStyle {
  std::uint32_t variant_seed{0};
  std::uint32_t variant_count{3};
};

// One marker per trajectory that has a sample at t.
Layer build_vehicle_layer(const std::vector<Trajectory>& trips, double t, const VehicleStyle& style);

} // namespace tripviz
