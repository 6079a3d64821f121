#pragma once
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <tripviz/dataset.hpp>
#include <tripviz/layers.hpp>
#include <tripviz/network_geom.hpp>

namespace tripviz {

// Explicitly passed store of everything a view renders from. Readers (the
// render adapter) take it by const reference; only the owning view writes.
class ViewContext {
public:
  explicit ViewContext(DeriveOptions derive = {}) : derive_(std::move(derive)) {}

  // Geometry is derived once per network identity and shared read-only.
  void set_network(std::shared_ptr<const RawNetwork> net);
  const std::shared_ptr<const RawNetwork>& network() const { return network_; }
  const NetworkGeometry* geometry() const { return geometry_.get(); }
  std::shared_ptr<const NetworkGeometry> shared_geometry() const { return geometry_; }

  // Loading a WithClosures dataset adopts its metadata.closed_edges.
  void set_trips(Scenario s, std::shared_ptr<const TripDataset> ds);
  const std::shared_ptr<const TripDataset>& trips(Scenario s) const;

  void set_scenario(Scenario s) { scenario_ = s; }
  Scenario scenario() const { return scenario_; }

  // Trips of the displayed scenario; empty when none are loaded.
  const std::vector<Trajectory>& active_trips() const;
  TimeBounds active_time_bounds() const { return time_bounds(active_trips()); }

  void set_closed_edges(ClosedEdgeSet closed) { closed_ = std::move(closed); }
  const ClosedEdgeSet& closed_edges() const { return closed_; }

  void set_selected_lane(std::string id) { selected_lane_ = std::move(id); }
  const std::string& selected_lane() const { return selected_lane_; }
  void set_hovered_lane(std::string id) { hovered_lane_ = std::move(id); }
  const std::string& hovered_lane() const { return hovered_lane_; }

  const DeriveOptions& derive_options() const { return derive_; }

private:
  DeriveOptions derive_;
  std::shared_ptr<const RawNetwork> network_;
  std::shared_ptr<const NetworkGeometry> geometry_;
  std::shared_ptr<const TripDataset> trips_with_;
  std::shared_ptr<const TripDataset> trips_without_;
  Scenario scenario_{Scenario::WithClosures};
  ClosedEdgeSet closed_;
  std::string selected_lane_;
  std::string hovered_lane_;
};

} // namespace tripviz
