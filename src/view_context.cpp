#include <tripviz/view_context.hpp>
#include <utility>
#include <spdlog/spdlog.h>

namespace tripviz {

void ViewContext::set_network(std::shared_ptr<const RawNetwork> net) {
  if (net == network_) return; // same dataset: keep the cached geometry
  network_ = std::move(net);
  if (!network_) {
    geometry_.reset();
    return;
  }
  geometry_ = std::make_shared<const NetworkGeometry>(derive_network_geometry(*network_, derive_));
}

void ViewContext::set_trips(Scenario s, std::shared_ptr<const TripDataset> ds) {
  if (s == Scenario::WithClosures && ds) {
    closed_ = ClosedEdgeSet(ds->metadata.closed_edges.begin(), ds->metadata.closed_edges.end());
    spdlog::info("scenario '{}': {} closed edge(s)", scenario_name(s), closed_.size());
  } else if (s == Scenario::WithClosures) {
    closed_.clear();
  }
  (s == Scenario::WithClosures ? trips_with_ : trips_without_) = std::move(ds);
}

const std::shared_ptr<const TripDataset>& ViewContext::trips(Scenario s) const {
  return s == Scenario::WithClosures ? trips_with_ : trips_without_;
}

const std::vector<Trajectory>& ViewContext::active_trips() const {
  static const std::vector<Trajectory> kNone;
  const auto& ds = trips(scenario_);
  return ds ? ds->trips : kNone;
}

} // namespace tripviz
