#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <tripviz/network.hpp>
#include <tripviz/trajectory.hpp>

namespace tripviz {

struct TripMetadata {
  std::vector<std::string> closed_edges;
  std::optional<double> insertion_rate;
};

struct TripDataset {
  std::vector<Trajectory> trips;
  TripMetadata metadata;
};

// Trips JSON: { trips: [{id, path: [[lon, lat, t, speed?, ratio?, angle?], ...]}], metadata: {...} }
// Bad points and bad trips are skipped with a warning; paths are sorted by t.
TripDataset trip_dataset_from_json(const nlohmann::json& j);

// Stream/file wrappers; nullopt on unreadable input or a JSON syntax error.
std::optional<TripDataset> trip_dataset_from_stream(std::istream& in);
std::optional<TripDataset> load_trip_dataset(const std::string& path);

// GeoJSON FeatureCollection with properties.element "lane" / "junction".
// nullopt if the document is not a FeatureCollection.
std::optional<RawNetwork> raw_network_from_json(const nlohmann::json& j);
std::optional<RawNetwork> raw_network_from_stream(std::istream& in);
std::optional<RawNetwork> load_raw_network(const std::string& path);

} // namespace tripviz
