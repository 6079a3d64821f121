#pragma once
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <tripviz/layers.hpp>
#include <tripviz/network_geom.hpp>
#include <tripviz/render_adapter.hpp>
#include <tripviz/render_backend.hpp>

namespace tripviz {

struct ViewerConfig {
  std::string trips_with;      // dataset paths; empty = not loaded
  std::string trips_without;
  std::string network;
  ViewMode view_mode{ViewMode::Flat};
  Scenario scenario{Scenario::WithClosures};
  double speed{10.0};
  std::string log_level{"info"};
  AdapterOptions adapter{};
  DeriveOptions derive{};
};

// Unknown keys are ignored; invalid values keep their defaults (with a warning).
ViewerConfig viewer_config_from_json(const nlohmann::json& j);

// nullopt on unreadable input or a JSON syntax error.
std::optional<ViewerConfig> viewer_config_from_stream(std::istream& in);
std::optional<ViewerConfig> load_viewer_config(const std::string& path);

std::optional<ViewMode> parse_view_mode(const std::string& s);
std::optional<Scenario> parse_scenario(const std::string& s);

} // namespace tripviz
