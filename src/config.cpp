#include <tripviz/config.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <fstream>
#include <spdlog/spdlog.h>

namespace tripviz {

using nlohmann::json;

namespace {

void read_string(const json& j, const char* key, std::string& out) {
  auto it = j.find(key);
  if (it == j.end()) return;
  if (it->is_string()) out = it->get<std::string>();
  else spdlog::warn("config: '{}' must be a string", key);
}

template <class Pred>
void read_number(const json& j, const char* key, double& out, Pred ok) {
  auto it = j.find(key);
  if (it == j.end()) return;
  if (it->is_number() && std::isfinite(it->get<double>()) && ok(it->get<double>())) {
    out = it->get<double>();
  } else {
    spdlog::warn("config: invalid value for '{}', keeping {}", key, out);
  }
}

void read_uint(const json& j, const char* key, std::uint32_t& out) {
  auto it = j.find(key);
  if (it == j.end()) return;
  const bool non_negative =
      it->is_number_unsigned() || (it->is_number_integer() && it->get<long long>() >= 0);
  if (non_negative && it->get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
    spdlog::warn("config: '{}' exceeds {}", key, std::numeric_limits<std::uint32_t>::max());
  } else if (non_negative) {
    out = it->get<std::uint32_t>();
  } else {
    spdlog::warn("config: '{}' must be a non-negative integer", key);
  }
}

bool positive(double v) { return v > 0.0; }

} // namespace

std::optional<ViewMode> parse_view_mode(const std::string& s) {
  if (s == "flat" || s == "2d") return ViewMode::Flat;
  if (s == "perspective" || s == "3d") return ViewMode::Perspective;
  return std::nullopt;
}

std::optional<Scenario> parse_scenario(const std::string& s) {
  if (s == "with") return Scenario::WithClosures;
  if (s == "without") return Scenario::WithoutClosures;
  return std::nullopt;
}

ViewerConfig viewer_config_from_json(const json& j) {
  ViewerConfig cfg;
  if (!j.is_object()) {
    spdlog::warn("config: top level is not an object, using defaults");
    return cfg;
  }

  read_string(j, "trips_with", cfg.trips_with);
  read_string(j, "trips_without", cfg.trips_without);
  read_string(j, "network", cfg.network);
  read_string(j, "log_level", cfg.log_level);
  read_number(j, "speed", cfg.speed, positive);

  std::string mode;
  read_string(j, "view_mode", mode);
  if (!mode.empty()) {
    if (auto m = parse_view_mode(mode)) cfg.view_mode = *m;
    else spdlog::warn("config: unknown view_mode '{}'", mode);
  }
  std::string scenario;
  read_string(j, "scenario", scenario);
  if (!scenario.empty()) {
    if (auto s = parse_scenario(scenario)) cfg.scenario = *s;
    else spdlog::warn("config: unknown scenario '{}'", scenario);
  }

  if (auto it = j.find("fallback_center"); it != j.end()) {
    if (it->is_array() && it->size() == 2 && (*it)[0].is_number() && (*it)[1].is_number()) {
      cfg.adapter.fallback_center = {(*it)[0].get<double>(), (*it)[1].get<double>()};
    } else {
      spdlog::warn("config: 'fallback_center' must be [lon, lat]");
    }
  }
  read_number(j, "default_zoom", cfg.adapter.default_zoom, positive);
  read_number(j, "perspective_pitch", cfg.adapter.perspective_pitch_deg,
              [](double v){ return v >= 0.0 && v < 90.0; });
  read_uint(j, "variant_seed", cfg.adapter.vehicles.variant_seed);
  read_uint(j, "variant_count", cfg.adapter.vehicles.variant_count);

  if (auto it = j.find("derive"); it != j.end() && it->is_object()) {
    const json& d = *it;
    read_number(d, "default_width", cfg.derive.default_width, positive);
    read_number(d, "arrow_size", cfg.derive.arrow_size, positive);
    if (auto g = d.find("geographic"); g != d.end()) {
      if (g->is_boolean()) cfg.derive.geographic = g->get<bool>();
      else spdlog::warn("config: 'derive.geographic' must be a boolean");
    }
    if (auto a = d.find("allowed_classes"); a != d.end() && a->is_array()) {
      cfg.derive.allowed_classes.clear();
      for (const auto& e : *a) if (e.is_string()) cfg.derive.allowed_classes.push_back(e.get<std::string>());
    }
  }
  return cfg;
}

std::optional<ViewerConfig> viewer_config_from_stream(std::istream& in) {
  json j = json::parse(in, nullptr, /*allow_exceptions*/ false);
  if (j.is_discarded()) {
    spdlog::error("config: invalid JSON");
    return std::nullopt;
  }
  return viewer_config_from_json(j);
}

std::optional<ViewerConfig> load_viewer_config(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    spdlog::error("config: cannot open '{}'", path);
    return std::nullopt;
  }
  return viewer_config_from_stream(f);
}

} // namespace tripviz
