#include <tripviz/dataset.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <spdlog/spdlog.h>

namespace tripviz {

using nlohmann::json;

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::optional<double> finite_number(const json& v) {
  if (!v.is_number()) return std::nullopt;
  const double d = v.get<double>();
  if (!std::isfinite(d)) return std::nullopt;
  return d;
}

// Strings and numbers are both accepted as identifiers.
static std::optional<std::string> id_string(const json& v) {
  if (v.is_string()) return v.get<std::string>();
  if (v.is_number_integer() || v.is_number_unsigned()) return v.dump();
  return std::nullopt;
}

static std::optional<std::string> string_field(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) return std::nullopt;
  return it->get<std::string>();
}

// [lon, lat, t, speed?, ratio?, angle?]
static std::optional<Sample> parse_path_point(const json& e) {
  if (!e.is_array() || e.size() < 3) return std::nullopt;
  const auto lon = finite_number(e[0]);
  const auto lat = finite_number(e[1]);
  const auto t   = finite_number(e[2]);
  if (!lon || !lat || !t) return std::nullopt;

  Sample s{};
  s.lon = *lon;
  s.lat = *lat;
  s.t   = *t;
  if (e.size() > 3) s.speed     = finite_number(e[3]).value_or(0.0);
  if (e.size() > 4) s.ratio     = finite_number(e[4]);
  if (e.size() > 5) s.angle_deg = finite_number(e[5]).value_or(0.0);
  return s;
}

static std::optional<Trajectory> parse_trip(const json& jt, std::size_t index) {
  if (!jt.is_object()) {
    spdlog::warn("trip #{}: not an object, skipped", index);
    return std::nullopt;
  }
  auto id_it = jt.find("id");
  auto id = (id_it != jt.end()) ? id_string(*id_it) : std::nullopt;
  if (!id) {
    spdlog::warn("trip #{}: missing id, skipped", index);
    return std::nullopt;
  }
  auto path_it = jt.find("path");
  if (path_it == jt.end() || !path_it->is_array()) {
    spdlog::warn("trip '{}': missing path, skipped", *id);
    return std::nullopt;
  }

  Trajectory tr;
  tr.id = *id;
  tr.samples.reserve(path_it->size());
  std::size_t bad = 0;
  for (const auto& e : *path_it) {
    if (auto s = parse_path_point(e)) tr.samples.push_back(*s);
    else ++bad;
  }
  if (bad > 0) spdlog::warn("trip '{}': {} malformed point(s) skipped", tr.id, bad);

  auto by_time = [](const Sample& a, const Sample& b){ return a.t < b.t; };
  if (!std::is_sorted(tr.samples.begin(), tr.samples.end(), by_time)) {
    spdlog::warn("trip '{}': path not sorted by time, sorting", tr.id);
    std::stable_sort(tr.samples.begin(), tr.samples.end(), by_time);
  }
  return tr;
}

TripDataset trip_dataset_from_json(const json& j) {
  TripDataset ds;
  if (!j.is_object()) {
    spdlog::warn("trip dataset: top level is not an object");
    return ds;
  }

  if (auto it = j.find("trips"); it != j.end() && it->is_array()) {
    ds.trips.reserve(it->size());
    std::size_t index = 0;
    for (const auto& jt : *it) {
      if (auto tr = parse_trip(jt, index); tr.has_value()) ds.trips.push_back(std::move(*tr));
      ++index;
    }
  } else {
    spdlog::warn("trip dataset: no 'trips' array");
  }

  if (auto it = j.find("metadata"); it != j.end() && it->is_object()) {
    if (auto ce = it->find("closed_edges"); ce != it->end() && ce->is_array()) {
      for (const auto& e : *ce) {
        if (auto id = id_string(e)) ds.metadata.closed_edges.push_back(*id);
      }
    }
    if (auto ir = it->find("insertion_rate"); ir != it->end()) {
      ds.metadata.insertion_rate = finite_number(*ir);
    }
  }
  return ds;
}

std::optional<TripDataset> trip_dataset_from_stream(std::istream& in) {
  json j = json::parse(in, nullptr, /*allow_exceptions*/ false);
  if (j.is_discarded()) {
    spdlog::error("trip dataset: invalid JSON");
    return std::nullopt;
  }
  return trip_dataset_from_json(j);
}

std::optional<TripDataset> load_trip_dataset(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    spdlog::error("trip dataset: cannot open '{}'", path);
    return std::nullopt;
  }
  auto ds = trip_dataset_from_stream(f);
  if (ds) spdlog::info("loaded {} trips from '{}'", ds->trips.size(), path);
  return ds;
}

// ---- Network ----

static std::vector<std::string> parse_allow(const json& v) {
  std::vector<std::string> out;
  if (v.is_array()) {
    for (const auto& e : v) if (e.is_string()) out.push_back(trim(e.get<std::string>()));
  } else if (v.is_string()) {
    std::string cur;
    for (char c : v.get<std::string>()) {
      if (c == ',') { out.push_back(trim(cur)); cur.clear(); }
      else { cur.push_back(c); }
    }
    out.push_back(trim(cur));
  }
  out.erase(std::remove(out.begin(), out.end(), std::string{}), out.end());
  return out;
}

static std::optional<double> parse_width(const json& v) {
  if (auto d = finite_number(v)) return d;
  if (!v.is_string()) return std::nullopt;
  const std::string s = trim(v.get<std::string>());
  try {
    std::size_t idx = 0;
    const double d = std::stod(s, &idx);
    if (idx != s.size() || !std::isfinite(d)) return std::nullopt;
    return d;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static bool parse_positions(const json& coords, std::vector<Vec2>& out) {
  if (!coords.is_array()) return false;
  out.clear();
  out.reserve(coords.size());
  for (const auto& c : coords) {
    if (!c.is_array() || c.size() < 2) return false;
    const auto x = finite_number(c[0]);
    const auto y = finite_number(c[1]);
    if (!x || !y) return false;
    out.push_back({*x, *y});
  }
  return true;
}

static std::string feature_id(const json& props) {
  for (const char* key : {"id", "osm_id"}) {
    if (auto it = props.find(key); it != props.end()) {
      if (auto id = id_string(*it)) return *id;
    }
  }
  return {};
}

std::optional<RawNetwork> raw_network_from_json(const json& j) {
  if (!j.is_object() || string_field(j, "type") != "FeatureCollection") {
    spdlog::error("network: not a GeoJSON FeatureCollection");
    return std::nullopt;
  }
  auto feats = j.find("features");
  if (feats == j.end() || !feats->is_array()) {
    spdlog::error("network: missing 'features' array");
    return std::nullopt;
  }

  RawNetwork net;
  std::size_t skipped = 0;
  for (const auto& f : *feats) {
    if (!f.is_object()) { ++skipped; continue; }
    auto props_it = f.find("properties");
    auto geom_it  = f.find("geometry");
    if (props_it == f.end() || !props_it->is_object() ||
        geom_it == f.end() || !geom_it->is_object()) {
      ++skipped;
      continue;
    }
    const json& props = *props_it;
    const json& geom  = *geom_it;
    const auto element = string_field(props, "element").value_or("");
    const auto gtype   = string_field(geom, "type").value_or("");
    const std::string id = feature_id(props);
    auto coords = geom.find("coordinates");
    if (coords == geom.end()) {
      spdlog::warn("network feature '{}': no coordinates, skipped", id);
      ++skipped;
      continue;
    }

    if (element == "lane") {
      if (gtype != "LineString") {
        spdlog::warn("lane '{}': geometry type '{}' is not LineString, skipped", id, gtype);
        ++skipped;
        continue;
      }
      RawLane lane;
      if (!parse_positions(*coords, lane.line)) {
        spdlog::warn("lane '{}': malformed coordinates, skipped", id);
        ++skipped;
        continue;
      }
      lane.attrs.id = id;
      if (auto it = props.find("allow"); it != props.end()) lane.attrs.allow = parse_allow(*it);
      if (auto it = props.find("width"); it != props.end()) {
        if (auto w = parse_width(*it)) { lane.attrs.width = *w; lane.has_width = true; }
      }
      if (auto it = props.find("tunnel"); it != props.end()) {
        lane.attrs.tunnel = (it->is_boolean() && it->get<bool>()) ||
                            (it->is_string() && it->get<std::string>() == "yes");
      }
      net.lanes.push_back(std::move(lane));
    } else if (element == "junction") {
      RawJunction jn;
      jn.id = id;
      const bool ok = (gtype == "Polygon")
        ? (coords->is_array() && !coords->empty() && parse_positions((*coords)[0], jn.points))
        : parse_positions(*coords, jn.points);
      if (!ok) {
        spdlog::warn("junction '{}': malformed coordinates, skipped", id);
        ++skipped;
        continue;
      }
      net.junctions.push_back(std::move(jn));
    }
  }

  spdlog::info("network: {} lanes, {} junctions ({} features skipped)",
               net.lanes.size(), net.junctions.size(), skipped);
  return net;
}

std::optional<RawNetwork> raw_network_from_stream(std::istream& in) {
  json j = json::parse(in, nullptr, /*allow_exceptions*/ false);
  if (j.is_discarded()) {
    spdlog::error("network: invalid JSON");
    return std::nullopt;
  }
  return raw_network_from_json(j);
}

std::optional<RawNetwork> load_raw_network(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    spdlog::error("network: cannot open '{}'", path);
    return std::nullopt;
  }
  return raw_network_from_stream(f);
}

} // namespace tripviz
