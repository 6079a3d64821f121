#pragma once
#include <optional>
#include <string>
#include <vector>

namespace tripviz {

// Single timestamped observation of one vehicle.
struct Sample {
  double lon{};
  double lat{};
  double t{};                    // seconds, dataset-relative
  double speed{};                // m/s
  std::optional<double> ratio{}; // speed / free-flow speed; absent -> 0 for coloring
  double angle_deg{};            // heading (degrees)

  bool operator==(const Sample&) const = default;
};

// Samples sorted ascending by t. May be empty.
struct Trajectory {
  std::string id;
  std::vector<Sample> samples;
};

struct TimeBounds {
  double min_time{};
  double max_time{};

  bool operator==(const TimeBounds&) const = default;
};

// Window used when no samples are loaded.
inline constexpr TimeBounds kFallbackWindow{0.0, 3600.0};

// Resample a trajectory at time t.
// - absent if the trajectory is empty or t lies outside [first.t, last.t]
// - exact first/last sample when t hits a boundary timestamp
// - otherwise linear interpolation between the bracketing pair
std::optional<Sample> sample_at(const Trajectory& traj, double t);

// Global [min, max] over every sample of every trajectory; kFallbackWindow if none.
TimeBounds time_bounds(const std::vector<Trajectory>& trips);

} // namespace tripviz
