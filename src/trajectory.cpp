#include <tripviz/trajectory.hpp>
#include <algorithm>
#include <cmath>

namespace tripviz {

static double lerp(double a, double b, double t) { return a + (b - a) * t; }

static std::optional<double> lerp_ratio(const std::optional<double>& a,
                                        const std::optional<double>& b,
                                        double t) {
  if (a && b) return lerp(*a, *b, t);
  if (a) return a;
  if (b) return b;
  return 0.0;
}

std::optional<Sample> sample_at(const Trajectory& traj, double t) {
  const auto& pts = traj.samples;
  if (pts.empty() || !std::isfinite(t)) return std::nullopt;

  const Sample& first = pts.front();
  const Sample& last  = pts.back();
  if (t < first.t || t > last.t) return std::nullopt;
  if (t == first.t) return first;
  if (t == last.t)  return last;

  // first.t < t < last.t, so the bracket is interior: p0.t <= t < p1.t
  auto it = std::upper_bound(pts.begin(), pts.end(), t,
                             [](double v, const Sample& s){ return v < s.t; });
  const std::size_t i1 = static_cast<std::size_t>(std::distance(pts.begin(), it));
  const std::size_t i0 = i1 - 1;

  const Sample& A = pts[i0];
  const Sample& B = pts[i1];
  const double dt = B.t - A.t;
  const double f  = dt > 0.0 ? (t - A.t) / dt : 0.0;

  Sample out{};
  out.lon       = lerp(A.lon, B.lon, f);
  out.lat       = lerp(A.lat, B.lat, f);
  out.t         = t;
  out.speed     = lerp(A.speed, B.speed, f);
  out.ratio     = lerp_ratio(A.ratio, B.ratio, f);
  out.angle_deg = lerp(A.angle_deg, B.angle_deg, f);
  return out;
}

TimeBounds time_bounds(const std::vector<Trajectory>& trips) {
  bool any = false;
  TimeBounds b{};
  for (const auto& tr : trips) {
    // Sorted per trajectory: only the ends matter
    if (tr.samples.empty()) continue;
    const double lo = tr.samples.front().t;
    const double hi = tr.samples.back().t;
    if (!any) { b = {lo, hi}; any = true; continue; }
    b.min_time = std::min(b.min_time, lo);
    b.max_time = std::max(b.max_time, hi);
  }
  return any ? b : kFallbackWindow;
}

} // namespace tripviz
