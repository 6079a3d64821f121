#include <tripviz/color.hpp>
#include <tripviz/network.hpp>
#include <algorithm>
#include <cmath>

namespace tripviz {

static std::uint8_t lerp_channel(std::uint8_t a, std::uint8_t b, double t) {
  const double v = double(a) + (double(b) - double(a)) * t;
  return static_cast<std::uint8_t>(std::lround(std::clamp(v, 0.0, 255.0)));
}

Rgba color_for_ratio(double ratio) {
  if (!(ratio >= 0.0)) ratio = 0.0; // NaN and negatives
  if (ratio > 1.0) ratio = 1.0;

  static constexpr Rgba kStops[3] = {kCongestedStop, kMidStop, kFreeFlowStop};
  const double scaled = ratio * 2.0;
  const int seg = std::min(static_cast<int>(std::floor(scaled)), 1);
  const double t = scaled - double(seg);

  const Rgba& a = kStops[seg];
  const Rgba& b = kStops[seg + 1];
  return Rgba{lerp_channel(a.r, b.r, t),
              lerp_channel(a.g, b.g, t),
              lerp_channel(a.b, b.b, t),
              kVehicleAlpha};
}

Rgba lane_fill_color(const LaneAttrs& lane, const LaneStyleState& st) {
  if (!st.selected_id.empty() && lane.id == st.selected_id) return {255, 106, 0, 255};
  if (st.closed) return {255, 0, 0, 255};
  if (lane.tunnel) return {0, 0, 255, 255};
  const bool bus = lane.allows("bus");
  const bool priv = lane.allows("private");
  if (bus && !priv) return {255, 255, 0, 255};
  if (priv) return {150, 150, 150, 255};
  return {0, 0, 0, 255};
}

Rgba lane_line_color(const LaneAttrs& lane, const LaneStyleState& st) {
  if (!st.hovered_id.empty() && lane.id == st.hovered_id) return {0, 255, 255, 255};
  return {0, 0, 0, 50};
}

} // namespace tripviz
