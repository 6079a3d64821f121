#pragma once
#include <cstdint>
#include <string>

namespace tripviz {

struct LaneAttrs;

struct Rgba {
  std::uint8_t r{};
  std::uint8_t g{};
  std::uint8_t b{};
  std::uint8_t a{255};

  bool operator==(const Rgba&) const = default;
};

// Vehicle gradient stops (congested -> free-flowing), fixed alpha.
inline constexpr std::uint8_t kVehicleAlpha = 230;
inline constexpr Rgba kCongestedStop{220,  40, 40, kVehicleAlpha};
inline constexpr Rgba kMidStop      {250, 200, 40, kVehicleAlpha};
inline constexpr Rgba kFreeFlowStop { 40, 190, 90, kVehicleAlpha};

// Map a speed ratio to a color. Ratio is clamped to [0,1]; NaN counts as 0.
Rgba color_for_ratio(double ratio);

// Lane styling inputs that do not live on the lane itself.
struct LaneStyleState {
  std::string selected_id;
  std::string hovered_id;
  bool closed{false};
};

Rgba lane_fill_color(const LaneAttrs& lane, const LaneStyleState& st);
Rgba lane_line_color(const LaneAttrs& lane, const LaneStyleState& st);

} // namespace tripviz
