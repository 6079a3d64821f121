#pragma once
#include <array>
#include <functional>
#include <optional>
#include <string>
#include <tripviz/tick_source.hpp>
#include <tripviz/trajectory.hpp>

namespace tripviz {

// Speeds offered by the UI. set_speed() accepts any positive value.
inline constexpr std::array<double, 8> kSpeedPresets{0.5, 1.0, 2.0, 5.0, 10.0, 20.0, 30.0, 60.0};

struct PlaybackState {
  double current_time{kFallbackWindow.min_time};
  double min_time{kFallbackWindow.min_time};
  double max_time{kFallbackWindow.max_time};
  bool playing{false};
  double speed{1.0};
};

// Frame-rate independent playback clock driven by a TickSource.
// Time advances by measured wall-clock deltas scaled by speed and loops
// from max_time back to min_time.
class PlaybackClock {
public:
  using FrameCallback = std::function<void(double time)>;

  PlaybackClock(TickSource& ticks, FrameCallback on_frame);
  ~PlaybackClock();
  PlaybackClock(const PlaybackClock&) = delete;
  PlaybackClock& operator=(const PlaybackClock&) = delete;

  // Tick scheduling (independent of play/pause)
  void start();
  void stop();
  bool scheduled() const { return scheduled_ && ticks_.running(); }

  void play();
  void pause();
  void toggle() { st_.playing ? pause() : play(); }

  // Any finite positive multiplier; false (no change) otherwise.
  bool set_speed(double speed);
  // Manual scrub inside [min_time, max_time]; false (no change) otherwise.
  bool seek(double t);
  // New dataset bounds; time snaps to the new minimum.
  void set_bounds(TimeBounds b);
  // Re-render once on the next tick without touching run/pause state.
  void request_render() { dirty_ = true; }

  const PlaybackState& state() const { return st_; }
  double time() const { return st_.current_time; }

private:
  void on_tick_(double now_s);

  TickSource& ticks_;
  FrameCallback on_frame_;
  PlaybackState st_{};
  std::optional<double> last_tick_s_{};
  bool dirty_{false};
  bool scheduled_{false};
};

// "H:MM:SS" for the HUD; "--" for negative or non-finite input.
std::string format_clock(double seconds);

// Next preset above/below the current speed (clamped to the preset range).
double next_speed_preset(double current);
double prev_speed_preset(double current);

} // namespace tripviz
