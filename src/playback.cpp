#include <tripviz/playback.hpp>
#include <cmath>
#include <cstdio>
#include <limits>
#include <utility>
#include <spdlog/spdlog.h>

namespace tripviz {

PlaybackClock::PlaybackClock(TickSource& ticks, FrameCallback on_frame)
  : ticks_(ticks), on_frame_(std::move(on_frame)) {}

PlaybackClock::~PlaybackClock() { stop(); }

void PlaybackClock::start() {
  last_tick_s_.reset();
  scheduled_ = true;
  ticks_.start([this](double now_s){ on_tick_(now_s); });
}

void PlaybackClock::stop() {
  if (!scheduled_) return;
  scheduled_ = false;
  ticks_.stop();
  last_tick_s_.reset();
}

void PlaybackClock::play() {
  if (st_.playing) return;
  st_.playing = true;
  last_tick_s_.reset(); // first tick after resume advances by 0
}

void PlaybackClock::pause() {
  if (!st_.playing) return;
  st_.playing = false;
  last_tick_s_.reset();
}

bool PlaybackClock::set_speed(double speed) {
  if (!std::isfinite(speed) || speed <= 0.0) {
    spdlog::warn("playback: rejected speed {}", speed);
    return false;
  }
  st_.speed = speed;
  return true;
}

bool PlaybackClock::seek(double t) {
  if (!std::isfinite(t) || t < st_.min_time || t > st_.max_time) {
    spdlog::warn("playback: seek to {} outside [{}, {}]", t, st_.min_time, st_.max_time);
    return false;
  }
  st_.current_time = t;
  dirty_ = true;
  return true;
}

void PlaybackClock::set_bounds(TimeBounds b) {
  if (!(b.min_time <= b.max_time)) b = kFallbackWindow;
  st_.min_time = b.min_time;
  st_.max_time = b.max_time;
  st_.current_time = b.min_time;
  last_tick_s_.reset();
  dirty_ = true;
}

void PlaybackClock::on_tick_(double now_s) {
  if (!st_.playing) {
    last_tick_s_.reset();
    if (dirty_) {
      dirty_ = false;
      if (on_frame_) on_frame_(st_.current_time);
    }
    return;
  }

  // Advance first, then render.
  if (last_tick_s_) {
    const double delta = now_s - *last_tick_s_;
    if (delta > 0.0) {
      st_.current_time += delta * st_.speed;
      if (st_.current_time > st_.max_time) st_.current_time = st_.min_time;
    }
  }
  last_tick_s_ = now_s;
  dirty_ = false;
  if (on_frame_) on_frame_(st_.current_time);
}

std::string format_clock(double seconds) {
  if (seconds < 0.0 || !std::isfinite(seconds)) return "--";
  if (seconds >= static_cast<double>(std::numeric_limits<long long>::max())) return "--";
  const long long total = static_cast<long long>(seconds);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%lld:%02lld:%02lld",
                total / 3600, (total / 60) % 60, total % 60);
  return buf;
}

double next_speed_preset(double current) {
  for (double s : kSpeedPresets) if (s > current) return s;
  return kSpeedPresets.back();
}

double prev_speed_preset(double current) {
  for (auto it = kSpeedPresets.rbegin(); it != kSpeedPresets.rend(); ++it) {
    if (*it < current) return *it;
  }
  return kSpeedPresets.front();
}

} // namespace tripviz
