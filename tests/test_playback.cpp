#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <limits>
#include <vector>

#include <tripviz/playback.hpp>
#include <tripviz/tick_source.hpp>

using Catch::Approx;
using namespace tripviz;

namespace {

struct ClockFixture {
  FrameTickSource ticks;
  std::vector<double> frames;
  PlaybackClock clock{ticks, [this](double t){ frames.push_back(t); }};

  ClockFixture() {
    clock.set_bounds({0.0, 100.0});
    clock.start();
  }
};

} // namespace

TEST_CASE("Clock advances by wall delta times speed") {
  ClockFixture f;
  REQUIRE(f.clock.set_speed(2.0));
  f.clock.play();

  f.ticks.pump(10.0); // first tick after play: no advance
  REQUIRE(f.clock.time() == Approx(0.0));
  f.ticks.pump(11.0);
  REQUIRE(f.clock.time() == Approx(2.0));
  f.ticks.pump(12.5);
  REQUIRE(f.clock.time() == Approx(5.0));
  REQUIRE(f.frames.size() == 3);
  REQUIRE(f.frames.back() == Approx(5.0));
}

TEST_CASE("Clock advance is frame-rate independent") {
  ClockFixture a, b;
  a.clock.set_speed(5.0);
  b.clock.set_speed(5.0);
  a.clock.play();
  b.clock.play();

  // same 4 s of wall time at 10 fps and 60 fps
  for (int i = 0; i <= 40; ++i) a.ticks.pump(i / 10.0);
  for (int i = 0; i <= 240; ++i) b.ticks.pump(i / 60.0);
  REQUIRE(a.clock.time() == Approx(20.0));
  REQUIRE(b.clock.time() == Approx(20.0));
}

TEST_CASE("Clock wraps to the start after max_time") {
  ClockFixture f;
  f.clock.set_speed(60.0);
  f.clock.play();
  f.ticks.pump(0.0);
  f.ticks.pump(1.0);
  REQUIRE(f.clock.time() == Approx(60.0));
  f.ticks.pump(2.0); // 120 > 100
  REQUIRE(f.clock.time() == Approx(0.0));
  f.ticks.pump(2.5);
  REQUIRE(f.clock.time() == Approx(30.0));
}

TEST_CASE("Paused clock holds time and renders only when dirty") {
  ClockFixture f;
  f.ticks.pump(0.0); // bounds were just set: one render
  REQUIRE(f.frames.size() == 1);
  f.ticks.pump(1.0);
  f.ticks.pump(2.0);
  REQUIRE(f.frames.size() == 1);
  REQUIRE(f.clock.time() == Approx(0.0));

  REQUIRE(f.clock.seek(42.0));
  f.ticks.pump(3.0);
  f.ticks.pump(4.0);
  REQUIRE(f.frames.size() == 2);
  REQUIRE(f.frames.back() == Approx(42.0));

  f.clock.request_render();
  f.ticks.pump(5.0);
  REQUIRE(f.frames.size() == 3);
}

TEST_CASE("Resume does not jump over the paused interval") {
  ClockFixture f;
  f.clock.play();
  f.ticks.pump(0.0);
  f.ticks.pump(1.0);
  REQUIRE(f.clock.time() == Approx(1.0));
  f.clock.pause();
  f.ticks.pump(50.0);
  f.clock.play();
  f.ticks.pump(60.0);
  REQUIRE(f.clock.time() == Approx(1.0));
  f.ticks.pump(61.0);
  REQUIRE(f.clock.time() == Approx(2.0));
}

TEST_CASE("Invalid speed and out-of-range seek are rejected") {
  ClockFixture f;
  REQUIRE(f.clock.set_speed(10.0));
  REQUIRE_FALSE(f.clock.set_speed(0.0));
  REQUIRE_FALSE(f.clock.set_speed(-1.0));
  REQUIRE_FALSE(f.clock.set_speed(std::numeric_limits<double>::infinity()));
  REQUIRE(f.clock.state().speed == Approx(10.0));

  REQUIRE(f.clock.seek(100.0));
  REQUIRE_FALSE(f.clock.seek(100.5));
  REQUIRE_FALSE(f.clock.seek(-1.0));
  REQUIRE(f.clock.time() == Approx(100.0));
}

TEST_CASE("New bounds snap time to the minimum") {
  ClockFixture f;
  f.clock.seek(50.0);
  f.clock.set_bounds({200.0, 300.0});
  REQUIRE(f.clock.time() == Approx(200.0));
  REQUIRE(f.clock.state().min_time == Approx(200.0));

  f.clock.set_bounds({5.0, 1.0});
  REQUIRE(f.clock.state().min_time == Approx(kFallbackWindow.min_time));
  REQUIRE(f.clock.state().max_time == Approx(kFallbackWindow.max_time));
}

TEST_CASE("Stopped clock receives no ticks") {
  ClockFixture f;
  f.clock.play();
  REQUIRE(f.clock.scheduled());
  f.clock.stop();
  REQUIRE_FALSE(f.clock.scheduled());
  REQUIRE_FALSE(f.ticks.pump(1.0));
  REQUIRE(f.frames.empty());
  REQUIRE(f.clock.state().playing);

  f.clock.start();
  REQUIRE(f.ticks.pump(2.0));
  REQUIRE(f.frames.size() == 1);
}

TEST_CASE("format_clock renders H:MM:SS") {
  REQUIRE(format_clock(0.0) == "0:00:00");
  REQUIRE(format_clock(59.9) == "0:00:59");
  REQUIRE(format_clock(3723.0) == "1:02:03");
  REQUIRE(format_clock(-1.0) == "--");
  REQUIRE(format_clock(std::numeric_limits<double>::quiet_NaN()) == "--");
  REQUIRE(format_clock(1e19) == "--");
  REQUIRE(format_clock(std::numeric_limits<double>::infinity()) == "--");
}

TEST_CASE("Speed presets step up and down") {
  REQUIRE(next_speed_preset(1.0) == Approx(2.0));
  REQUIRE(next_speed_preset(3.0) == Approx(5.0));
  REQUIRE(next_speed_preset(60.0) == Approx(60.0));
  REQUIRE(prev_speed_preset(10.0) == Approx(5.0));
  REQUIRE(prev_speed_preset(0.5) == Approx(0.5));
}
