#include <raylib.h>
#include <algorithm>
#include <memory>
#include <utility>
#include <spdlog/spdlog.h>

#include <tripviz/viewer/app.hpp>
#include <tripviz/viewer/raylib_backends.hpp>
#include <tripviz/dataset.hpp>

namespace tripviz {

namespace {

// Manual scrub step for Left/Right (simulation seconds)
constexpr double kSeekStepS = 10.0;

// --- HUD layout (keep in sync with draw_hud_) ---
constexpr int kHudLine1Y = 20;  // size 20
constexpr int kHudLine2Y = 46;  // size 18
constexpr int kHudHelpPad = 28; // from the bottom edge

ViewMode other_mode(ViewMode m) {
  return m == ViewMode::Flat ? ViewMode::Perspective : ViewMode::Flat;
}

Scenario other_scenario(Scenario s) {
  return s == Scenario::WithClosures ? Scenario::WithoutClosures : Scenario::WithClosures;
}

} // namespace

ViewerApp::ViewerApp(ViewerConfig cfg)
  : cfg_(std::move(cfg)),
    ctx_(cfg_.derive),
    view_(ctx_, ticks_, make_raylib_backend, cfg_.adapter) {}

bool ViewerApp::load_data_() {
  bool any = false;
  if (!cfg_.network.empty()) {
    if (auto net = load_raw_network(cfg_.network)) {
      view_.set_network(std::make_shared<const RawNetwork>(std::move(*net)));
      any = true;
    }
  }
  const std::pair<Scenario, const std::string*> trip_files[] = {
    {Scenario::WithClosures, &cfg_.trips_with},
    {Scenario::WithoutClosures, &cfg_.trips_without},
  };
  for (const auto& [scenario, path] : trip_files) {
    if (path->empty()) continue;
    if (auto ds = load_trip_dataset(*path)) {
      view_.set_trips(scenario, std::make_shared<const TripDataset>(std::move(*ds)));
      any = true;
    }
  }
  view_.set_scenario(cfg_.scenario);
  return any;
}

int ViewerApp::run() {
  if (!load_data_()) spdlog::warn("no dataset loaded, showing an empty map");

  const int W = 1280, H = 800;
  SetConfigFlags(FLAG_MSAA_4X_HINT | FLAG_WINDOW_RESIZABLE);
  InitWindow(W, H, "tripviz");
  SetTargetFPS(60);

  // Backends need the window; retry the other mode before giving up.
  if (!view_.set_view_mode(cfg_.view_mode) && !view_.set_view_mode(other_mode(cfg_.view_mode))) {
    spdlog::error("no rendering backend could be constructed");
    CloseWindow();
    return 1;
  }
  if (!view_.clock().set_speed(cfg_.speed)) view_.clock().set_speed(1.0);
  view_.clock().play();

  while (!WindowShouldClose()) {
    process_input_();
    ticks_.pump(GetTime());

    BeginDrawing();
    ClearBackground(Color{235, 235, 228, 255});
    view_.adapter().present();
    draw_hud_();
    EndDrawing();
  }

  // Backend resources go before the GL context does.
  view_.clock().stop();
  view_.adapter().deactivate();
  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  PlaybackClock& clock = view_.clock();
  if (IsKeyPressed(KEY_SPACE)) clock.toggle();

  if (IsKeyPressed(KEY_UP))   clock.set_speed(next_speed_preset(clock.state().speed));
  if (IsKeyPressed(KEY_DOWN)) clock.set_speed(prev_speed_preset(clock.state().speed));

  if (IsKeyPressed(KEY_RIGHT)) clock.seek(std::min(clock.time() + kSeekStepS, clock.state().max_time));
  if (IsKeyPressed(KEY_LEFT))  clock.seek(std::max(clock.time() - kSeekStepS, clock.state().min_time));
  if (IsKeyPressed(KEY_HOME))  clock.seek(clock.state().min_time);

  if (IsKeyPressed(KEY_C)) view_.set_scenario(other_scenario(view_.context().scenario()));

  if (IsKeyPressed(KEY_V)) {
    const ViewMode prev = view_.view_mode().value_or(ViewMode::Flat);
    if (!view_.set_view_mode(other_mode(prev))) view_.set_view_mode(prev);
  }
}

void ViewerApp::draw_hud_() {
  const PlaybackState& st = view_.clock().state();
  const auto mode = view_.view_mode();

  DrawRectangle(10, 10, 560, 62, Color{0, 0, 0, 150});
  DrawText(TextFormat("%s  [%s - %s]  %s",
                      format_clock(st.current_time).c_str(),
                      format_clock(st.min_time).c_str(),
                      format_clock(st.max_time).c_str(),
                      st.playing ? "playing" : "paused"),
           20, kHudLine1Y, 20, RAYWHITE);
  DrawText(TextFormat("speed=%gx  view=%s  scenario=%s  vehicles=%d",
                      st.speed,
                      mode ? view_mode_name(*mode) : "none",
                      scenario_name(view_.context().scenario()),
                      static_cast<int>(view_.context().active_trips().size())),
           20, kHudLine2Y, 18, Color{220, 220, 220, 255});

  DrawText("Space: Play/Pause | Up/Down: Speed | Left/Right: Seek 10s | Home: Start | V: 2D/3D | C: Scenario",
           20, GetScreenHeight() - kHudHelpPad, 14, Color{40, 40, 40, 255});
}

} // namespace tripviz
