#pragma once
#include <memory>
#include <optional>
#include <string>
#include <tripviz/layers.hpp>
#include <tripviz/render_backend.hpp>
#include <tripviz/view_context.hpp>

namespace tripviz {

struct AdapterOptions {
  Vec2 fallback_center{6.13, 49.61};  // lon, lat
  double default_zoom{14.0};
  double perspective_pitch_deg{45.0};
  VehicleStyle vehicles{};
};

// Full layer list for one frame. Pure: same (context, t) -> same layers.
LayerSet compose_frame_layers(const ViewContext& ctx, double t, const VehicleStyle& vehicles);

// Owns exactly one live rendering backend and feeds it layers.
class RenderBackendAdapter {
public:
  RenderBackendAdapter(const ViewContext& ctx, BackendFactory factory, AdapterOptions opt = {});
  ~RenderBackendAdapter();
  RenderBackendAdapter(const RenderBackendAdapter&) = delete;
  RenderBackendAdapter& operator=(const RenderBackendAdapter&) = delete;

  // Tear down the live backend (if any), then construct one for mode.
  // A call made while a switch is running is deferred until it completes;
  // the last request wins. A deferred call returns true once queued and the
  // outer call reports the outcome. False on construction failure (see last_error()).
  bool activate(ViewMode mode);
  void deactivate();

  // Recompute layers for t and push them to the live backend. Never throws.
  void render_frame(double t);
  void present();

  // Forwarded to every backend this adapter constructs.
  void set_frame_hook(RenderBackend::FrameHook hook);

  bool active() const { return static_cast<bool>(backend_); }
  bool switching() const { return switching_; }
  std::optional<ViewMode> mode() const;
  const std::string& last_error() const { return last_error_; }
  const LayerSet& last_layers() const { return last_layers_; }

  // Framing: network bounds, else first sample of the first trip, else fallback.
  ViewState initial_view(ViewMode mode) const;

private:
  bool activate_once_(ViewMode mode);
  void teardown_();

  const ViewContext& ctx_;
  BackendFactory factory_;
  AdapterOptions opt_;
  RenderBackend::FrameHook frame_hook_;
  std::unique_ptr<RenderBackend> backend_;
  LayerSet last_layers_;
  std::string last_error_;
  bool switching_{false};
  std::optional<ViewMode> pending_;
};

} // namespace tripviz
