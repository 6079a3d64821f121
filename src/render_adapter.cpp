#include <tripviz/render_adapter.hpp>
#include <algorithm>
#include <cmath>
#include <exception>
#include <utility>
#include <spdlog/spdlog.h>

namespace tripviz {

const char* view_mode_name(ViewMode m) {
  switch (m) {
    case ViewMode::Flat:        return "flat";
    case ViewMode::Perspective: return "perspective";
  }
  return "unknown";
}

LayerSet compose_frame_layers(const ViewContext& ctx, double t, const VehicleStyle& vehicles) {
  LayerSet out;
  if (const NetworkGeometry* geom = ctx.geometry()) {
    const NetworkStyle style{ctx.scenario(), ctx.selected_lane(), ctx.hovered_lane()};
    out = build_network_layers(*geom, ctx.closed_edges(), style);
  }
  const auto& trips = ctx.active_trips();
  if (!trips.empty()) out.push_back(build_vehicle_layer(trips, t, vehicles));
  return out;
}

RenderBackendAdapter::RenderBackendAdapter(const ViewContext& ctx, BackendFactory factory, AdapterOptions opt)
  : ctx_(ctx), factory_(std::move(factory)), opt_(std::move(opt)) {}

RenderBackendAdapter::~RenderBackendAdapter() { teardown_(); }

std::optional<ViewMode> RenderBackendAdapter::mode() const {
  if (!backend_) return std::nullopt;
  return backend_->mode();
}

ViewState RenderBackendAdapter::initial_view(ViewMode mode) const {
  ViewState v{};
  v.zoom = opt_.default_zoom;
  v.pitch_deg = (mode == ViewMode::Perspective) ? opt_.perspective_pitch_deg : 0.0;

  if (const NetworkGeometry* geom = ctx_.geometry(); geom && !geom->empty()) {
    const Bounds b = geom->bounds();
    if (b.valid()) {
      const Vec2 c = b.center();
      v.lon = c.x;
      v.lat = c.y;
      const double span = std::max(b.max_x - b.min_x, b.max_y - b.min_y);
      if (span > 0.0) v.zoom = std::clamp(std::log2(360.0 / span), 1.0, 20.0);
      return v;
    }
  }
  for (const auto& tr : ctx_.active_trips()) {
    if (tr.samples.empty()) continue;
    v.lon = tr.samples.front().lon;
    v.lat = tr.samples.front().lat;
    return v;
  }
  v.lon = opt_.fallback_center.x;
  v.lat = opt_.fallback_center.y;
  return v;
}

bool RenderBackendAdapter::activate(ViewMode mode) {
  if (switching_) {
    spdlog::debug("backend switch to '{}' deferred", view_mode_name(mode));
    pending_ = mode;
    return true;
  }
  switching_ = true;
  bool ok = activate_once_(mode);
  while (pending_) {
    const ViewMode next = *pending_;
    pending_.reset();
    ok = activate_once_(next);
  }
  switching_ = false;
  return ok;
}

bool RenderBackendAdapter::activate_once_(ViewMode mode) {
  teardown_();

  const ViewState view = initial_view(mode);
  std::unique_ptr<RenderBackend> b;
  try {
    if (factory_) b = factory_(mode);
    if (!b) {
      last_error_ = std::string("no backend available for '") + view_mode_name(mode) + "' view";
      spdlog::error("{}", last_error_);
      return false;
    }
    if (!b->construct(view)) {
      last_error_ = std::string("failed to construct '") + view_mode_name(mode) + "' backend";
      spdlog::error("{}", last_error_);
      return false;
    }
  } catch (const std::exception& e) {
    last_error_ = std::string("'") + view_mode_name(mode) + "' backend: " + e.what();
    spdlog::error("{}", last_error_);
    return false;
  }

  b->set_frame_hook(frame_hook_);
  backend_ = std::move(b);
  last_error_.clear();
  spdlog::info("'{}' backend live at ({:.5f}, {:.5f}) zoom {:.1f}",
               view_mode_name(mode), view.lon, view.lat, view.zoom);
  return true;
}

void RenderBackendAdapter::deactivate() {
  if (switching_) pending_.reset();
  teardown_();
}

void RenderBackendAdapter::teardown_() {
  if (!backend_) return;
  const ViewMode m = backend_->mode();
  backend_->set_frame_hook({});
  backend_->destroy();
  backend_.reset();
  last_layers_.clear();
  spdlog::info("'{}' backend destroyed", view_mode_name(m));
}

void RenderBackendAdapter::render_frame(double t) {
  if (!backend_) return;
  try {
    LayerSet layers = compose_frame_layers(ctx_, t, opt_.vehicles);
    backend_->set_layers(layers);
    last_layers_ = std::move(layers);
  } catch (const std::exception& e) {
    spdlog::error("render_frame at t={}: {}", t, e.what());
  }
}

void RenderBackendAdapter::present() {
  if (backend_) backend_->present();
}

void RenderBackendAdapter::set_frame_hook(RenderBackend::FrameHook hook) {
  frame_hook_ = std::move(hook);
  if (backend_) backend_->set_frame_hook(frame_hook_);
}

} // namespace tripviz
