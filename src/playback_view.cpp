#include <tripviz/playback_view.hpp>
#include <utility>
#include <spdlog/spdlog.h>

namespace tripviz {

PlaybackView::PlaybackView(ViewContext& ctx, TickSource& ticks, BackendFactory factory, AdapterOptions opt)
  : ctx_(ctx),
    adapter_(ctx, std::move(factory), std::move(opt)),
    clock_(ticks, [this](double t){ adapter_.render_frame(t); }) {
  clock_.set_bounds(ctx_.active_time_bounds());
}

PlaybackView::~PlaybackView() {
  clock_.stop();
  adapter_.deactivate();
}

bool PlaybackView::set_view_mode(ViewMode mode) {
  // No tick may reach a backend that is being torn down.
  clock_.stop();
  if (!adapter_.activate(mode)) {
    spdlog::error("view mode '{}' unavailable: {}", view_mode_name(mode), adapter_.last_error());
    return false;
  }
  // Queued behind a running switch: the outer call restarts the clock.
  if (adapter_.switching()) return true;
  clock_.start();
  clock_.request_render();
  return true;
}

void PlaybackView::set_trips(Scenario s, std::shared_ptr<const TripDataset> ds) {
  ctx_.set_trips(s, std::move(ds));
  if (s == ctx_.scenario()) on_dataset_changed_();
  else clock_.request_render(); // closed edges may have changed
}

void PlaybackView::set_scenario(Scenario s) {
  if (s == ctx_.scenario()) return;
  ctx_.set_scenario(s);
  on_dataset_changed_();
}

void PlaybackView::set_network(std::shared_ptr<const RawNetwork> net) {
  ctx_.set_network(std::move(net));
  clock_.request_render();
}

void PlaybackView::set_closed_edges(ClosedEdgeSet closed) {
  ctx_.set_closed_edges(std::move(closed));
  clock_.request_render();
}

void PlaybackView::select_lane(std::string id) {
  ctx_.set_selected_lane(std::move(id));
  clock_.request_render();
}

void PlaybackView::hover_lane(std::string id) {
  if (id == ctx_.hovered_lane()) return;
  ctx_.set_hovered_lane(std::move(id));
  clock_.request_render();
}

void PlaybackView::on_dataset_changed_() {
  const TimeBounds b = ctx_.active_time_bounds();
  clock_.set_bounds(b);
  spdlog::info("scenario '{}': {} trips, time [{}, {}]",
               scenario_name(ctx_.scenario()), ctx_.active_trips().size(), b.min_time, b.max_time);
}

} // namespace tripviz
