#pragma once
#include <memory>
#include <optional>
#include <string>
#include <tripviz/playback.hpp>
#include <tripviz/render_adapter.hpp>
#include <tripviz/tick_source.hpp>
#include <tripviz/view_context.hpp>

namespace tripviz {

// One visualization view: clock ticks drive the adapter, and every write to
// the context goes through here so playback can react to it.
class PlaybackView {
public:
  PlaybackView(ViewContext& ctx, TickSource& ticks, BackendFactory factory, AdapterOptions opt = {});
  ~PlaybackView();
  PlaybackView(const PlaybackView&) = delete;
  PlaybackView& operator=(const PlaybackView&) = delete;

  // Transactional switch: stop ticks, replace backend, restart ticks.
  // Playback time, speed and play/pause survive the switch.
  bool set_view_mode(ViewMode mode);
  std::optional<ViewMode> view_mode() const { return adapter_.mode(); }

  // Dataset changes snap time to the new minimum.
  void set_trips(Scenario s, std::shared_ptr<const TripDataset> ds);
  void set_scenario(Scenario s);
  void set_network(std::shared_ptr<const RawNetwork> net);

  // Styling changes re-render once.
  void set_closed_edges(ClosedEdgeSet closed);
  void select_lane(std::string id);
  void hover_lane(std::string id);

  PlaybackClock& clock() { return clock_; }
  const PlaybackClock& clock() const { return clock_; }
  RenderBackendAdapter& adapter() { return adapter_; }
  const ViewContext& context() const { return ctx_; }

private:
  void on_dataset_changed_();

  ViewContext& ctx_;
  // Declared before clock_: the clock stops ticking before the backend goes.
  RenderBackendAdapter adapter_;
  PlaybackClock clock_;
};

} // namespace tripviz
