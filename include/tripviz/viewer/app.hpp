#pragma once
#include <tripviz/config.hpp>
#include <tripviz/playback_view.hpp>
#include <tripviz/tick_source.hpp>
#include <tripviz/view_context.hpp>

namespace tripviz {

// RAII window application: loads the configured datasets, pumps the
// playback clock once per frame and draws the HUD over the live backend.
class ViewerApp {
public:
  explicit ViewerApp(ViewerConfig cfg);
  int run(); // returns 0 on normal exit

private:
  bool load_data_();
  void process_input_();
  void draw_hud_();

  ViewerConfig cfg_;
  ViewContext ctx_;
  FrameTickSource ticks_;
  PlaybackView view_;
};

} // namespace tripviz
