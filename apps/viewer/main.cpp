#include <spdlog/spdlog.h>
#include <utility>
#include <tripviz/config.hpp>
#include <tripviz/viewer/app.hpp>

using namespace tripviz;

// Usage: tripviz_viewer [config.json]
int main(int argc, char** argv) {
  ViewerConfig cfg;
  if (argc > 1) {
    auto loaded = load_viewer_config(argv[1]);
    if (!loaded) return 1;
    cfg = std::move(*loaded);
  }
  spdlog::set_level(spdlog::level::from_str(cfg.log_level));

  ViewerApp app(std::move(cfg));
  return app.run();
}
