#pragma once
#include <algorithm>
#include <functional>
#include <memory>
#include <set>
#include <stdexcept>
#include <vector>
#include <tripviz/render_backend.hpp>

namespace tripviz::testing {

class FakeBackend;

// Shared bookkeeping across every backend a factory creates.
struct FakeStats {
  int created{0};
  int constructed{0};
  int destroyed{0};
  int live{0};
  int max_live{0};
  int set_layers_calls{0};
  int calls_after_destroy{0};
  std::vector<ViewState> views;
  LayerSet last_layers;
  FakeBackend* current{nullptr};
  bool throw_on_set_layers{false};
  // Runs inside construct(), before the backend reports success.
  std::function<void(ViewMode)> on_construct;
};

// In-memory backend: records what the adapter asks of it.
class FakeBackend final : public RenderBackend {
public:
  FakeBackend(ViewMode mode, FakeStats& stats, bool fail)
    : mode_(mode), stats_(stats), fail_(fail) { ++stats_.created; }
  ~FakeBackend() override { destroy(); }

  ViewMode mode() const override { return mode_; }

  bool construct(const ViewState& initial) override {
    if (stats_.on_construct) stats_.on_construct(mode_);
    if (fail_) return false;
    live_ = true;
    ++stats_.constructed;
    ++stats_.live;
    stats_.max_live = std::max(stats_.max_live, stats_.live);
    stats_.views.push_back(initial);
    stats_.current = this;
    return true;
  }

  void set_layers(const LayerSet& layers) override {
    if (!live_) { ++stats_.calls_after_destroy; return; }
    if (stats_.throw_on_set_layers) throw std::runtime_error("device lost");
    ++stats_.set_layers_calls;
    stats_.last_layers = layers;
  }

  void destroy() override {
    if (!live_) return;
    live_ = false;
    hook_ = nullptr;
    --stats_.live;
    ++stats_.destroyed;
    if (stats_.current == this) stats_.current = nullptr;
  }

  void set_frame_hook(FrameHook hook) override { hook_ = std::move(hook); }

  // Simulates the engine painting a frame.
  bool paint(double now_s) {
    if (!hook_) return false;
    hook_(now_s);
    return true;
  }

private:
  ViewMode mode_;
  FakeStats& stats_;
  bool fail_;
  bool live_{false};
  FrameHook hook_;
};

// Modes in `failing` construct unsuccessfully; modes in `missing` have no backend.
inline BackendFactory fake_factory(FakeStats& stats,
                                   std::set<ViewMode> failing = {},
                                   std::set<ViewMode> missing = {}) {
  return [&stats, failing, missing](ViewMode m) -> std::unique_ptr<RenderBackend> {
    if (missing.count(m)) return nullptr;
    return std::make_unique<FakeBackend>(m, stats, failing.count(m) > 0);
  };
}

inline BackendFactory throwing_factory() {
  return [](ViewMode) -> std::unique_ptr<RenderBackend> {
    throw std::runtime_error("engine unavailable");
  };
}

} // namespace tripviz::testing
