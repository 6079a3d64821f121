#pragma once
#include <functional>
#include <memory>
#include <tripviz/layers.hpp>

namespace tripviz {

enum class ViewMode { Flat, Perspective };

const char* view_mode_name(ViewMode m);

// Initial camera framing handed to a backend on construction.
struct ViewState {
  double lon{};
  double lat{};
  double zoom{14.0};
  double pitch_deg{0.0};
  double bearing_deg{0.0};
};

// Contract every rendering engine must satisfy. Layers are opaque to the core;
// a backend may only differ in how it draws them.
class RenderBackend {
public:
  using FrameHook = std::function<void(double now_s)>;

  virtual ~RenderBackend() = default;

  virtual ViewMode mode() const = 0;
  // False when the underlying engine is unavailable. A backend that fails
  // here must hold no resources afterwards.
  virtual bool construct(const ViewState& initial) = 0;
  virtual void set_layers(const LayerSet& layers) = 0;
  virtual void destroy() = 0;

  // Event-driven engines call the hook once per frame they paint.
  virtual void set_frame_hook(FrameHook hook) { (void)hook; }
  // Synchronous hosts ask for a paint of the current layers.
  virtual void present() {}
};

// Injected capability: builds a backend for a mode (nullptr if none exists).
using BackendFactory = std::function<std::unique_ptr<RenderBackend>(ViewMode)>;

} // namespace tripviz
