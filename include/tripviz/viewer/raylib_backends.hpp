#pragma once
#include <array>
#include <memory>
#include <string>
#include <vector>
#include <tripviz/layers.hpp>
#include <tripviz/render_backend.hpp>

namespace tripviz {

// Shared state of both raylib backends: the current layers with their
// polygons pre-triangulated, and the local metric frame of the view.
class RaylibBackend : public RenderBackend {
public:
  bool construct(const ViewState& initial) override;
  void set_layers(const LayerSet& layers) override;
  void destroy() override;

protected:
  using Tri = std::array<Vec2, 3>;
  struct CachedLayer {
    Layer layer;
    std::vector<std::vector<Tri>> tris; // one entry per polygon, in local meters
  };

  // Backend-specific resources.
  virtual bool on_construct_() { return true; }
  virtual void on_destroy_() {}

  // lon/lat -> meters east/north of the view center
  Vec2 to_local_(const Vec2& p) const;
  double meters_per_pixel_() const;

  ViewState view_{};
  std::vector<CachedLayer> layers_;
  bool live_{false};

private:
  double kx_{1.0};
  double ky_{1.0};
};

// Top-down 2D painter.
class FlatBackend final : public RaylibBackend {
public:
  ViewMode mode() const override { return ViewMode::Flat; }
  void present() override;
};

// Pitched 3D painter; vehicles are drawn as one of a few box models.
class PerspectiveBackend final : public RaylibBackend {
public:
  ~PerspectiveBackend() override;
  ViewMode mode() const override { return ViewMode::Perspective; }
  void present() override;

private:
  bool on_construct_() override;
  void on_destroy_() override;

  struct Impl;
  std::unique_ptr<Impl> impl_;
};

std::unique_ptr<RenderBackend> make_raylib_backend(ViewMode mode);

} // namespace tripviz
