#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <numbers>
#include <spdlog/spdlog.h>

#include <tripviz/viewer/raylib_backends.hpp>
#include <tripviz/network_geom.hpp>

namespace tripviz {

namespace {

constexpr double kDegToRad = std::numbers::pi_v<double> / 180.0;
constexpr double kEarthRadiusM = 6371008.8;
// Web-mercator ground resolution at zoom 0 (m/px at the equator).
constexpr double kMercatorMetersPerPixel0 = 156543.03392;

Color to_color(const Rgba& c) { return Color{c.r, c.g, c.b, c.a}; }

// Model boxes (width, height, length in meters): car, bus, truck.
struct ModelDims { float w, h, l; };
constexpr ModelDims kModelDims[] = {
  {1.8f, 1.5f,  4.5f},
  {2.5f, 3.2f, 12.0f},
  {2.5f, 3.5f,  8.0f},
};

} // namespace

// ---- RaylibBackend ----

bool RaylibBackend::construct(const ViewState& initial) {
  if (!IsWindowReady()) {
    spdlog::error("raylib: no window to draw into");
    return false;
  }
  view_ = initial;
  const double k = kEarthRadiusM * kDegToRad;
  kx_ = k * std::cos(view_.lat * kDegToRad);
  ky_ = k;
  if (!on_construct_()) return false;
  live_ = true;
  return true;
}

void RaylibBackend::destroy() {
  if (!live_) return;
  on_destroy_();
  layers_.clear();
  live_ = false;
}

Vec2 RaylibBackend::to_local_(const Vec2& p) const {
  return {(p.x - view_.lon) * kx_, (p.y - view_.lat) * ky_};
}

double RaylibBackend::meters_per_pixel_() const {
  return kMercatorMetersPerPixel0 * std::cos(view_.lat * kDegToRad) / std::pow(2.0, view_.zoom);
}

void RaylibBackend::set_layers(const LayerSet& layers) {
  if (!live_) return;
  std::vector<CachedLayer> next;
  next.reserve(layers.size());
  for (const auto& l : layers) {
    // Network layers rarely change: reuse triangles when the polygons match.
    auto it = std::find_if(layers_.begin(), layers_.end(),
                           [&](const CachedLayer& c){ return c.layer.id == l.id; });
    if (it != layers_.end() && it->layer.polygons == l.polygons) {
      next.push_back(CachedLayer{l, std::move(it->tris)});
      continue;
    }
    CachedLayer c{l, {}};
    c.tris.reserve(l.polygons.size());
    for (const auto& poly : l.polygons) {
      Polygon local;
      local.outer.reserve(poly.ring.size());
      for (const auto& p : poly.ring) local.outer.push_back(to_local_(p));
      for (const auto& hole : poly.holes) {
        Ring& h = local.holes.emplace_back();
        h.reserve(hole.size());
        for (const auto& p : hole) h.push_back(to_local_(p));
      }
      c.tris.push_back(triangulate_polygon(local));
    }
    next.push_back(std::move(c));
  }
  layers_ = std::move(next);
}

// ---- FlatBackend ----

void FlatBackend::present() {
  if (!live_) return;
  const float cx = GetScreenWidth()  * 0.5f;
  const float cy = GetScreenHeight() * 0.5f;
  const double px_per_m = 1.0 / meters_per_pixel_();
  auto to_screen = [&](const Vec2& m) {
    return Vector2{cx + float(m.x * px_per_m), cy - float(m.y * px_per_m)};
  };

  for (const auto& c : layers_) {
    const auto& polys = c.layer.polygons;
    for (std::size_t i = 0; i < polys.size(); ++i) {
      const Color fill = to_color(polys[i].fill);
      if (fill.a > 0) {
        for (const auto& t : c.tris[i]) {
          // y flips on screen, so world-CCW triangles are reordered for raylib
          DrawTriangle(to_screen(t[0]), to_screen(t[2]), to_screen(t[1]), fill);
        }
      }
      const Color line = to_color(polys[i].line);
      if (line.a > 0) {
        auto outline = [&](const Ring& ring) {
          for (std::size_t k = 1; k < ring.size(); ++k) {
            DrawLineV(to_screen(to_local_(ring[k-1])), to_screen(to_local_(ring[k])), line);
          }
        };
        outline(polys[i].ring);
        for (const auto& hole : polys[i].holes) outline(hole);
      }
    }
    for (const auto& ln : c.layer.lines) {
      for (std::size_t k = 1; k < ln.points.size(); ++k) {
        DrawLineEx(to_screen(to_local_(ln.points[k-1])), to_screen(to_local_(ln.points[k])),
                   1.5f, to_color(ln.color));
      }
    }
    // Vehicles: heading triangle plus a center dot
    for (const auto& m : c.layer.markers) {
      const Vector2 pos = to_screen(to_local_(m.position));
      const float a  = float(m.angle_deg * kDegToRad); // clockwise from north
      const float dx = std::sin(a), dy = -std::cos(a); // screen space
      const float len = 6.0f, wid = 3.5f;
      const Vector2 nose  { pos.x + dx*len,          pos.y + dy*len };
      const Vector2 tailL { pos.x - dx*len + dy*wid, pos.y - dy*len - dx*wid };
      const Vector2 tailR { pos.x - dx*len - dy*wid, pos.y - dy*len + dx*wid };
      DrawTriangle(nose, tailL, tailR, to_color(m.color));
      DrawCircleV(pos, 1.5f, Color{20, 20, 20, 255});
    }
  }
}

// ---- PerspectiveBackend ----

struct PerspectiveBackend::Impl {
  Camera3D camera{};
  std::vector<Model> models;
  float vehicle_scale{1.0f};
};

PerspectiveBackend::~PerspectiveBackend() {
  if (impl_) on_destroy_();
}

bool PerspectiveBackend::on_construct_() {
  auto impl = std::make_unique<Impl>();

  // Orbit the view center: pitch tilts from straight down, bearing rotates from north.
  const double mpp  = meters_per_pixel_();
  const float dist  = float(mpp * GetScreenHeight());
  const float pitch = float(std::clamp(view_.pitch_deg, 0.0, 80.0));
  const float elev  = float((90.0 - pitch) * kDegToRad);
  const float br    = float(view_.bearing_deg * kDegToRad);
  const float horiz = dist * std::cos(elev) + 1e-3f; // never exactly overhead
  impl->camera.target     = Vector3{0.0f, 0.0f, 0.0f};
  impl->camera.position   = Vector3{-std::sin(br) * horiz, dist * std::sin(elev), std::cos(br) * horiz};
  impl->camera.up         = Vector3{0.0f, 1.0f, 0.0f};
  impl->camera.fovy       = 45.0f;
  impl->camera.projection = CAMERA_PERSPECTIVE;
  impl->vehicle_scale     = float(std::max(1.0, mpp * 2.0));

  for (const auto& d : kModelDims) {
    Model m = LoadModelFromMesh(GenMeshCube(d.w, d.h, d.l));
    if (m.meshCount == 0) {
      spdlog::error("raylib: failed to build vehicle model");
      for (auto& built : impl->models) UnloadModel(built);
      return false;
    }
    impl->models.push_back(m);
  }
  impl_ = std::move(impl);
  return true;
}

void PerspectiveBackend::on_destroy_() {
  if (!impl_) return;
  for (auto& m : impl_->models) UnloadModel(m);
  impl_.reset();
}

void PerspectiveBackend::present() {
  if (!live_ || !impl_) return;
  auto to3 = [](const Vec2& m, float y) { return Vector3{float(m.x), y, float(-m.y)}; };

  BeginMode3D(impl_->camera);
  float lift = 0.0f;
  for (const auto& c : layers_) {
    lift += 0.05f; // later layers sit slightly above earlier ones
    const auto& polys = c.layer.polygons;
    for (std::size_t i = 0; i < polys.size(); ++i) {
      const Color fill = to_color(polys[i].fill);
      if (fill.a == 0) continue;
      for (const auto& t : c.tris[i]) {
        DrawTriangle3D(to3(t[0], lift), to3(t[1], lift), to3(t[2], lift), fill);
      }
    }
    for (const auto& ln : c.layer.lines) {
      for (std::size_t k = 1; k < ln.points.size(); ++k) {
        DrawLine3D(to3(to_local_(ln.points[k-1]), lift), to3(to_local_(ln.points[k]), lift),
                   to_color(ln.color));
      }
    }
    for (const auto& m : c.layer.markers) {
      const Model& model = impl_->models[m.model_variant % impl_->models.size()];
      const float s = impl_->vehicle_scale;
      DrawModelEx(model, to3(to_local_(m.position), lift + 0.5f * s),
                  Vector3{0.0f, 1.0f, 0.0f}, float(-m.angle_deg),
                  Vector3{s, s, s}, to_color(m.color));
    }
  }
  EndMode3D();
}

std::unique_ptr<RenderBackend> make_raylib_backend(ViewMode mode) {
  switch (mode) {
    case ViewMode::Flat:        return std::make_unique<FlatBackend>();
    case ViewMode::Perspective: return std::make_unique<PerspectiveBackend>();
  }
  return nullptr;
}

} // namespace tripviz
