// Implementation of the glyph fill primitives.

#include "generators/canvas.h"

#include <cstddef>

namespace symforge {

namespace {

bool insidePolygon(const std::vector<ShapePoint>& points, double px, double py) {
  bool inside = false;
  size_t count = points.size();
  for (size_t idx = 0, prev = count - 1; idx < count; prev = idx++) {
    const ShapePoint& cur = points[idx];
    const ShapePoint& last = points[prev];
    bool crosses = (cur.y > py) != (last.y > py);
    if (crosses) {
      double x_at = (last.x - cur.x) * (py - cur.y) / (last.y - cur.y) + cur.x;
      if (px < x_at) inside = !inside;
    }
  }
  return inside;
}

}  // namespace

ForgeError prepareBlankRaster(Dimensions dims, Raster& out) {
  if (!dims.isValid()) return ForgeError::InvalidDimensions;
  out = Raster(dims.width, dims.height, kBackgroundValue);
  return ForgeError::None;
}

double Canvas::centreX(int x) const {
  return (static_cast<double>(x) + 0.5) / static_cast<double>(target_.width());
}

double Canvas::centreY(int y) const {
  return (static_cast<double>(y) + 0.5) / static_cast<double>(target_.height());
}

void Canvas::fillRect(double x0, double y0, double x1, double y1) {
  for (int y = 0; y < target_.height(); ++y) {
    double py = centreY(y);
    if (py < y0 || py >= y1) continue;
    for (int x = 0; x < target_.width(); ++x) {
      double px = centreX(x);
      if (px >= x0 && px < x1) target_.set(x, y, kInkValue);
    }
  }
}

void Canvas::fillPolygon(const std::vector<ShapePoint>& points) {
  if (points.size() < 3) return;
  for (int y = 0; y < target_.height(); ++y) {
    double py = centreY(y);
    for (int x = 0; x < target_.width(); ++x) {
      if (insidePolygon(points, centreX(x), py)) target_.set(x, y, kInkValue);
    }
  }
}

void Canvas::fillEllipse(double cx, double cy, double rx, double ry) {
  if (rx <= 0.0 || ry <= 0.0) return;
  for (int y = 0; y < target_.height(); ++y) {
    double dy = (centreY(y) - cy) / ry;
    for (int x = 0; x < target_.width(); ++x) {
      double dx = (centreX(x) - cx) / rx;
      if (dx * dx + dy * dy <= 1.0) target_.set(x, y, kInkValue);
    }
  }
}

}  // namespace symforge
