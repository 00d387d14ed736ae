// Non-antialiased fill primitives used by the glyph generators.
//
// Shapes are described in proportional coordinates: (0, 0) is the top-left
// corner of the raster and (1, 1) the bottom-right. A pixel is inked when
// its centre falls inside the shape, so output depends only on geometry and
// raster size.

#ifndef SYMFORGE_GENERATORS_CANVAS_H
#define SYMFORGE_GENERATORS_CANVAS_H

#include <vector>

#include "core/basic_types.h"
#include "core/raster.h"

namespace symforge {

/// @brief Point in proportional coordinates.
struct ShapePoint {
  double x = 0.0;
  double y = 0.0;
};

/// @brief Validate dimensions and reset a raster to blank background.
/// @param dims Requested size.
/// @param out Receives a background-filled raster on success.
/// @return ForgeError::InvalidDimensions if either side is <= 0.
ForgeError prepareBlankRaster(Dimensions dims, Raster& out);

/// @brief Draws ink shapes onto a borrowed raster.
class Canvas {
 public:
  explicit Canvas(Raster& target) : target_(target) {}

  /// @brief Fill the half-open rectangle [x0, x1) x [y0, y1).
  void fillRect(double x0, double y0, double x1, double y1);

  /// @brief Fill a simple polygon (even-odd rule).
  void fillPolygon(const std::vector<ShapePoint>& points);

  /// @brief Fill an axis-aligned ellipse.
  /// @param cx Centre x.
  /// @param cy Centre y.
  /// @param rx Horizontal radius.
  /// @param ry Vertical radius.
  void fillEllipse(double cx, double cy, double rx, double ry);

 private:
  /// Proportional coordinate of the centre of pixel column x.
  double centreX(int x) const;
  double centreY(int y) const;

  Raster& target_;
};

}  // namespace symforge

#endif  // SYMFORGE_GENERATORS_CANVAS_H
