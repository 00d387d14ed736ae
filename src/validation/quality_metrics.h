// Shape measurements shared between validators.

#ifndef SYMFORGE_VALIDATION_QUALITY_METRICS_H
#define SYMFORGE_VALIDATION_QUALITY_METRICS_H

#include "core/basic_types.h"
#include "core/raster.h"

namespace symforge {

/// @brief Metrics filled before and during the validator chain.
///
/// Validators write to this struct as a side channel; the density
/// validator sets density_percent and density_status, which later
/// validators may read.
struct QualityMetrics {
  int width = 0;
  int height = 0;
  double aspect_ratio = 0.0;     ///< height / width, 0 for an empty raster.
  double density_percent = 0.0;  ///< Ink pixels as a percentage of all pixels.
  DensityStatus density_status = DensityStatus::Unknown;
};

/// @brief Seed metrics from a raster's geometry (density left Unknown).
QualityMetrics initialMetrics(const Raster& raster);

}  // namespace symforge

#endif  // SYMFORGE_VALIDATION_QUALITY_METRICS_H
