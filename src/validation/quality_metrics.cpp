// Implementation of metric seeding.

#include "validation/quality_metrics.h"

namespace symforge {

QualityMetrics initialMetrics(const Raster& raster) {
  QualityMetrics metrics;
  metrics.width = raster.width();
  metrics.height = raster.height();
  if (raster.width() > 0) {
    metrics.aspect_ratio =
        static_cast<double>(raster.height()) / static_cast<double>(raster.width());
  }
  return metrics;
}

}  // namespace symforge
