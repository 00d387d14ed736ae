/// @file
/// @brief Built-in validators: density, contrast, structure.

#include <cstdio>
#include <optional>
#include <string>

#include "core/pixel_utils.h"
#include "validation/validator.h"

namespace symforge {

namespace {

/// @brief Shared null-input guard. Returns a failing result or nullopt.
std::optional<ValidationResult> checkInput(const char* validator_name,
                                           const SymbolCapsule* capsule) {
  if (capsule == nullptr) {
    return ValidationResult::fail(validator_name, "Capsule is null");
  }
  if (capsule->raster() == nullptr) {
    return ValidationResult::fail(validator_name, "Capsule has no raster (disposed)");
  }
  return std::nullopt;
}

std::string formatPercent(double fraction) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f%%", fraction * 100.0);
  return buf;
}

}  // namespace

// ---------------------------------------------------------------------------
// DensityValidator
// ---------------------------------------------------------------------------

ValidationResult DensityValidator::validate(const SymbolCapsule* capsule,
                                            QualityMetrics& metrics) const {
  if (auto failure = checkInput(name(), capsule)) return *failure;

  const Raster& raster = *capsule->raster();
  size_t ink = countInkPixels(raster);
  if (ink == 0) {
    metrics.density_percent = 0.0;
    metrics.density_status = DensityStatus::TooLow;
    return ValidationResult::fail(name(), "No ink pixels: density is 0.00%");
  }

  double density = static_cast<double>(ink) / static_cast<double>(raster.pixelCount());
  metrics.density_percent = density * 100.0;

  if (density < min_density_) {
    metrics.density_status = DensityStatus::TooLow;
    return ValidationResult::fail(name(), "Density " + formatPercent(density) +
                                              " is below the minimum " +
                                              formatPercent(min_density_));
  }
  if (density > max_density_) {
    metrics.density_status = DensityStatus::TooHigh;
    return ValidationResult::fail(name(), "Density " + formatPercent(density) +
                                              " is above the maximum " +
                                              formatPercent(max_density_));
  }
  metrics.density_status = DensityStatus::Valid;
  return ValidationResult::pass(name());
}

// ---------------------------------------------------------------------------
// ContrastValidator
// ---------------------------------------------------------------------------

ValidationResult ContrastValidator::validate(const SymbolCapsule* capsule,
                                             QualityMetrics& /*metrics*/) const {
  if (auto failure = checkInput(name(), capsule)) return *failure;

  const Raster& raster = *capsule->raster();
  size_t total = raster.pixelCount();
  if (total == 0) {
    return ValidationResult::fail(name(), "Image has no pixels; contrast is undefined");
  }

  size_t dark = countInkPixels(raster);
  if (dark == 0 || dark == total) {
    return ValidationResult::fail(name(), "Image is a single color; no contrast");
  }

  double dark_ratio = static_cast<double>(dark) / static_cast<double>(total);
  double light_ratio = static_cast<double>(total - dark) / static_cast<double>(total);
  if (dark_ratio < kMinimumContrastRatio) {
    return ValidationResult::fail(name(), "Ink covers only " + formatPercent(dark_ratio) +
                                              " of the image (minimum " +
                                              formatPercent(kMinimumContrastRatio) + ")");
  }
  if (light_ratio < kMinimumContrastRatio) {
    return ValidationResult::fail(name(), "Background covers only " +
                                              formatPercent(light_ratio) +
                                              " of the image (minimum " +
                                              formatPercent(kMinimumContrastRatio) + ")");
  }
  return ValidationResult::pass(name());
}

// ---------------------------------------------------------------------------
// StructureValidator
// ---------------------------------------------------------------------------

ValidationResult StructureValidator::validate(const SymbolCapsule* capsule,
                                              QualityMetrics& /*metrics*/) const {
  if (auto failure = checkInput(name(), capsule)) return *failure;
  return ValidationResult::pass(name());
}

}  // namespace symforge
