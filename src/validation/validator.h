// Pure abstract interface for capsule quality checks.
// Concrete implementations: DensityValidator, ContrastValidator,
// StructureValidator.

#ifndef SYMFORGE_VALIDATION_VALIDATOR_H
#define SYMFORGE_VALIDATION_VALIDATOR_H

#include "capsule/symbol_capsule.h"
#include "validation/quality_metrics.h"
#include "validation/validation_result.h"

namespace symforge {

/// @brief One quality gate in the validator chain.
///
/// validate() is total: a null capsule or a capsule without a raster is
/// reported as a failing result, never as an error. Implementations hold
/// only configuration, so a shared instance may serve concurrent calls.
class IValidator {
 public:
  virtual ~IValidator() = default;

  /// @brief Stable display name; also the key used by request overrides.
  virtual const char* name() const = 0;

  /// @brief Check a capsule.
  /// @param capsule Capsule under test (may be null).
  /// @param metrics Shared metrics; validators may write measurements here.
  /// @return Pass/fail record named after this validator.
  virtual ValidationResult validate(const SymbolCapsule* capsule,
                                    QualityMetrics& metrics) const = 0;
};

// ---------------------------------------------------------------------------
// Built-in validators
// ---------------------------------------------------------------------------

constexpr const char* kDensityValidatorName = "Density Validator";
constexpr const char* kContrastValidatorName = "Contrast Validator";
constexpr const char* kStructureValidatorName = "Structure Validator";

/// Default inclusive density bounds (fraction of ink pixels).
constexpr double kDefaultDensityMin = 0.05;
constexpr double kDefaultDensityMax = 0.12;

/// @brief Ink density within [min, max], inclusive.
///
/// Always writes density_percent and density_status to the metrics, pass
/// or fail. A raster with no ink is TooLow without further checks.
class DensityValidator : public IValidator {
 public:
  explicit DensityValidator(double min_density = kDefaultDensityMin,
                            double max_density = kDefaultDensityMax)
      : min_density_(min_density), max_density_(max_density) {}

  const char* name() const override { return kDensityValidatorName; }
  ValidationResult validate(const SymbolCapsule* capsule,
                            QualityMetrics& metrics) const override;

  double minDensity() const { return min_density_; }
  double maxDensity() const { return max_density_; }

 private:
  double min_density_;
  double max_density_;
};

/// Minimum share of each pixel class (ink and background).
constexpr double kMinimumContrastRatio = 0.1;

/// @brief Both ink and background must each cover at least 10% of pixels.
class ContrastValidator : public IValidator {
 public:
  const char* name() const override { return kContrastValidatorName; }
  ValidationResult validate(const SymbolCapsule* capsule,
                            QualityMetrics& metrics) const override;
};

/// @brief Structural sanity gate.
///
/// Only rejects a missing capsule or raster. A former centre-pixel check
/// rejected intentionally hollow glyphs and is not part of this gate.
class StructureValidator : public IValidator {
 public:
  const char* name() const override { return kStructureValidatorName; }
  ValidationResult validate(const SymbolCapsule* capsule,
                            QualityMetrics& metrics) const override;
};

}  // namespace symforge

#endif  // SYMFORGE_VALIDATION_VALIDATOR_H
