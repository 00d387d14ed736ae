// Capsules: a raster exclusively owned together with its metadata, metrics
// and validator results, and the sets that group them per request.

#ifndef SYMFORGE_CAPSULE_SYMBOL_CAPSULE_H
#define SYMFORGE_CAPSULE_SYMBOL_CAPSULE_H

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "core/raster.h"
#include "provenance/template_metadata.h"
#include "validation/quality_metrics.h"
#include "validation/validation_result.h"

namespace symforge {

// ---------------------------------------------------------------------------
// SymbolCapsule
// ---------------------------------------------------------------------------

/// @brief One forged raster with everything known about it.
///
/// Move-only. The raster is released by dispose() or on destruction,
/// whichever comes first; after dispose() raster() returns nullptr while
/// metadata and results remain readable.
class SymbolCapsule {
 public:
  SymbolCapsule() = default;
  SymbolCapsule(std::unique_ptr<Raster> raster, TemplateMetadata metadata,
                QualityMetrics metrics, bool is_valid,
                std::vector<ValidationResult> results);

  SymbolCapsule(SymbolCapsule&&) = default;
  SymbolCapsule& operator=(SymbolCapsule&&) = default;
  SymbolCapsule(const SymbolCapsule&) = delete;
  SymbolCapsule& operator=(const SymbolCapsule&) = delete;

  /// @brief Owned raster, or nullptr once disposed.
  const Raster* raster() const { return raster_.get(); }

  const TemplateMetadata& metadata() const { return metadata_; }
  const QualityMetrics& metrics() const { return metrics_; }
  bool isValid() const { return is_valid_; }
  const std::vector<ValidationResult>& validationResults() const { return results_; }

  /// @brief Release the raster now. Safe to call more than once.
  void dispose() { raster_.reset(); }

  bool isDisposed() const { return raster_ == nullptr; }

  /// @brief Transfer raster ownership out of this capsule.
  std::unique_ptr<Raster> releaseRaster() { return std::move(raster_); }

 private:
  std::unique_ptr<Raster> raster_;
  TemplateMetadata metadata_;
  QualityMetrics metrics_;
  bool is_valid_ = false;
  std::vector<ValidationResult> results_;
};

// ---------------------------------------------------------------------------
// SymbolCapsuleSet
// ---------------------------------------------------------------------------

/// @brief Primary capsule plus ordered variants (sizes, then edge cases).
class SymbolCapsuleSet {
 public:
  SymbolCapsuleSet() = default;
  explicit SymbolCapsuleSet(SymbolCapsule primary) : primary_(std::move(primary)) {}

  SymbolCapsuleSet(SymbolCapsuleSet&&) = default;
  SymbolCapsuleSet& operator=(SymbolCapsuleSet&&) = default;
  SymbolCapsuleSet(const SymbolCapsuleSet&) = delete;
  SymbolCapsuleSet& operator=(const SymbolCapsuleSet&) = delete;

  const SymbolCapsule& primary() const { return primary_; }
  SymbolCapsule& primary() { return primary_; }
  const std::vector<SymbolCapsule>& variants() const { return variants_; }
  std::vector<SymbolCapsule>& variants() { return variants_; }

  void addVariant(SymbolCapsule capsule) { variants_.push_back(std::move(capsule)); }

  /// @brief Primary plus variant count.
  size_t capsuleCount() const { return 1 + variants_.size(); }

  /// @brief Dispose the primary and every variant.
  void dispose();

 private:
  SymbolCapsule primary_;
  std::vector<SymbolCapsule> variants_;
};

/// @brief Serialize a capsule (metadata, metrics, validity, results) as JSON.
std::string capsuleToJson(const SymbolCapsule& capsule);

}  // namespace symforge

#endif  // SYMFORGE_CAPSULE_SYMBOL_CAPSULE_H
