// Preprocessing steps applied to a raw generator raster before validation.

#ifndef SYMFORGE_IMAGE_PREPROCESSING_STEP_H
#define SYMFORGE_IMAGE_PREPROCESSING_STEP_H

#include <vector>

#include "core/basic_types.h"
#include "core/raster.h"

namespace symforge {

/// @brief One stateless raster-to-raster stage.
class IPreprocessingStep {
 public:
  virtual ~IPreprocessingStep() = default;

  /// @brief Short name for logs (e.g. "binarize").
  virtual const char* name() const = 0;

  /// @brief Method recorded in provenance when this is the last step applied.
  virtual PreprocessingMethod method() const = 0;

  /// @brief Produce a new raster; the input is left untouched.
  virtual Raster apply(const Raster& input) const = 0;
};

/// @brief Canonical 0/255 binarization through isInk().
class BinarizeStep : public IPreprocessingStep {
 public:
  const char* name() const override { return "binarize"; }
  PreprocessingMethod method() const override { return PreprocessingMethod::Binarized; }
  Raster apply(const Raster& input) const override;
};

/// @brief Zhang-Suen skeletonization.
class SkeletonizeStep : public IPreprocessingStep {
 public:
  const char* name() const override { return "skeletonize"; }
  PreprocessingMethod method() const override { return PreprocessingMethod::Skeletonized; }
  Raster apply(const Raster& input) const override;
};

/// @brief Steps selected for a set of requested output forms, in order.
struct PreprocessingPlan {
  std::vector<const IPreprocessingStep*> steps;
  PreprocessingMethod method = PreprocessingMethod::Raw;
};

/// @brief Choose the steps for the requested output forms.
///
/// An empty list or one naming only Raw selects no steps. Anything else
/// binarizes, and additionally skeletonizes when Skeletonized is requested.
/// The returned pointers borrow the step instances passed in.
PreprocessingPlan planPreprocessing(const std::vector<OutputForm>& forms,
                                    const BinarizeStep& binarize,
                                    const SkeletonizeStep& skeletonize);

/// @brief Run every step of a plan in order.
Raster applyPreprocessing(const PreprocessingPlan& plan, const Raster& raw);

}  // namespace symforge

#endif  // SYMFORGE_IMAGE_PREPROCESSING_STEP_H
