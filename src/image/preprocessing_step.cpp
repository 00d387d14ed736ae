// Implementation of the preprocessing steps and their selection.

#include "image/preprocessing_step.h"

#include <algorithm>

#include "image/raster_transform.h"
#include "image/skeletonizer.h"

namespace symforge {

Raster BinarizeStep::apply(const Raster& input) const {
  return binarizeRaster(input);
}

Raster SkeletonizeStep::apply(const Raster& input) const {
  return skeletonize(input);
}

PreprocessingPlan planPreprocessing(const std::vector<OutputForm>& forms,
                                    const BinarizeStep& binarize,
                                    const SkeletonizeStep& skeletonize) {
  PreprocessingPlan plan;
  bool wants_processing = std::any_of(forms.begin(), forms.end(),
                                      [](OutputForm form) { return form != OutputForm::Raw; });
  if (!wants_processing) return plan;

  plan.steps.push_back(&binarize);
  if (std::find(forms.begin(), forms.end(), OutputForm::Skeletonized) != forms.end()) {
    plan.steps.push_back(&skeletonize);
  }
  plan.method = plan.steps.back()->method();
  return plan;
}

Raster applyPreprocessing(const PreprocessingPlan& plan, const Raster& raw) {
  Raster current = raw.clone();
  for (const IPreprocessingStep* step : plan.steps) current = step->apply(current);
  return current;
}

}  // namespace symforge
