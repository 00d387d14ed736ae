// Implementation of the validator chain.

#include "validation/validator_chain.h"

#include <cstdio>
#include <utility>

namespace symforge {

void ValidatorChain::add(std::unique_ptr<IValidator> validator) {
  if (validator) validators_.push_back(std::move(validator));
}

ChainOutcome ValidatorChain::run(const SymbolCapsule* capsule, QualityMetrics& metrics,
                                 const OverrideMap& overrides) const {
  ChainOutcome outcome;
  outcome.results.reserve(validators_.size());

  for (const auto& validator : validators_) {
    std::string name = validator->name();
    auto override_iter = overrides.find(name);
    if (override_iter != overrides.end() && override_iter->second.overridden) {
      const std::string& reason = override_iter->second.reason;
      std::fprintf(stderr, "[ValidatorChain] WARNING: '%s' overridden: %s\n", name.c_str(),
                   reason.c_str());
      outcome.results.push_back(ValidationResult::pass(name, "Overridden: " + reason));
      ++outcome.overridden_count;
      continue;
    }

    ValidationResult result = validator->validate(capsule, metrics);
    if (!result.isValid()) outcome.is_valid = false;
    outcome.results.push_back(std::move(result));
  }
  return outcome;
}

std::vector<std::string> ValidatorChain::names() const {
  std::vector<std::string> result;
  result.reserve(validators_.size());
  for (const auto& validator : validators_) result.emplace_back(validator->name());
  return result;
}

ValidatorChain createDefaultValidatorChain(double density_min, double density_max) {
  ValidatorChain chain;
  chain.add(std::make_unique<DensityValidator>(density_min, density_max));
  chain.add(std::make_unique<ContrastValidator>());
  chain.add(std::make_unique<StructureValidator>());
  return chain;
}

}  // namespace symforge
