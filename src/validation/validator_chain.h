// Ordered validator chain with audited overrides.

#ifndef SYMFORGE_VALIDATION_VALIDATOR_CHAIN_H
#define SYMFORGE_VALIDATION_VALIDATOR_CHAIN_H

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "validation/validator.h"

namespace symforge {

/// @brief Request-level instruction to bypass one validator.
struct ValidatorOverride {
  bool overridden = false;
  std::string reason;
};

/// Validator name -> override instruction.
using OverrideMap = std::map<std::string, ValidatorOverride>;

/// @brief Results of one chain run.
struct ChainOutcome {
  std::vector<ValidationResult> results;  ///< One entry per validator, chain order.
  bool is_valid = true;                   ///< AND of every non-overridden result.
  int overridden_count = 0;
};

/// @brief Runs validators in registration order.
///
/// A validator whose name maps to an override with overridden=true is not
/// executed; a passing result with the message "Overridden: {reason}" is
/// recorded in its place and the bypass is logged. Overrides never make a
/// capsule invalid.
class ValidatorChain {
 public:
  ValidatorChain() = default;
  ValidatorChain(ValidatorChain&&) = default;
  ValidatorChain& operator=(ValidatorChain&&) = default;
  ValidatorChain(const ValidatorChain&) = delete;
  ValidatorChain& operator=(const ValidatorChain&) = delete;

  void add(std::unique_ptr<IValidator> validator);

  /// @brief Validate a capsule.
  /// @param capsule Capsule under test (may be null; validators report it).
  /// @param metrics Shared metrics side channel.
  /// @param overrides Request overrides keyed by validator name.
  ChainOutcome run(const SymbolCapsule* capsule, QualityMetrics& metrics,
                   const OverrideMap& overrides) const;

  /// @brief Validator names in chain order.
  std::vector<std::string> names() const;

  size_t size() const { return validators_.size(); }

 private:
  std::vector<std::unique_ptr<IValidator>> validators_;
};

/// @brief Density, contrast and structure validators, in that order.
ValidatorChain createDefaultValidatorChain(double density_min = kDefaultDensityMin,
                                           double density_max = kDefaultDensityMax);

}  // namespace symforge

#endif  // SYMFORGE_VALIDATION_VALIDATOR_CHAIN_H
