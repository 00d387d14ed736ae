// Request and result records exchanged with the forge.

#ifndef SYMFORGE_FORGE_REQUESTS_H
#define SYMFORGE_FORGE_REQUESTS_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "capsule/symbol_capsule.h"
#include "core/basic_types.h"
#include "image/pixel_blender.h"
#include "validation/validator_chain.h"

namespace symforge {

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

/// @brief Parameters for one generation call.
struct SymbolRequest {
  SymbolType type = SymbolType::Flat;
  /// First entry is the primary size; the rest become size variants.
  std::vector<Dimensions> dimensions;
  std::vector<OutputForm> output_forms = {OutputForm::Binarized};
  std::optional<int32_t> seed;
  /// Derived from the finalized primary raster, in this order.
  std::vector<EdgeCaseType> edge_cases;
  OverrideMap validator_overrides;
};

/// @brief Parameters for one morph call.
struct MorphRequest {
  SymbolType type = SymbolType::Flat;
  std::string from_style;
  std::string to_style;
  /// Linear factor, or alpha for BlendMode::Alpha; other modes ignore it.
  double interpolation_factor = 0.5;
  BlendMode blend_mode = BlendMode::Linear;
  OverrideMap validator_overrides;
};

// ---------------------------------------------------------------------------
// Results
// ---------------------------------------------------------------------------

/// @brief Outcome of SymbolForge::generate().
///
/// On failure the set is empty and every capsule built before the failure
/// has already been disposed.
struct GenerateResult {
  bool success = false;
  ForgeError error = ForgeError::None;
  std::string error_message;
  SymbolCapsuleSet capsules;
};

/// @brief Outcome of SymbolForge::morph().
struct MorphResult {
  bool success = false;
  ForgeError error = ForgeError::None;
  std::string error_message;
  SymbolCapsule capsule;
};

}  // namespace symforge

#endif  // SYMFORGE_FORGE_REQUESTS_H
