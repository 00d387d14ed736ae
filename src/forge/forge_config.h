// Forge configuration: validator thresholds, asset location and the
// parameters of the edge-case transforms.

#ifndef SYMFORGE_FORGE_FORGE_CONFIG_H
#define SYMFORGE_FORGE_FORGE_CONFIG_H

#include <string>

#include "core/basic_types.h"
#include "validation/validator.h"

namespace symforge {

/// Largest accepted InkBleed sigma.
constexpr double kMaxEdgeBlurSigma = 100.0;

/// @brief Settings consumed by makeDefaultForge().
struct ForgeConfig {
  double density_min = kDefaultDensityMin;  ///< Inclusive lower density bound.
  double density_max = kDefaultDensityMax;  ///< Inclusive upper density bound.
  std::string asset_root = "assets";        ///< Root of {root}/Snapshots/{Type}/{style}.pgm.
  double edge_rotation_degrees = 45.0;      ///< Rotated edge case angle.
  int edge_crop_margin = 10;                ///< Clipped edge case margin per side.
  double edge_blur_sigma = 1.5;             ///< InkBleed edge case sigma.
  bool verbose = false;                     ///< Log per-request progress to stderr.
};

/// @brief Read a ForgeConfig from a flat JSON object.
///
/// Keys use the field names above. Unknown keys are ignored and missing
/// keys keep their defaults. A key whose value has the wrong JSON type is
/// an error.
///
/// @param json JSON text.
/// @param config Receives the parsed settings (starts from defaults).
/// @param error Receives a description on failure.
/// @return True on success.
bool parseForgeConfig(const std::string& json, ForgeConfig& config, std::string& error);

/// @brief Check value ranges.
/// @return ForgeError::InvalidConfig with `error` set, or ForgeError::None.
ForgeError validateForgeConfig(const ForgeConfig& config, std::string& error);

}  // namespace symforge

#endif  // SYMFORGE_FORGE_FORGE_CONFIG_H
