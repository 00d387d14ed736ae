// Basic types shared by every stage of the symbol forge pipeline.

#ifndef SYMFORGE_CORE_BASIC_TYPES_H
#define SYMFORGE_CORE_BASIC_TYPES_H

#include <cstdint>
#include <string>

namespace symforge {

// ---------------------------------------------------------------------------
// Dimensions
// ---------------------------------------------------------------------------

/// @brief Requested raster size in pixels.
///
/// Signed on purpose: a request may carry zero or negative values, which are
/// rejected with ForgeError::InvalidDimensions rather than wrapped.
struct Dimensions {
  int width = 0;
  int height = 0;

  /// @brief True when both sides are strictly positive.
  constexpr bool isValid() const { return width > 0 && height > 0; }

  constexpr bool operator==(const Dimensions& other) const {
    return width == other.width && height == other.height;
  }
  constexpr bool operator!=(const Dimensions& other) const { return !(*this == other); }
};

/// @brief Format dimensions as "WxH" (e.g. "32x64").
std::string dimensionsToString(Dimensions dims);

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

/// Typed errors surfaced to callers. Quality-gate rejections are never
/// errors; they travel as ValidationResult data inside a capsule.
enum class ForgeError : uint8_t {
  None,               ///< Success.
  InvalidDimensions,  ///< Width or height <= 0, or a crop leaves no pixels.
  DimensionMismatch,  ///< Two rasters that must match do not.
  MissingInput,       ///< A required raster was null.
  OutOfRange,         ///< A blend factor, alpha or tolerance outside [0, 1].
  SourceNotFound,     ///< A morph source raster does not exist.
  SourceUnreadable,   ///< A morph source exists but could not be decoded.
  EmptyRequest,       ///< A generation request without any dimensions.
  InvalidConfig       ///< Configuration values failed validation.
};

/// @brief Convert ForgeError to a stable identifier string.
const char* forgeErrorToString(ForgeError error);

// ---------------------------------------------------------------------------
// Symbol kinds and request vocabulary
// ---------------------------------------------------------------------------

/// Notation glyph kinds the forge knows how to name. Whether a generator
/// exists for a kind is decided by the GeneratorRegistry, not by this enum.
enum class SymbolType : uint8_t {
  Flat,
  Sharp,
  Natural,
  DoubleSharp,
  Treble
};

/// @brief Convert SymbolType to its canonical name (e.g. "DoubleSharp").
const char* symbolTypeToString(SymbolType type);

/// @brief Parse a SymbolType from its canonical name (case-insensitive).
/// @param str Name such as "flat", "Sharp", "doublesharp".
/// @param out Receives the parsed value on success.
/// @return True if the name was recognized.
bool symbolTypeFromString(const std::string& str, SymbolType& out);

/// Requested output representation of a generated raster.
enum class OutputForm : uint8_t {
  Raw,
  Binarized,
  Skeletonized
};

const char* outputFormToString(OutputForm form);

/// Derived variants synthesized from the finalized primary raster.
enum class EdgeCaseType : uint8_t {
  Clipped,  ///< Fixed margin cropped from every side.
  Rotated,  ///< Rotated by a fixed angle onto an expanded canvas.
  InkBleed  ///< Gaussian-blurred by a fixed sigma.
};

const char* edgeCaseTypeToString(EdgeCaseType type);

/// Density classification written by the density validator.
enum class DensityStatus : uint8_t {
  Unknown,
  Valid,
  TooHigh,
  TooLow
};

const char* densityStatusToString(DensityStatus status);

/// Preprocessing applied to a capsule's raster, recorded in provenance.
enum class PreprocessingMethod : uint8_t {
  Raw = 0,
  Binarized = 1,
  Skeletonized = 2,
  Custom = 99
};

const char* preprocessingMethodToString(PreprocessingMethod method);

}  // namespace symforge

#endif  // SYMFORGE_CORE_BASIC_TYPES_H
