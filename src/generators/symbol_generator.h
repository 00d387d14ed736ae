// Pure abstract interface for raw glyph synthesis.
// Concrete implementations: FlatGenerator, SharpGenerator, NaturalGenerator,
// DoubleSharpGenerator, TrebleGenerator.

#ifndef SYMFORGE_GENERATORS_SYMBOL_GENERATOR_H
#define SYMFORGE_GENERATORS_SYMBOL_GENERATOR_H

#include <cstdint>
#include <optional>

#include "core/basic_types.h"
#include "core/raster.h"

namespace symforge {

/// @brief Maps (dimensions, optional seed) to a raw single-channel raster.
///
/// Implementations hold no request-specific state, so one shared instance
/// may serve concurrent callers. For a generator with a stochastic element,
/// identical (dimensions, seed) must produce byte-identical output; the seed
/// is advisory for deterministic shapes.
class ISymbolGenerator {
 public:
  virtual ~ISymbolGenerator() = default;

  /// @brief Symbol kind this generator produces.
  virtual SymbolType supportedType() const = 0;

  /// @brief Render the glyph at the requested size.
  /// @param dims Target size; both sides must be > 0.
  /// @param seed Optional reproducibility seed.
  /// @param out Receives the raw raster on success.
  /// @return ForgeError::InvalidDimensions for non-positive sizes (never
  ///         clamped), ForgeError::None otherwise.
  virtual ForgeError generateRaw(Dimensions dims, std::optional<int32_t> seed,
                                 Raster& out) const = 0;
};

}  // namespace symforge

#endif  // SYMFORGE_GENERATORS_SYMBOL_GENERATOR_H
