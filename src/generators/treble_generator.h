// Treble clef generator: the one glyph with a stochastic element.

#ifndef SYMFORGE_GENERATORS_TREBLE_GENERATOR_H
#define SYMFORGE_GENERATORS_TREBLE_GENERATOR_H

#include "generators/symbol_generator.h"

namespace symforge {

/// @brief Treble clef built from a head, a spine and a sweep.
///
/// With a seed, every polygon vertex is jittered by up to one pixel in each
/// axis. The jitter stream is derived from (seed, width, height) only, so
/// repeated calls with the same inputs are byte-identical. Without a seed
/// the unjittered shape is drawn.
class TrebleGenerator : public ISymbolGenerator {
 public:
  SymbolType supportedType() const override { return SymbolType::Treble; }
  ForgeError generateRaw(Dimensions dims, std::optional<int32_t> seed,
                         Raster& out) const override;
};

}  // namespace symforge

#endif  // SYMFORGE_GENERATORS_TREBLE_GENERATOR_H
