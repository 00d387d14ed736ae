// Generators for the accidental glyphs: flat, sharp, natural, double sharp.
// All four are deterministic and ignore the seed.

#ifndef SYMFORGE_GENERATORS_ACCIDENTAL_GENERATORS_H
#define SYMFORGE_GENERATORS_ACCIDENTAL_GENERATORS_H

#include "generators/symbol_generator.h"

namespace symforge {

/// @brief Flat: a vertical stem with an elliptical bowl at its foot.
class FlatGenerator : public ISymbolGenerator {
 public:
  SymbolType supportedType() const override { return SymbolType::Flat; }
  ForgeError generateRaw(Dimensions dims, std::optional<int32_t> seed,
                         Raster& out) const override;
};

/// @brief Sharp: two stems crossed by two horizontal bars.
class SharpGenerator : public ISymbolGenerator {
 public:
  SymbolType supportedType() const override { return SymbolType::Sharp; }
  ForgeError generateRaw(Dimensions dims, std::optional<int32_t> seed,
                         Raster& out) const override;
};

/// @brief Natural: two offset stems joined by two bars.
class NaturalGenerator : public ISymbolGenerator {
 public:
  SymbolType supportedType() const override { return SymbolType::Natural; }
  ForgeError generateRaw(Dimensions dims, std::optional<int32_t> seed,
                         Raster& out) const override;
};

/// @brief Double sharp: two crossing diagonal strokes.
class DoubleSharpGenerator : public ISymbolGenerator {
 public:
  SymbolType supportedType() const override { return SymbolType::DoubleSharp; }
  ForgeError generateRaw(Dimensions dims, std::optional<int32_t> seed,
                         Raster& out) const override;
};

}  // namespace symforge

#endif  // SYMFORGE_GENERATORS_ACCIDENTAL_GENERATORS_H
