// Source rasters for the morph path.

#ifndef SYMFORGE_FORGE_RASTER_SOURCE_H
#define SYMFORGE_FORGE_RASTER_SOURCE_H

#include <string>
#include <utility>

#include "core/basic_types.h"
#include "core/raster.h"

namespace symforge {

/// @brief Loads a named style of a symbol kind.
///
/// load() may block on storage; it is the only suspension point of a morph.
/// Implementations must be safe to call from several threads at once.
class IRasterSource {
 public:
  virtual ~IRasterSource() = default;

  /// @brief Load the raster for (type, style).
  /// @return SourceNotFound if no such raster exists, SourceUnreadable if it
  ///         exists but cannot be decoded, ForgeError::None otherwise.
  virtual ForgeError load(SymbolType type, const std::string& style, Raster& out) const = 0;
};

/// @brief Reads {asset_root}/Snapshots/{Type}/{style}.pgm.
class FileRasterSource : public IRasterSource {
 public:
  explicit FileRasterSource(std::string asset_root) : asset_root_(std::move(asset_root)) {}

  ForgeError load(SymbolType type, const std::string& style, Raster& out) const override;

  /// @brief Path a (type, style) pair resolves to.
  std::string pathFor(SymbolType type, const std::string& style) const;

  const std::string& assetRoot() const { return asset_root_; }

 private:
  std::string asset_root_;
};

}  // namespace symforge

#endif  // SYMFORGE_FORGE_RASTER_SOURCE_H
