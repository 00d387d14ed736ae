// Implementation of the file-backed raster source.

#include "forge/raster_source.h"

#include "image/pgm_io.h"

namespace symforge {

std::string FileRasterSource::pathFor(SymbolType type, const std::string& style) const {
  std::string root = asset_root_;
  if (!root.empty() && root.back() == '/') root.pop_back();
  return root + "/Snapshots/" + symbolTypeToString(type) + "/" + style + ".pgm";
}

ForgeError FileRasterSource::load(SymbolType type, const std::string& style,
                                  Raster& out) const {
  // Styles are plain names; anything that could leave the asset tree is absent.
  if (style.empty() || style.find('/') != std::string::npos ||
      style.find('\\') != std::string::npos || style == "." || style == "..") {
    return ForgeError::SourceNotFound;
  }
  return readPgm(pathFor(type, style), out);
}

}  // namespace symforge
