// Portable graymap (PGM) encoding for single-channel rasters.
//
// Writes binary P5 with maxval 255. Reads P5 and ASCII P2; samples from
// files with a smaller maxval are rescaled to 0..255.

#ifndef SYMFORGE_IMAGE_PGM_IO_H
#define SYMFORGE_IMAGE_PGM_IO_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/raster.h"

namespace symforge {

/// @brief Encode a raster as binary PGM (P5) bytes.
std::vector<uint8_t> encodePgm(const Raster& raster);

/// @brief Decode PGM bytes.
/// @return SourceUnreadable for malformed or truncated data.
ForgeError decodePgm(const std::vector<uint8_t>& bytes, Raster& out);

/// @brief Read a PGM file.
/// @return SourceNotFound if the file cannot be opened, SourceUnreadable if
///         its contents are not a valid PGM.
ForgeError readPgm(const std::string& path, Raster& out);

/// @brief Write a raster as a binary PGM file.
/// @return True on success.
bool writePgm(const std::string& path, const Raster& raster);

}  // namespace symforge

#endif  // SYMFORGE_IMAGE_PGM_IO_H
