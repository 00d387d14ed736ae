// Implementation of PGM encoding and file I/O.

#include "image/pgm_io.h"

#include <cctype>
#include <cstdio>
#include <utility>

namespace symforge {

namespace {

// ---------------------------------------------------------------------------
// Header tokenizer
// ---------------------------------------------------------------------------

/// @brief Skip whitespace and '#' comments up to the next header token.
void skipHeaderSpace(const std::vector<uint8_t>& bytes, size_t& pos) {
  while (pos < bytes.size()) {
    if (bytes[pos] == '#') {
      while (pos < bytes.size() && bytes[pos] != '\n') ++pos;
    } else if (std::isspace(bytes[pos])) {
      ++pos;
    } else {
      break;
    }
  }
}

/// @brief Read an unsigned decimal header field.
bool readHeaderInt(const std::vector<uint8_t>& bytes, size_t& pos, int& value) {
  skipHeaderSpace(bytes, pos);
  if (pos >= bytes.size() || !std::isdigit(bytes[pos])) return false;

  long acc = 0;
  while (pos < bytes.size() && std::isdigit(bytes[pos])) {
    acc = acc * 10 + (bytes[pos] - '0');
    if (acc > 1000000) return false;
    ++pos;
  }
  value = static_cast<int>(acc);
  return true;
}

uint8_t rescale(int sample, int maxval) {
  if (maxval == 255) return static_cast<uint8_t>(sample);
  return static_cast<uint8_t>((sample * 255 + maxval / 2) / maxval);
}

}  // namespace

std::vector<uint8_t> encodePgm(const Raster& raster) {
  std::string header = "P5\n" + std::to_string(raster.width()) + " " +
                       std::to_string(raster.height()) + "\n255\n";
  std::vector<uint8_t> bytes(header.begin(), header.end());
  bytes.insert(bytes.end(), raster.data().begin(), raster.data().end());
  return bytes;
}

ForgeError decodePgm(const std::vector<uint8_t>& bytes, Raster& out) {
  if (bytes.size() < 2 || bytes[0] != 'P' || (bytes[1] != '5' && bytes[1] != '2')) {
    return ForgeError::SourceUnreadable;
  }
  bool binary = bytes[1] == '5';
  size_t pos = 2;

  int width = 0;
  int height = 0;
  int maxval = 0;
  if (!readHeaderInt(bytes, pos, width) || !readHeaderInt(bytes, pos, height) ||
      !readHeaderInt(bytes, pos, maxval)) {
    return ForgeError::SourceUnreadable;
  }
  if (width <= 0 || height <= 0 || maxval <= 0 || maxval > 255) {
    return ForgeError::SourceUnreadable;
  }

  size_t count = static_cast<size_t>(width) * static_cast<size_t>(height);
  if (binary) {
    // Exactly one whitespace byte separates maxval from the sample data.
    if (pos >= bytes.size() || !std::isspace(bytes[pos])) return ForgeError::SourceUnreadable;
    ++pos;
  }
  // Every sample takes at least one byte, so a header promising more samples
  // than the file holds is rejected before anything is allocated.
  if (pos > bytes.size() || bytes.size() - pos < count) return ForgeError::SourceUnreadable;
  std::vector<uint8_t> pixels(count);

  if (binary) {
    for (size_t idx = 0; idx < count; ++idx) {
      int sample = bytes[pos + idx];
      if (sample > maxval) return ForgeError::SourceUnreadable;
      pixels[idx] = rescale(sample, maxval);
    }
  } else {
    for (size_t idx = 0; idx < count; ++idx) {
      int sample = 0;
      if (!readHeaderInt(bytes, pos, sample) || sample > maxval) {
        return ForgeError::SourceUnreadable;
      }
      pixels[idx] = rescale(sample, maxval);
    }
  }

  out = Raster(width, height, std::move(pixels));
  return ForgeError::None;
}

ForgeError readPgm(const std::string& path, Raster& out) {
  FILE* file = std::fopen(path.c_str(), "rb");
  if (!file) return ForgeError::SourceNotFound;

  std::vector<uint8_t> bytes;
  uint8_t chunk[4096];
  size_t got = 0;
  while ((got = std::fread(chunk, 1, sizeof(chunk), file)) > 0) {
    bytes.insert(bytes.end(), chunk, chunk + got);
  }
  bool read_error = std::ferror(file) != 0;
  std::fclose(file);

  if (read_error) return ForgeError::SourceUnreadable;
  return decodePgm(bytes, out);
}

bool writePgm(const std::string& path, const Raster& raster) {
  std::vector<uint8_t> bytes = encodePgm(raster);
  FILE* file = std::fopen(path.c_str(), "wb");
  if (!file) return false;
  size_t written = std::fwrite(bytes.data(), 1, bytes.size(), file);
  bool closed = std::fclose(file) == 0;
  return written == bytes.size() && closed;
}

}  // namespace symforge
