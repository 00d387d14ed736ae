// Implementation of basic type string conversions.

#include "core/basic_types.h"

#include <algorithm>
#include <cctype>

namespace symforge {

std::string dimensionsToString(Dimensions dims) {
  return std::to_string(dims.width) + "x" + std::to_string(dims.height);
}

const char* forgeErrorToString(ForgeError error) {
  switch (error) {
    case ForgeError::None:              return "None";
    case ForgeError::InvalidDimensions: return "InvalidDimensions";
    case ForgeError::DimensionMismatch: return "DimensionMismatch";
    case ForgeError::MissingInput:      return "MissingInput";
    case ForgeError::OutOfRange:        return "OutOfRange";
    case ForgeError::SourceNotFound:    return "SourceNotFound";
    case ForgeError::SourceUnreadable:  return "SourceUnreadable";
    case ForgeError::EmptyRequest:      return "EmptyRequest";
    case ForgeError::InvalidConfig:     return "InvalidConfig";
  }
  return "Unknown";
}

const char* symbolTypeToString(SymbolType type) {
  switch (type) {
    case SymbolType::Flat:        return "Flat";
    case SymbolType::Sharp:       return "Sharp";
    case SymbolType::Natural:     return "Natural";
    case SymbolType::DoubleSharp: return "DoubleSharp";
    case SymbolType::Treble:      return "Treble";
  }
  return "Unknown";
}

bool symbolTypeFromString(const std::string& str, SymbolType& out) {
  std::string lower = str;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char chr) { return static_cast<char>(std::tolower(chr)); });

  if (lower == "flat") {
    out = SymbolType::Flat;
  } else if (lower == "sharp") {
    out = SymbolType::Sharp;
  } else if (lower == "natural") {
    out = SymbolType::Natural;
  } else if (lower == "doublesharp" || lower == "double_sharp") {
    out = SymbolType::DoubleSharp;
  } else if (lower == "treble") {
    out = SymbolType::Treble;
  } else {
    return false;
  }
  return true;
}

const char* outputFormToString(OutputForm form) {
  switch (form) {
    case OutputForm::Raw:          return "Raw";
    case OutputForm::Binarized:    return "Binarized";
    case OutputForm::Skeletonized: return "Skeletonized";
  }
  return "Unknown";
}

const char* edgeCaseTypeToString(EdgeCaseType type) {
  switch (type) {
    case EdgeCaseType::Clipped:  return "Clipped";
    case EdgeCaseType::Rotated:  return "Rotated";
    case EdgeCaseType::InkBleed: return "InkBleed";
  }
  return "Unknown";
}

const char* densityStatusToString(DensityStatus status) {
  switch (status) {
    case DensityStatus::Unknown: return "Unknown";
    case DensityStatus::Valid:   return "Valid";
    case DensityStatus::TooHigh: return "TooHigh";
    case DensityStatus::TooLow:  return "TooLow";
  }
  return "Unknown";
}

const char* preprocessingMethodToString(PreprocessingMethod method) {
  switch (method) {
    case PreprocessingMethod::Raw:          return "Raw";
    case PreprocessingMethod::Binarized:    return "Binarized";
    case PreprocessingMethod::Skeletonized: return "Skeletonized";
    case PreprocessingMethod::Custom:       return "Custom";
  }
  return "Unknown";
}

}  // namespace symforge
