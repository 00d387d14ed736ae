// Implementation of configuration parsing and validation.

#include "forge/forge_config.h"

#include <cmath>
#include <map>

#include "core/json_parser.h"

namespace symforge {

namespace {

bool readNumber(const std::map<std::string, JsonValue>& values, const char* key,
                double& out, std::string& error) {
  auto iter = values.find(key);
  if (iter == values.end()) return true;
  if (!iter->second.isNumber()) {
    error = std::string("'") + key + "' must be a number";
    return false;
  }
  out = iter->second.number_val;
  return true;
}

bool readInt(const std::map<std::string, JsonValue>& values, const char* key, int& out,
             std::string& error) {
  double number = out;
  if (!readNumber(values, key, number, error)) return false;
  if (number != std::floor(number) || std::fabs(number) > 1e9) {
    error = std::string("'") + key + "' must be an integer";
    return false;
  }
  out = static_cast<int>(number);
  return true;
}

bool readString(const std::map<std::string, JsonValue>& values, const char* key,
                std::string& out, std::string& error) {
  auto iter = values.find(key);
  if (iter == values.end()) return true;
  if (!iter->second.isString()) {
    error = std::string("'") + key + "' must be a string";
    return false;
  }
  out = iter->second.string_val;
  return true;
}

bool readBool(const std::map<std::string, JsonValue>& values, const char* key, bool& out,
              std::string& error) {
  auto iter = values.find(key);
  if (iter == values.end()) return true;
  if (!iter->second.isBool()) {
    error = std::string("'") + key + "' must be true or false";
    return false;
  }
  out = iter->second.bool_val;
  return true;
}

bool inUnitInterval(double value) { return value >= 0.0 && value <= 1.0; }

}  // namespace

bool parseForgeConfig(const std::string& json, ForgeConfig& config, std::string& error) {
  std::map<std::string, JsonValue> values;
  if (!parseFlatJsonObject(json, values, error)) return false;

  ForgeConfig parsed;
  if (!readNumber(values, "density_min", parsed.density_min, error)) return false;
  if (!readNumber(values, "density_max", parsed.density_max, error)) return false;
  if (!readString(values, "asset_root", parsed.asset_root, error)) return false;
  if (!readNumber(values, "edge_rotation_degrees", parsed.edge_rotation_degrees, error)) {
    return false;
  }
  if (!readInt(values, "edge_crop_margin", parsed.edge_crop_margin, error)) return false;
  if (!readNumber(values, "edge_blur_sigma", parsed.edge_blur_sigma, error)) return false;
  if (!readBool(values, "verbose", parsed.verbose, error)) return false;

  config = parsed;
  return true;
}

ForgeError validateForgeConfig(const ForgeConfig& config, std::string& error) {
  if (!inUnitInterval(config.density_min) || !inUnitInterval(config.density_max)) {
    error = "density thresholds must lie within [0, 1]";
    return ForgeError::InvalidConfig;
  }
  if (config.density_min > config.density_max) {
    error = "density_min must not exceed density_max";
    return ForgeError::InvalidConfig;
  }
  if (config.asset_root.empty()) {
    error = "asset_root must not be empty";
    return ForgeError::InvalidConfig;
  }
  if (config.edge_crop_margin < 0) {
    error = "edge_crop_margin must be >= 0";
    return ForgeError::InvalidConfig;
  }
  if (!(config.edge_blur_sigma > 0.0) || config.edge_blur_sigma > kMaxEdgeBlurSigma) {
    error = "edge_blur_sigma must lie within (0, 100]";
    return ForgeError::InvalidConfig;
  }
  if (!std::isfinite(config.edge_rotation_degrees)) {
    error = "edge_rotation_degrees must be finite";
    return ForgeError::InvalidConfig;
  }
  return ForgeError::None;
}

}  // namespace symforge
