// Implementation of capsule lifecycle helpers and capsule JSON output.

#include "capsule/symbol_capsule.h"

#include "core/json_helpers.h"

namespace symforge {

SymbolCapsule::SymbolCapsule(std::unique_ptr<Raster> raster, TemplateMetadata metadata,
                             QualityMetrics metrics, bool is_valid,
                             std::vector<ValidationResult> results)
    : raster_(std::move(raster)),
      metadata_(std::move(metadata)),
      metrics_(metrics),
      is_valid_(is_valid),
      results_(std::move(results)) {}

void SymbolCapsuleSet::dispose() {
  primary_.dispose();
  for (auto& variant : variants_) variant.dispose();
}

std::string capsuleToJson(const SymbolCapsule& capsule) {
  JsonWriter writer;
  writer.beginObject();

  writer.key("metadata");
  writeMetadataJson(writer, capsule.metadata());

  const QualityMetrics& metrics = capsule.metrics();
  writer.key("metrics");
  writer.beginObject();
  writer.field("width", metrics.width);
  writer.field("height", metrics.height);
  writer.field("aspect_ratio", metrics.aspect_ratio);
  writer.field("density_percent", metrics.density_percent);
  writer.field("density_status", densityStatusToString(metrics.density_status));
  writer.endObject();

  writer.field("is_valid", capsule.isValid());

  writer.key("validation_results");
  writer.beginArray();
  for (const auto& result : capsule.validationResults()) {
    writer.beginObject();
    writer.field("validator", result.validatorName());
    writer.field("is_valid", result.isValid());
    writer.optionalField("message", result.failureMessage());
    writer.endObject();
  }
  writer.endArray();

  writer.endObject();
  return writer.toPrettyString();
}

}  // namespace symforge
