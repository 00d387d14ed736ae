// Implementation of metadata building, integrity checking and JSON output.

#include "provenance/template_metadata.h"

#include <ctime>
#include <utility>

namespace symforge {

namespace {

constexpr size_t kCapsuleIdHashChars = 8;

}  // namespace

std::string makeCapsuleId(const std::string& template_name, const std::string& hash) {
  return template_name + "-" + hash.substr(0, kCapsuleIdHashChars);
}

std::string formatUtcTimestamp(std::chrono::system_clock::time_point when) {
  std::time_t raw = std::chrono::system_clock::to_time_t(when);
  std::tm utc{};
#ifdef _WIN32
  gmtime_s(&utc, &raw);
#else
  gmtime_r(&raw, &utc);
#endif
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return buf;
}

// ---------------------------------------------------------------------------
// MetadataBuilder
// ---------------------------------------------------------------------------

MetadataBuilder& MetadataBuilder::templateName(std::string name) {
  draft_.template_name = std::move(name);
  return *this;
}

MetadataBuilder& MetadataBuilder::generatedBy(std::string identity) {
  draft_.generated_by = std::move(identity);
  return *this;
}

MetadataBuilder& MetadataBuilder::generationSeed(std::optional<int32_t> seed) {
  draft_.generation_seed = seed;
  return *this;
}

MetadataBuilder& MetadataBuilder::sourceImage(std::string source) {
  draft_.provenance.source_image = std::move(source);
  return *this;
}

MetadataBuilder& MetadataBuilder::method(PreprocessingMethod method) {
  draft_.provenance.method = method;
  return *this;
}

MetadataBuilder& MetadataBuilder::validationDate(std::string date) {
  draft_.provenance.validation_date = std::move(date);
  return *this;
}

MetadataBuilder& MetadataBuilder::validatedBy(std::string identity) {
  draft_.provenance.validated_by = std::move(identity);
  return *this;
}

MetadataBuilder& MetadataBuilder::notes(std::optional<std::string> notes) {
  draft_.provenance.notes = std::move(notes);
  return *this;
}

MetadataBuilder& MetadataBuilder::morphLineage(std::string lineage,
                                               double interpolation_factor) {
  draft_.morph_lineage = std::move(lineage);
  draft_.interpolation_factor = interpolation_factor;
  return *this;
}

TemplateMetadata MetadataBuilder::finalize(const std::string& hash) const {
  TemplateMetadata result = draft_;
  result.template_hash = hash;
  result.capsule_id = makeCapsuleId(result.template_name, hash);
  return result;
}

// ---------------------------------------------------------------------------
// Integrity
// ---------------------------------------------------------------------------

ValidationResult checkMetadataIntegrity(const TemplateMetadata& metadata) {
  const std::string& name = metadata.template_name;
  if (name.empty() || name == "default" || name == "unknown") {
    return ValidationResult::fail(kTemplateValidatorName,
                                  "TemplateName is missing or a generic placeholder");
  }
  if (metadata.generated_by.empty()) {
    return ValidationResult::fail(kTemplateValidatorName, "GeneratedBy is missing");
  }
  if (metadata.template_hash.empty() || isPlaceholderHash(metadata.template_hash)) {
    return ValidationResult::fail(kTemplateValidatorName,
                                  "TemplateHash is missing or a placeholder ('" +
                                      metadata.template_hash + "')");
  }
  std::string expected_id = makeCapsuleId(name, metadata.template_hash);
  if (metadata.capsule_id != expected_id) {
    return ValidationResult::fail(kTemplateValidatorName,
                                  "CapsuleId '" + metadata.capsule_id +
                                      "' does not match expected '" + expected_id + "'");
  }
  if (metadata.provenance.source_image.empty()) {
    return ValidationResult::fail(kTemplateValidatorName, "Provenance source is missing");
  }
  if (metadata.provenance.validated_by.empty()) {
    return ValidationResult::fail(kTemplateValidatorName,
                                  "Provenance validator identity is missing");
  }
  return ValidationResult::pass(kTemplateValidatorName);
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

void writeMetadataJson(JsonWriter& writer, const TemplateMetadata& metadata) {
  writer.beginObject();
  writer.field("template_name", metadata.template_name);
  writer.field("generated_by", metadata.generated_by);
  writer.field("template_hash", metadata.template_hash);
  writer.field("capsule_id", metadata.capsule_id);
  writer.optionalField("generation_seed", metadata.generation_seed.has_value()
                                              ? std::optional<int64_t>(*metadata.generation_seed)
                                              : std::nullopt);

  writer.key("provenance");
  writer.beginObject();
  writer.field("source_image", metadata.provenance.source_image);
  writer.field("method", preprocessingMethodToString(metadata.provenance.method));
  writer.field("validation_date", metadata.provenance.validation_date);
  writer.field("validated_by", metadata.provenance.validated_by);
  writer.optionalField("notes", metadata.provenance.notes);
  writer.endObject();

  if (metadata.morph_lineage.has_value()) {
    writer.field("morph_lineage", *metadata.morph_lineage);
    writer.optionalField("interpolation_factor", metadata.interpolation_factor);
  }
  writer.endObject();
}

std::string metadataToJson(const TemplateMetadata& metadata) {
  JsonWriter writer;
  writeMetadataJson(writer, metadata);
  return writer.toPrettyString();
}

}  // namespace symforge
