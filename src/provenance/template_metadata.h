// Capsule metadata records, the copy-and-patch builder that produces them,
// and their integrity check and JSON form.

#ifndef SYMFORGE_PROVENANCE_TEMPLATE_METADATA_H
#define SYMFORGE_PROVENANCE_TEMPLATE_METADATA_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "core/basic_types.h"
#include "core/json_helpers.h"
#include "provenance/canonical_hash.h"
#include "validation/validation_result.h"

namespace symforge {

/// @brief Where a raster came from and what was done to it.
struct ProvenanceMetadata {
  std::string source_image;  ///< Source description (generator name, morph inputs).
  PreprocessingMethod method = PreprocessingMethod::Raw;
  std::string validation_date;  ///< ISO-8601 UTC, e.g. "2024-05-01T12:00:00Z".
  std::string validated_by;
  std::optional<std::string> notes;
};

/// @brief Identity and provenance of one capsule.
///
/// Once finalized, capsule_id == template_name + "-" + template_hash[0:8]
/// and template_hash is never a placeholder.
struct TemplateMetadata {
  std::string template_name;
  std::string generated_by;
  std::string template_hash = kPendingHash;
  std::string capsule_id;
  std::optional<int32_t> generation_seed;
  ProvenanceMetadata provenance;

  // Morph-only fields.
  std::optional<std::string> morph_lineage;
  std::optional<double> interpolation_factor;
};

/// @brief Format "{template_name}-{first 8 hash chars}".
std::string makeCapsuleId(const std::string& template_name, const std::string& hash);

/// @brief Format a time point as ISO-8601 UTC with second precision.
std::string formatUtcTimestamp(std::chrono::system_clock::time_point when);

// ---------------------------------------------------------------------------
// Copy-and-patch builder
// ---------------------------------------------------------------------------

/// @brief Builds TemplateMetadata values without mutating a shared record.
///
/// The builder starts from a copy of a base record; each setter patches the
/// copy. finalize() sets the hash and capsule id last and returns a new
/// value, leaving the builder reusable.
///
/// @code
///   TemplateMetadata meta = MetadataBuilder(base)
///                               .templateName("Flat_32x32")
///                               .method(PreprocessingMethod::Skeletonized)
///                               .finalize(hash);
/// @endcode
class MetadataBuilder {
 public:
  MetadataBuilder() = default;
  explicit MetadataBuilder(const TemplateMetadata& base) : draft_(base) {}

  MetadataBuilder& templateName(std::string name);
  MetadataBuilder& generatedBy(std::string identity);
  MetadataBuilder& generationSeed(std::optional<int32_t> seed);
  MetadataBuilder& sourceImage(std::string source);
  MetadataBuilder& method(PreprocessingMethod method);
  MetadataBuilder& validationDate(std::string date);
  MetadataBuilder& validatedBy(std::string identity);
  MetadataBuilder& notes(std::optional<std::string> notes);
  MetadataBuilder& morphLineage(std::string lineage, double interpolation_factor);

  /// @brief Current draft; hash and id are whatever the base carried.
  const TemplateMetadata& draft() const { return draft_; }

  /// @brief Copy of the draft with hash and capsule id set.
  TemplateMetadata finalize(const std::string& hash) const;

 private:
  TemplateMetadata draft_;
};

// ---------------------------------------------------------------------------
// Integrity and serialization
// ---------------------------------------------------------------------------

/// Name reported by checkMetadataIntegrity().
constexpr const char* kTemplateValidatorName = "Template Validator";

/// @brief Check a finalized record before it is handed to persistence.
///
/// Fails when the name is empty or a generic placeholder ("default",
/// "unknown"), generated-by is empty, the hash is empty or a placeholder,
/// the capsule id does not match name and hash, or provenance source or
/// validator identity is empty. The first failing rule is reported.
ValidationResult checkMetadataIntegrity(const TemplateMetadata& metadata);

/// @brief Write a metadata record as a JSON object into an open writer.
void writeMetadataJson(JsonWriter& writer, const TemplateMetadata& metadata);

/// @brief Serialize a metadata record as a standalone JSON document.
std::string metadataToJson(const TemplateMetadata& metadata);

}  // namespace symforge

#endif  // SYMFORGE_PROVENANCE_TEMPLATE_METADATA_H
