/// @file
/// @brief Forge orchestrator: generation state machine, fallback, edge-case
/// derivation and morph.

#include "forge/symbol_forge.h"

#include <chrono>
#include <cstdio>
#include <utility>

#include "core/version.h"
#include "image/raster_transform.h"
#include "provenance/canonical_hash.h"

namespace symforge {

namespace {

std::string nowTimestamp() {
  return formatUtcTimestamp(std::chrono::system_clock::now());
}

/// @brief Dispose every capsule built so far and build the failure result.
GenerateResult abortGeneration(std::vector<SymbolCapsule>& built, ForgeError error,
                               const std::string& message) {
  size_t disposed = 0;
  for (auto& capsule : built) {
    if (!capsule.isDisposed()) ++disposed;
    capsule.dispose();
  }
  std::fprintf(stderr, "[SymbolForge] ERROR: generation aborted (%s): %s; disposed %zu capsule(s)\n",
               forgeErrorToString(error), message.c_str(), disposed);

  GenerateResult result;
  result.success = false;
  result.error = error;
  result.error_message = message;
  return result;
}

MorphResult morphFailure(ForgeError error, const std::string& message) {
  std::fprintf(stderr, "[SymbolForge] ERROR: morph failed (%s): %s\n",
               forgeErrorToString(error), message.c_str());
  MorphResult result;
  result.success = false;
  result.error = error;
  result.error_message = message;
  return result;
}

bool usesFactor(BlendMode mode) {
  return mode == BlendMode::Linear || mode == BlendMode::Alpha;
}

}  // namespace

SymbolForge::SymbolForge(GeneratorRegistry generators, ValidatorChain validators,
                         std::unique_ptr<IRasterSource> source, ForgeConfig config)
    : generators_(std::move(generators)),
      validators_(std::move(validators)),
      source_(std::move(source)),
      config_(std::move(config)) {}

// ---------------------------------------------------------------------------
// Generation
// ---------------------------------------------------------------------------

GenerateResult SymbolForge::generate(const SymbolRequest& request) const {
  std::vector<SymbolCapsule> built;

  if (request.dimensions.empty()) {
    return abortGeneration(built, ForgeError::EmptyRequest, "request has no dimensions");
  }
  for (const auto& dims : request.dimensions) {
    if (!dims.isValid()) {
      return abortGeneration(built, ForgeError::InvalidDimensions,
                             "invalid dimensions " + dimensionsToString(dims));
    }
  }

  if (config_.verbose) {
    std::fprintf(stderr, "[SymbolForge] generate %s: %zu size(s), %zu edge case(s)\n",
                 symbolTypeToString(request.type), request.dimensions.size(),
                 request.edge_cases.size());
  }

  PreprocessingPlan plan = planPreprocessing(request.output_forms, binarize_, skeletonize_);
  built.reserve(request.dimensions.size() + request.edge_cases.size());

  // Primary first, then size variants.
  for (const auto& dims : request.dimensions) {
    SymbolCapsule capsule;
    std::string message;
    ForgeError err = buildSizeCapsule(request, plan, dims, capsule, message);
    if (err != ForgeError::None) return abortGeneration(built, err, message);
    built.push_back(std::move(capsule));
  }

  // Edge cases read the finalized primary.
  for (EdgeCaseType kind : request.edge_cases) {
    if (config_.verbose) {
      std::fprintf(stderr, "[SymbolForge] deriving edge case %s\n", edgeCaseTypeToString(kind));
    }
    SymbolCapsule capsule;
    std::string message;
    ForgeError err = deriveEdgeCase(built.front(), kind, capsule, message);
    if (err != ForgeError::None) return abortGeneration(built, err, message);
    built.push_back(std::move(capsule));
  }

  GenerateResult result;
  result.success = true;
  result.capsules = SymbolCapsuleSet(std::move(built.front()));
  for (size_t idx = 1; idx < built.size(); ++idx) {
    result.capsules.addVariant(std::move(built[idx]));
  }
  return result;
}

ForgeError SymbolForge::buildSizeCapsule(const SymbolRequest& request,
                                         const PreprocessingPlan& plan, Dimensions dims,
                                         SymbolCapsule& out,
                                         std::string& error_message) const {
  const char* type_name = symbolTypeToString(request.type);
  const ISymbolGenerator* generator = generators_.find(request.type);
  if (generator == nullptr) {
    std::string reason = std::string("No generator registered for symbol type ") + type_name;
    std::fprintf(stderr, "[SymbolForge] WARNING: %s at %s; returning fallback capsule\n",
                 reason.c_str(), dimensionsToString(dims).c_str());
    out = buildFallbackCapsule(request, dims, reason);
    return ForgeError::None;
  }

  Raster raw;
  ForgeError err = generator->generateRaw(dims, request.seed, raw);
  if (err != ForgeError::None) {
    error_message = std::string(type_name) + " generator failed at " +
                    dimensionsToString(dims) + ": " + forgeErrorToString(err);
    return err;
  }

  MetadataBuilder builder;
  builder.templateName(std::string(type_name) + "_" + dimensionsToString(dims))
      .generatedBy(kGeneratorIdentity)
      .generationSeed(request.seed)
      .sourceImage("synthetic-generation")
      .method(plan.method)
      .validationDate(nowTimestamp())
      .validatedBy(kValidatorIdentity)
      .notes(std::string("Synthetically generated ") + type_name + " symbol");

  out = finalizeCapsule(applyPreprocessing(plan, raw), builder, request.validator_overrides);
  return ForgeError::None;
}

SymbolCapsule SymbolForge::buildFallbackCapsule(const SymbolRequest& request, Dimensions dims,
                                                const std::string& reason) const {
  auto raster = std::make_unique<Raster>(dims.width, dims.height, kBackgroundValue);
  QualityMetrics metrics = initialMetrics(*raster);

  TemplateMetadata metadata =
      MetadataBuilder()
          .templateName(std::string(symbolTypeToString(request.type)) + "-fallback")
          .generatedBy(kGeneratorIdentity)
          .generationSeed(request.seed)
          .sourceImage("fallback-generation")
          .method(PreprocessingMethod::Raw)
          .validationDate(nowTimestamp())
          .validatedBy(kValidatorIdentity)
          .notes("Fallback capsule due to generation failure: " + reason)
          .finalize(computeCanonicalHash(*raster));

  std::vector<ValidationResult> results;
  results.push_back(ValidationResult::fail(kFallbackHandlerName, reason));
  return SymbolCapsule(std::move(raster), std::move(metadata), metrics, false,
                       std::move(results));
}

ForgeError SymbolForge::deriveEdgeCase(const SymbolCapsule& primary, EdgeCaseType kind,
                                       SymbolCapsule& out, std::string& error_message) const {
  const Raster* source = primary.raster();
  if (source == nullptr) {
    error_message = "primary capsule has no raster to derive edge cases from";
    return ForgeError::MissingInput;
  }

  Raster derived;
  switch (kind) {
    case EdgeCaseType::Rotated:
      derived = rotateRaster(*source, config_.edge_rotation_degrees);
      break;
    case EdgeCaseType::Clipped: {
      ForgeError err = cropRaster(*source, config_.edge_crop_margin, config_.edge_crop_margin,
                                  derived);
      if (err != ForgeError::None) {
        error_message = "cannot clip " + dimensionsToString(source->dimensions()) +
                        " by a margin of " + std::to_string(config_.edge_crop_margin);
        return err;
      }
      break;
    }
    case EdgeCaseType::InkBleed:
      derived = gaussianBlur(*source, config_.edge_blur_sigma);
      break;
  }

  const TemplateMetadata& base = primary.metadata();
  std::string hash = computeCanonicalHash(derived);
  TemplateMetadata metadata =
      MetadataBuilder(base)
          .templateName(base.template_name + "_edge_" + edgeCaseTypeToString(kind))
          .method(PreprocessingMethod::Custom)
          .notes(std::string(edgeCaseTypeToString(kind)) + " edge case derived from " +
                 base.capsule_id + "; not re-validated")
          .finalize(hash);

  auto raster = std::make_unique<Raster>(std::move(derived));
  QualityMetrics metrics = initialMetrics(*raster);
  out = SymbolCapsule(std::move(raster), std::move(metadata), metrics, primary.isValid(), {});
  return ForgeError::None;
}

SymbolCapsule SymbolForge::finalizeCapsule(Raster raster, const MetadataBuilder& builder,
                                           const OverrideMap& overrides) const {
  QualityMetrics metrics = initialMetrics(raster);
  SymbolCapsule provisional(std::make_unique<Raster>(std::move(raster)), builder.draft(),
                            metrics, false, {});
  ChainOutcome outcome = validators_.run(&provisional, metrics, overrides);

  // Hash and id are patched in only after the output raster is final.
  std::unique_ptr<Raster> owned = provisional.releaseRaster();
  TemplateMetadata metadata = builder.finalize(computeCanonicalHash(*owned));

  ValidationResult integrity = checkMetadataIntegrity(metadata);
  if (!integrity.isValid()) {
    std::fprintf(stderr, "[SymbolForge] WARNING: metadata integrity check failed for %s: %s\n",
                 metadata.template_name.c_str(), integrity.failureMessage().value_or("").c_str());
  }

  return SymbolCapsule(std::move(owned), std::move(metadata), metrics, outcome.is_valid,
                       std::move(outcome.results));
}

// ---------------------------------------------------------------------------
// Morph
// ---------------------------------------------------------------------------

MorphResult SymbolForge::morph(const MorphRequest& request) const {
  const char* type_name = symbolTypeToString(request.type);
  double factor = request.interpolation_factor;
  if (usesFactor(request.blend_mode) && !(factor >= 0.0 && factor <= 1.0)) {
    return morphFailure(ForgeError::OutOfRange,
                        "interpolation factor " + std::to_string(factor) + " is outside [0, 1]");
  }

  if (config_.verbose) {
    std::fprintf(stderr, "[SymbolForge] morph %s: %s -> %s (%s)\n", type_name,
                 request.from_style.c_str(), request.to_style.c_str(),
                 blendModeToString(request.blend_mode));
  }

  Raster from;
  Raster to;
  const std::string* styles[] = {&request.from_style, &request.to_style};
  Raster* targets[] = {&from, &to};
  for (int idx = 0; idx < 2; ++idx) {
    ForgeError err = source_ ? source_->load(request.type, *styles[idx], *targets[idx])
                             : ForgeError::SourceNotFound;
    if (err != ForgeError::None) {
      return morphFailure(err, std::string("cannot load source ") + type_name + "/" +
                                   *styles[idx]);
    }
  }

  Raster blended;
  ForgeError err = blendRasters(request.blend_mode, &from, &to, factor, blended);
  if (err != ForgeError::None) {
    return morphFailure(err, std::string(blendModeToString(request.blend_mode)) +
                                 " blend of " + dimensionsToString(from.dimensions()) +
                                 " and " + dimensionsToString(to.dimensions()) + " failed");
  }

  char factor_buf[32];
  std::snprintf(factor_buf, sizeof(factor_buf), "%g", factor);

  MetadataBuilder builder;
  builder.templateName(std::string(type_name) + "_morph_" + request.from_style + "_to_" +
                       request.to_style)
      .generatedBy(kGeneratorIdentity)
      .sourceImage(request.from_style + " + " + request.to_style)
      .method(PreprocessingMethod::Custom)
      .validationDate(nowTimestamp())
      .validatedBy(kValidatorIdentity)
      .notes(std::string("Morphed with ") + blendModeToString(request.blend_mode) +
             " blend (factor: " + factor_buf + ")")
      .morphLineage(std::string(type_name) + ":" + request.from_style + " -> " + type_name +
                        ":" + request.to_style,
                    factor);

  MorphResult result;
  result.success = true;
  result.capsule = finalizeCapsule(std::move(blended), builder, request.validator_overrides);
  return result;
}

std::future<MorphResult> SymbolForge::morphAsync(MorphRequest request) const {
  return std::async(std::launch::async,
                    [this, request = std::move(request)]() { return morph(request); });
}

// ---------------------------------------------------------------------------
// Composition root
// ---------------------------------------------------------------------------

std::unique_ptr<SymbolForge> makeDefaultForge(const ForgeConfig& config) {
  std::string error;
  if (validateForgeConfig(config, error) != ForgeError::None) {
    std::fprintf(stderr, "[SymbolForge] ERROR: invalid configuration: %s\n", error.c_str());
    return nullptr;
  }
  return std::make_unique<SymbolForge>(
      createDefaultGeneratorRegistry(),
      createDefaultValidatorChain(config.density_min, config.density_max),
      std::make_unique<FileRasterSource>(config.asset_root), config);
}

}  // namespace symforge
