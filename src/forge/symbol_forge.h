// Forge orchestrator: turns symbol and morph requests into validated,
// hash-finalized capsules.

#ifndef SYMFORGE_FORGE_SYMBOL_FORGE_H
#define SYMFORGE_FORGE_SYMBOL_FORGE_H

#include <future>
#include <memory>
#include <string>
#include <vector>

#include "capsule/symbol_capsule.h"
#include "forge/forge_config.h"
#include "forge/raster_source.h"
#include "forge/requests.h"
#include "generators/generator_registry.h"
#include "image/preprocessing_step.h"
#include "validation/validator_chain.h"

namespace symforge {

/// Validator name carried by the single result of a fallback capsule.
constexpr const char* kFallbackHandlerName = "FallbackHandler";

/// @brief Generation and morph pipeline.
///
/// Per requested size, in request order:
///   generator lookup -> raw generation -> preprocessing -> validation
///   -> hash -> metadata finalization
/// followed by one derived capsule per requested edge case, built from the
/// finalized primary raster.
///
/// A missing generator yields an invalid fallback capsule for that size
/// rather than an error. Any error after the first capsule exists disposes
/// every capsule built for the request before the failure is returned.
///
/// All members are read-only after construction, so one instance may serve
/// concurrent generate()/morph() calls without locking.
class SymbolForge {
 public:
  /// @param generators Generators by symbol kind.
  /// @param validators Chain run on every generated and morphed capsule.
  /// @param source Source of morph inputs (may be null: morphs then fail
  ///        with SourceNotFound).
  /// @param config Edge-case parameters and logging verbosity.
  SymbolForge(GeneratorRegistry generators, ValidatorChain validators,
              std::unique_ptr<IRasterSource> source, ForgeConfig config);

  SymbolForge(const SymbolForge&) = delete;
  SymbolForge& operator=(const SymbolForge&) = delete;

  /// @brief Generate the primary capsule, size variants and edge cases.
  GenerateResult generate(const SymbolRequest& request) const;

  /// @brief Blend two stored styles into one validated capsule.
  MorphResult morph(const MorphRequest& request) const;

  /// @brief Run morph() on another thread.
  /// The forge must outlive the returned future.
  std::future<MorphResult> morphAsync(MorphRequest request) const;

  const ForgeConfig& config() const { return config_; }
  const GeneratorRegistry& generators() const { return generators_; }
  const ValidatorChain& validators() const { return validators_; }

 private:
  /// @brief Build the capsule for one requested size.
  ForgeError buildSizeCapsule(const SymbolRequest& request, const PreprocessingPlan& plan,
                              Dimensions dims, SymbolCapsule& out,
                              std::string& error_message) const;

  /// @brief Invalid blank capsule used when no generator exists.
  SymbolCapsule buildFallbackCapsule(const SymbolRequest& request, Dimensions dims,
                                     const std::string& reason) const;

  /// @brief Derive one edge-case sibling from the finalized primary.
  ForgeError deriveEdgeCase(const SymbolCapsule& primary, EdgeCaseType kind,
                            SymbolCapsule& out, std::string& error_message) const;

  /// @brief Validate, hash and finalize a processed raster.
  SymbolCapsule finalizeCapsule(Raster raster, const MetadataBuilder& builder,
                                const OverrideMap& overrides) const;

  GeneratorRegistry generators_;
  ValidatorChain validators_;
  std::unique_ptr<IRasterSource> source_;
  ForgeConfig config_;
  BinarizeStep binarize_;
  SkeletonizeStep skeletonize_;
};

/// @brief Composition root: built-in generators, default validator chain
/// with the configured density bounds, and a FileRasterSource on
/// config.asset_root.
/// @return nullptr (with a logged reason) if the config fails validation.
std::unique_ptr<SymbolForge> makeDefaultForge(const ForgeConfig& config = ForgeConfig());

}  // namespace symforge

#endif  // SYMFORGE_FORGE_SYMBOL_FORGE_H
