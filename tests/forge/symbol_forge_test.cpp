// Tests for forge/symbol_forge.h -- generation, edge cases, fallback, morph.

#include "forge/symbol_forge.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <future>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "core/pixel_utils.h"
#include "image/pgm_io.h"
#include "provenance/canonical_hash.h"
#include "test_helpers.h"

namespace symforge {
namespace {

/// @brief Generator that always reports a fixed error.
class BrokenGenerator : public ISymbolGenerator {
 public:
  SymbolType supportedType() const override { return SymbolType::Natural; }
  ForgeError generateRaw(Dimensions /*dims*/, std::optional<int32_t> /*seed*/,
                         Raster& /*out*/) const override {
    return ForgeError::MissingInput;
  }
};

std::unique_ptr<SymbolForge> makeForge(std::unique_ptr<IRasterSource> source = nullptr,
                                       ForgeConfig config = ForgeConfig()) {
  return std::make_unique<SymbolForge>(createDefaultGeneratorRegistry(),
                                       createDefaultValidatorChain(), std::move(source),
                                       std::move(config));
}

SymbolRequest requestFor(SymbolType type, std::vector<Dimensions> dims) {
  SymbolRequest request;
  request.type = type;
  request.dimensions = std::move(dims);
  return request;
}

const ValidationResult* findResult(const SymbolCapsule& capsule, const std::string& name) {
  for (const auto& result : capsule.validationResults()) {
    if (result.validatorName() == name) return &result;
  }
  return nullptr;
}

// ---------------------------------------------------------------------------
// Generation
// ---------------------------------------------------------------------------

TEST(SymbolForgeTest, TrebleWithDefaultsIsValid) {
  auto forge = makeForge();
  GenerateResult result = forge->generate(requestFor(SymbolType::Treble, {{64, 96}}));
  ASSERT_TRUE(result.success) << result.error_message;

  const SymbolCapsule& primary = result.capsules.primary();
  ASSERT_NE(primary.raster(), nullptr);
  EXPECT_TRUE(primary.isValid());
  EXPECT_EQ(primary.validationResults().size(), 3u);
  EXPECT_EQ(primary.metadata().template_name, "Treble_64x96");
  EXPECT_EQ(primary.metadata().provenance.method, PreprocessingMethod::Binarized);
  EXPECT_EQ(primary.metadata().template_hash, computeCanonicalHash(*primary.raster()));
  EXPECT_EQ(primary.metadata().capsule_id,
            "Treble_64x96-" + primary.metadata().template_hash.substr(0, 8));
  EXPECT_TRUE(checkMetadataIntegrity(primary.metadata()).isValid());
  EXPECT_EQ(primary.metrics().density_status, DensityStatus::Valid);
  EXPECT_TRUE(isStrictlyBinary(*primary.raster()));
}

TEST(SymbolForgeTest, DenseGlyphFailsDensity) {
  auto forge = makeForge();
  GenerateResult result = forge->generate(requestFor(SymbolType::Sharp, {{64, 64}}));
  ASSERT_TRUE(result.success);

  const SymbolCapsule& primary = result.capsules.primary();
  EXPECT_FALSE(primary.isValid());
  EXPECT_EQ(primary.metrics().density_status, DensityStatus::TooHigh);
  const ValidationResult* density = findResult(primary, kDensityValidatorName);
  ASSERT_NE(density, nullptr);
  EXPECT_FALSE(density->isValid());
}

TEST(SymbolForgeTest, OverrideBypassesDensity) {
  auto forge = makeForge();
  SymbolRequest request = requestFor(SymbolType::Sharp, {{64, 64}});
  request.validator_overrides[kDensityValidatorName] =
      ValidatorOverride{true, "Manual review approved"};

  ::testing::internal::CaptureStderr();
  GenerateResult result = forge->generate(request);
  std::string log = ::testing::internal::GetCapturedStderr();
  ASSERT_TRUE(result.success);

  const SymbolCapsule& primary = result.capsules.primary();
  EXPECT_TRUE(primary.isValid());
  const ValidationResult* density = findResult(primary, kDensityValidatorName);
  ASSERT_NE(density, nullptr);
  EXPECT_TRUE(density->isValid());
  EXPECT_EQ(density->failureMessage().value_or(""), "Overridden: Manual review approved");
  EXPECT_NE(log.find("Manual review approved"), std::string::npos);
}

TEST(SymbolForgeTest, GenerationIsDeterministic) {
  auto forge = makeForge();
  SymbolRequest request = requestFor(SymbolType::Treble, {{64, 96}});
  request.seed = 1234;
  GenerateResult first = forge->generate(request);
  GenerateResult second = forge->generate(request);
  ASSERT_TRUE(first.success);
  ASSERT_TRUE(second.success);
  EXPECT_EQ(first.capsules.primary().metadata().template_hash,
            second.capsules.primary().metadata().template_hash);
  EXPECT_EQ(*first.capsules.primary().raster(), *second.capsules.primary().raster());
  ASSERT_TRUE(first.capsules.primary().metadata().generation_seed.has_value());
  EXPECT_EQ(*first.capsules.primary().metadata().generation_seed, 1234);
}

TEST(SymbolForgeTest, HashesDifferAcrossKindsAndSizes) {
  auto forge = makeForge();
  GenerateResult flat = forge->generate(requestFor(SymbolType::Flat, {{32, 32}}));
  GenerateResult sharp = forge->generate(requestFor(SymbolType::Sharp, {{32, 32}}));
  GenerateResult larger = forge->generate(requestFor(SymbolType::Flat, {{48, 48}}));
  ASSERT_TRUE(flat.success && sharp.success && larger.success);
  EXPECT_NE(flat.capsules.primary().metadata().template_hash,
            sharp.capsules.primary().metadata().template_hash);
  EXPECT_NE(flat.capsules.primary().metadata().template_hash,
            larger.capsules.primary().metadata().template_hash);
}

TEST(SymbolForgeTest, PrimaryThenSizeVariantsThenEdgeCases) {
  auto forge = makeForge();
  SymbolRequest request = requestFor(SymbolType::Flat, {{32, 32}, {48, 48}});
  request.edge_cases = {EdgeCaseType::Rotated, EdgeCaseType::InkBleed};
  GenerateResult result = forge->generate(request);
  ASSERT_TRUE(result.success) << result.error_message;
  ASSERT_EQ(result.capsules.capsuleCount(), 4u);

  const SymbolCapsule& primary = result.capsules.primary();
  const auto& variants = result.capsules.variants();
  EXPECT_EQ(primary.metadata().template_name, "Flat_32x32");
  EXPECT_EQ(variants[0].metadata().template_name, "Flat_48x48");
  EXPECT_EQ(variants[1].metadata().template_name, "Flat_32x32_edge_Rotated");
  EXPECT_EQ(variants[2].metadata().template_name, "Flat_32x32_edge_InkBleed");

  EXPECT_EQ(variants[0].validationResults().size(), 3u);
  for (size_t idx = 1; idx < variants.size(); ++idx) {
    const SymbolCapsule& edge = variants[idx];
    ASSERT_NE(edge.raster(), nullptr);
    EXPECT_EQ(edge.metadata().provenance.method, PreprocessingMethod::Custom);
    EXPECT_TRUE(edge.validationResults().empty());
    EXPECT_EQ(edge.isValid(), primary.isValid());
    EXPECT_EQ(edge.metadata().template_hash, computeCanonicalHash(*edge.raster()));
    EXPECT_TRUE(checkMetadataIntegrity(edge.metadata()).isValid());
    EXPECT_NE(edge.metadata().template_hash, primary.metadata().template_hash);
  }
  EXPECT_GT(variants[1].raster()->width(), 32);
  EXPECT_EQ(variants[2].raster()->dimensions(), (Dimensions{32, 32}));
}

TEST(SymbolForgeTest, ClippedEdgeCaseCropsPrimary) {
  auto forge = makeForge();
  SymbolRequest request = requestFor(SymbolType::Natural, {{48, 64}});
  request.edge_cases = {EdgeCaseType::Clipped};
  GenerateResult result = forge->generate(request);
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.capsules.variants().size(), 1u);

  const Raster& primary = *result.capsules.primary().raster();
  const Raster& clipped = *result.capsules.variants()[0].raster();
  ASSERT_EQ(clipped.dimensions(), (Dimensions{28, 44}));
  EXPECT_EQ(clipped.at(0, 0), primary.at(10, 10));
  EXPECT_EQ(clipped.at(27, 43), primary.at(37, 53));
}

TEST(SymbolForgeTest, OutputFormsSelectMethod) {
  auto forge = makeForge();

  SymbolRequest raw = requestFor(SymbolType::Flat, {{32, 32}});
  raw.output_forms = {OutputForm::Raw};
  GenerateResult raw_result = forge->generate(raw);

  SymbolRequest skeleton = requestFor(SymbolType::Flat, {{32, 32}});
  skeleton.output_forms = {OutputForm::Binarized, OutputForm::Skeletonized};
  GenerateResult skeleton_result = forge->generate(skeleton);

  GenerateResult binary_result = forge->generate(requestFor(SymbolType::Flat, {{32, 32}}));

  ASSERT_TRUE(raw_result.success && skeleton_result.success && binary_result.success);
  EXPECT_EQ(raw_result.capsules.primary().metadata().provenance.method,
            PreprocessingMethod::Raw);
  EXPECT_EQ(skeleton_result.capsules.primary().metadata().provenance.method,
            PreprocessingMethod::Skeletonized);
  EXPECT_LT(countInkPixels(*skeleton_result.capsules.primary().raster()),
            countInkPixels(*binary_result.capsules.primary().raster()));
}

// ---------------------------------------------------------------------------
// Failures and fallback
// ---------------------------------------------------------------------------

TEST(SymbolForgeTest, EmptyRequestIsRejected) {
  auto forge = makeForge();
  GenerateResult result = forge->generate(requestFor(SymbolType::Flat, {}));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, ForgeError::EmptyRequest);
}

TEST(SymbolForgeTest, InvalidDimensionsAreRejected) {
  auto forge = makeForge();
  GenerateResult result = forge->generate(requestFor(SymbolType::Flat, {{32, 32}, {0, 16}}));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, ForgeError::InvalidDimensions);
  EXPECT_TRUE(result.capsules.primary().isDisposed());
}

TEST(SymbolForgeTest, UnclippableEdgeCaseAbortsAndDisposes) {
  auto forge = makeForge();
  SymbolRequest request = requestFor(SymbolType::Flat, {{20, 20}, {40, 40}});
  request.edge_cases = {EdgeCaseType::Rotated, EdgeCaseType::Clipped};

  ::testing::internal::CaptureStderr();
  GenerateResult result = forge->generate(request);
  std::string log = ::testing::internal::GetCapturedStderr();

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, ForgeError::InvalidDimensions);
  EXPECT_FALSE(result.error_message.empty());
  EXPECT_TRUE(result.capsules.primary().isDisposed());
  EXPECT_TRUE(result.capsules.variants().empty());
  EXPECT_NE(log.find("disposed 3 capsule(s)"), std::string::npos);
}

TEST(SymbolForgeTest, GeneratorErrorAbortsRequest) {
  GeneratorRegistry registry;
  registry.add(std::make_unique<BrokenGenerator>());
  SymbolForge forge(std::move(registry), createDefaultValidatorChain(), nullptr, ForgeConfig());

  ::testing::internal::CaptureStderr();
  GenerateResult result = forge.generate(requestFor(SymbolType::Natural, {{32, 32}}));
  ::testing::internal::GetCapturedStderr();
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, ForgeError::MissingInput);
}

TEST(SymbolForgeTest, MissingGeneratorYieldsFallbackCapsule) {
  SymbolForge forge(GeneratorRegistry(), createDefaultValidatorChain(), nullptr, ForgeConfig());

  ::testing::internal::CaptureStderr();
  GenerateResult result = forge.generate(requestFor(SymbolType::Treble, {{16, 24}}));
  ::testing::internal::GetCapturedStderr();
  ASSERT_TRUE(result.success);

  const SymbolCapsule& fallback = result.capsules.primary();
  EXPECT_FALSE(fallback.isValid());
  ASSERT_EQ(fallback.validationResults().size(), 1u);
  EXPECT_EQ(fallback.validationResults()[0].validatorName(), kFallbackHandlerName);
  EXPECT_FALSE(fallback.validationResults()[0].isValid());
  EXPECT_EQ(fallback.metadata().template_name, "Treble-fallback");
  EXPECT_EQ(fallback.metadata().provenance.method, PreprocessingMethod::Raw);
  ASSERT_NE(fallback.raster(), nullptr);
  EXPECT_EQ(fallback.raster()->dimensions(), (Dimensions{16, 24}));
  EXPECT_EQ(countInkPixels(*fallback.raster()), 0u);
  EXPECT_FALSE(isPlaceholderHash(fallback.metadata().template_hash));
  EXPECT_TRUE(checkMetadataIntegrity(fallback.metadata()).isValid());
}

// ---------------------------------------------------------------------------
// Morph
// ---------------------------------------------------------------------------

class SymbolForgeMorphTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto source = std::make_unique<test_helpers::MemoryRasterSource>();
    source->put(SymbolType::Flat, "printed", test_helpers::rasterWithInk(10, 10, 10));
    source->put(SymbolType::Flat, "handwritten", test_helpers::rasterWithInk(10, 10, 10));
    source->put(SymbolType::Flat, "wide", Raster(20, 10));
    forge_ = makeForge(std::move(source));
  }

  static MorphRequest request(const std::string& from, const std::string& to) {
    MorphRequest req;
    req.type = SymbolType::Flat;
    req.from_style = from;
    req.to_style = to;
    req.interpolation_factor = 0.25;
    return req;
  }

  std::unique_ptr<SymbolForge> forge_;
};

TEST_F(SymbolForgeMorphTest, MorphBuildsLineageAndValidates) {
  MorphResult result = forge_->morph(request("printed", "handwritten"));
  ASSERT_TRUE(result.success) << result.error_message;

  const SymbolCapsule& capsule = result.capsule;
  ASSERT_NE(capsule.raster(), nullptr);
  EXPECT_EQ(*capsule.raster(), test_helpers::rasterWithInk(10, 10, 10));
  EXPECT_TRUE(capsule.isValid());
  EXPECT_EQ(capsule.validationResults().size(), 3u);

  const TemplateMetadata& meta = capsule.metadata();
  EXPECT_EQ(meta.template_name, "Flat_morph_printed_to_handwritten");
  EXPECT_EQ(meta.provenance.source_image, "printed + handwritten");
  EXPECT_EQ(meta.provenance.method, PreprocessingMethod::Custom);
  ASSERT_TRUE(meta.morph_lineage.has_value());
  EXPECT_EQ(*meta.morph_lineage, "Flat:printed -> Flat:handwritten");
  ASSERT_TRUE(meta.interpolation_factor.has_value());
  EXPECT_DOUBLE_EQ(*meta.interpolation_factor, 0.25);
  EXPECT_EQ(meta.template_hash, computeCanonicalHash(*capsule.raster()));
  EXPECT_TRUE(checkMetadataIntegrity(meta).isValid());
}

TEST_F(SymbolForgeMorphTest, MissingStyleIsSourceNotFound) {
  ::testing::internal::CaptureStderr();
  MorphResult result = forge_->morph(request("printed", "gothic"));
  ::testing::internal::GetCapturedStderr();
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, ForgeError::SourceNotFound);
  EXPECT_TRUE(result.capsule.isDisposed());
}

TEST_F(SymbolForgeMorphTest, FactorIsCheckedBeforeLoading) {
  MorphRequest req = request("absent", "also-absent");
  req.interpolation_factor = 1.5;
  ::testing::internal::CaptureStderr();
  MorphResult result = forge_->morph(req);
  ::testing::internal::GetCapturedStderr();
  EXPECT_EQ(result.error, ForgeError::OutOfRange);
}

TEST_F(SymbolForgeMorphTest, FactorIgnoredByMultiply) {
  MorphRequest req = request("printed", "handwritten");
  req.blend_mode = BlendMode::Multiply;
  req.interpolation_factor = 7.0;
  MorphResult result = forge_->morph(req);
  EXPECT_TRUE(result.success) << result.error_message;
}

TEST_F(SymbolForgeMorphTest, SizeMismatchIsReported) {
  ::testing::internal::CaptureStderr();
  MorphResult result = forge_->morph(request("printed", "wide"));
  ::testing::internal::GetCapturedStderr();
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, ForgeError::DimensionMismatch);
}

TEST_F(SymbolForgeMorphTest, AsyncMorphMatchesSync) {
  std::future<MorphResult> pending = forge_->morphAsync(request("printed", "handwritten"));
  MorphResult async_result = pending.get();
  MorphResult sync_result = forge_->morph(request("printed", "handwritten"));
  ASSERT_TRUE(async_result.success);
  EXPECT_EQ(async_result.capsule.metadata().template_hash,
            sync_result.capsule.metadata().template_hash);
}

TEST(SymbolForgeTest, MorphWithoutSourceFails) {
  auto forge = makeForge();
  MorphRequest req;
  req.from_style = "a";
  req.to_style = "b";
  ::testing::internal::CaptureStderr();
  MorphResult result = forge->morph(req);
  ::testing::internal::GetCapturedStderr();
  EXPECT_EQ(result.error, ForgeError::SourceNotFound);
}

TEST(SymbolForgeTest, DefaultForgeMorphsFromAssetTree) {
  namespace fs = std::filesystem;
  std::string root = test_helpers::tempPath("symbol_forge_test_assets");
  fs::create_directories(root + "/Snapshots/Sharp");
  Raster light(12, 12);
  Raster dark(12, 12, kInkValue);
  ASSERT_TRUE(writePgm(root + "/Snapshots/Sharp/light.pgm", light));
  ASSERT_TRUE(writePgm(root + "/Snapshots/Sharp/dark.pgm", dark));

  ForgeConfig config;
  config.asset_root = root;
  auto forge = makeDefaultForge(config);
  ASSERT_NE(forge, nullptr);

  MorphRequest req;
  req.type = SymbolType::Sharp;
  req.from_style = "light";
  req.to_style = "dark";
  req.interpolation_factor = 0.5;
  MorphResult result = forge->morph(req);
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.capsule.raster()->at(5, 5), 128);
  EXPECT_FALSE(result.capsule.isValid());

  std::error_code ignored;
  fs::remove_all(root, ignored);
}

TEST(SymbolForgeTest, InvalidConfigYieldsNoForge) {
  ForgeConfig config;
  config.density_min = 0.5;
  config.density_max = 0.1;
  ::testing::internal::CaptureStderr();
  EXPECT_EQ(makeDefaultForge(config), nullptr);
  ::testing::internal::GetCapturedStderr();
}

// ---------------------------------------------------------------------------
// Concurrency
// ---------------------------------------------------------------------------

TEST(SymbolForgeTest, ConcurrentGenerationIsConsistent) {
  auto forge = makeForge();
  SymbolRequest request = requestFor(SymbolType::Treble, {{48, 72}});
  request.seed = 7;
  request.edge_cases = {EdgeCaseType::InkBleed};

  GenerateResult reference = forge->generate(request);
  ASSERT_TRUE(reference.success);
  std::string expected_hash = reference.capsules.primary().metadata().template_hash;

  std::vector<std::future<GenerateResult>> pending;
  for (int idx = 0; idx < 100; ++idx) {
    pending.push_back(std::async(std::launch::async,
                                 [&forge, &request]() { return forge->generate(request); }));
  }
  for (auto& future : pending) {
    GenerateResult result = future.get();
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.capsules.primary().metadata().template_hash, expected_hash);
    EXPECT_EQ(result.capsules.capsuleCount(), 2u);
  }
}

TEST(SymbolForgeTest, ConcurrentDistinctRequestsYieldDistinctHashes) {
  auto forge = makeForge();
  std::vector<std::future<GenerateResult>> pending;
  for (int idx = 0; idx < 100; ++idx) {
    SymbolRequest request =
        requestFor(SymbolType::Natural, {{32 + idx % 10, 32 + idx / 10}});
    pending.push_back(std::async(std::launch::async, [&forge, request]() {
      return forge->generate(request);
    }));
  }

  std::set<std::string> hashes;
  for (auto& future : pending) {
    GenerateResult result = future.get();
    ASSERT_TRUE(result.success) << result.error_message;
    hashes.insert(result.capsules.primary().metadata().template_hash);
  }
  EXPECT_EQ(hashes.size(), 100u);
}

}  // namespace
}  // namespace symforge
