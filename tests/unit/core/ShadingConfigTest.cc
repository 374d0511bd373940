#include "strata/core/ShadingConfig.hh"

#include "strata/core/ChunkPipeline.hh"

#include <gtest/gtest.h>

#include <string>

using namespace strata;

TEST(ShadingConfigTest, EmptyDocumentGivesDefaults) {
    auto config = parseShadingConfigString("");
    ASSERT_TRUE(config.isOk()) << config.message();

    const ShadingConfig& c = config.value();
    EXPECT_EQ(c.pipeline, PipelineKey{});
    EXPECT_FLOAT_EQ(c.material.reflectance, 0.5f);
    EXPECT_FLOAT_EQ(c.material.perceptualRoughness, 1.0f);
    EXPECT_FLOAT_EQ(c.material.metallic, 0.01f);
    EXPECT_EQ(c.material.alphaMode, AlphaMode::Opaque);
    EXPECT_TRUE(c.lighting.directionalLights.empty());
    EXPECT_FLOAT_EQ(c.lighting.exposure, 1.0f);
    EXPECT_TRUE(c.lighting.tonemap);
}

TEST(ShadingConfigTest, ParsesEverySection) {
    auto config = parseShadingConfigString(R"(
        [pipeline]
        pass = "deferred_prepass"
        normal_prepass = true
        depth_clamp_ortho = true

        [material]
        reflectance = 0.25
        perceptual_roughness = 0.6
        metallic = 0
        alpha_mode = "premultiplied"

        [lighting]
        ambient_color = [0.5, 0.5, 1.0]
        ambient_brightness = 0.2
        exposure = 1.5
        tonemap = false

        [[lighting.directional]]
        direction = [0.0, 2.0, 0.0]
        color = [1.0, 0.9, 0.8]
        intensity = 4

        [[lighting.directional]]
        direction = [1.0, 0.0, 0.0]
    )");
    ASSERT_TRUE(config.isOk()) << config.message();
    const ShadingConfig& c = config.value();

    EXPECT_EQ(c.pipeline.pass, ShadingPass::DeferredPrepass);
    EXPECT_TRUE(c.pipeline.normalPrepass);
    EXPECT_TRUE(c.pipeline.depthClampOrtho);
    EXPECT_FALSE(c.pipeline.loadPrepassNormals);

    EXPECT_FLOAT_EQ(c.material.reflectance, 0.25f);
    EXPECT_FLOAT_EQ(c.material.perceptualRoughness, 0.6f);
    EXPECT_FLOAT_EQ(c.material.metallic, 0.0f);
    EXPECT_EQ(c.material.alphaMode, AlphaMode::Premultiplied);

    EXPECT_FLOAT_EQ(c.lighting.ambientColor.z, 1.0f);
    EXPECT_FLOAT_EQ(c.lighting.ambientBrightness, 0.2f);
    EXPECT_FLOAT_EQ(c.lighting.exposure, 1.5f);
    EXPECT_FALSE(c.lighting.tonemap);

    ASSERT_EQ(c.lighting.directionalLights.size(), 2u);
    // Directions are normalized on load
    EXPECT_FLOAT_EQ(c.lighting.directionalLights[0].direction.y, 1.0f);
    EXPECT_FLOAT_EQ(c.lighting.directionalLights[0].intensity, 4.0f);
    EXPECT_FLOAT_EQ(c.lighting.directionalLights[0].color.z, 0.8f);
    EXPECT_FLOAT_EQ(c.lighting.directionalLights[1].intensity, 1.0f);

    EXPECT_TRUE(ChunkPipeline::specialize(c.pipeline).isOk());
}

TEST(ShadingConfigTest, UnknownPassNamesKey) {
    auto config = parseShadingConfigString("[pipeline]\npass = \"shadow\"", "bad.toml");
    ASSERT_TRUE(config.isError());
    EXPECT_EQ(config.code(), ErrorCode::InvalidState);
    EXPECT_NE(config.message().find("bad.toml"), std::string::npos);
    EXPECT_NE(config.message().find("pipeline.pass"), std::string::npos);
}

TEST(ShadingConfigTest, MaterialScalarsMustBeUnitRange) {
    auto config = parseShadingConfigString("[material]\nmetallic = 1.5");
    ASSERT_TRUE(config.isError());
    EXPECT_EQ(config.code(), ErrorCode::OutOfRange);
    EXPECT_NE(config.message().find("material.metallic"), std::string::npos);
}

TEST(ShadingConfigTest, WrongTypeReported) {
    auto config = parseShadingConfigString("[material]\nreflectance = \"shiny\"");
    EXPECT_EQ(config.code(), ErrorCode::TypeMismatch);

    auto flag = parseShadingConfigString("[pipeline]\nnormal_prepass = 1");
    EXPECT_EQ(flag.code(), ErrorCode::TypeMismatch);
}

TEST(ShadingConfigTest, LightValidation) {
    auto zero = parseShadingConfigString("[[lighting.directional]]\ndirection = [0, 0, 0]");
    EXPECT_EQ(zero.code(), ErrorCode::OutOfRange);
    EXPECT_NE(zero.message().find("lighting.directional[0]"), std::string::npos);

    auto shortColor = parseShadingConfigString("[[lighting.directional]]\ncolor = [1, 1]");
    EXPECT_EQ(shortColor.code(), ErrorCode::InvalidState);

    auto negative = parseShadingConfigString("[[lighting.directional]]\nintensity = -2.0");
    EXPECT_EQ(negative.code(), ErrorCode::OutOfRange);

    auto exposure = parseShadingConfigString("[lighting]\nexposure = 0");
    EXPECT_EQ(exposure.code(), ErrorCode::OutOfRange);
}

TEST(ShadingConfigTest, MalformedDocument) {
    auto config = parseShadingConfigString("[material\nmetallic = ");
    EXPECT_EQ(config.code(), ErrorCode::ParseError);
}

TEST(ShadingConfigTest, MissingFile) {
    auto config = loadShadingConfig("/nonexistent/shading.toml");
    EXPECT_EQ(config.code(), ErrorCode::NotFound);
}

TEST(ShadingConfigTest, BundledConfigLoads) {
    auto config = loadShadingConfig(std::string(STRATA_CONFIG_DIR) + "/shading.toml");
    ASSERT_TRUE(config.isOk()) << config.message();
    EXPECT_EQ(config.value().pipeline.pass, ShadingPass::Forward);
    EXPECT_EQ(config.value().lighting.directionalLights.size(), 1u);
    EXPECT_EQ(config.value().logLevels.render, quill::LogLevel::Warning);
}

TEST(ShadingConfigTest, LogLevels) {
    auto config = parseShadingConfigString("[log]\nlevel = \"debug\"\nterrain = \"error\"");
    ASSERT_TRUE(config.isOk()) << config.message();
    EXPECT_EQ(config.value().logLevels.root, quill::LogLevel::Debug);
    EXPECT_EQ(config.value().logLevels.render, quill::LogLevel::Info);
    EXPECT_EQ(config.value().logLevels.terrain, quill::LogLevel::Error);

    const log::LogLevels saved = log::currentLevels();
    log::applyLevels(config.value().logLevels);
    EXPECT_EQ(log::currentLevels().terrain, quill::LogLevel::Error);
    log::applyLevels(saved);

    auto unknown = parseShadingConfigString("[log]\nrender = \"loud\"");
    EXPECT_EQ(unknown.code(), ErrorCode::InvalidState);
    EXPECT_NE(unknown.message().find("log.render"), std::string::npos);

    auto wrongType = parseShadingConfigString("[log]\nlevel = 3");
    EXPECT_EQ(wrongType.code(), ErrorCode::TypeMismatch);
}

TEST(BlockDefinitionsTest, RegistersInOrder) {
    auto loader = DataLoader::parse(R"(
        [[block]]
        id = "air"
        visibility = "invisible"
        collision = false

        [[block]]
        id = "stone"
        color = [0.5, 0.5, 0.5]

        [[block]]
        id = "water"
        color = [0.2, 0.4, 0.8, 0.6]
        visibility = "transparent"
        emissive = [0.0, 0.0, 0.1]
    )");
    ASSERT_TRUE(loader.isOk());

    BlockRegistry registry;
    auto result = loadBlockDefinitions(loader.value(), registry);
    ASSERT_TRUE(result.isOk()) << result.message();
    ASSERT_EQ(registry.size(), 3u);

    EXPECT_EQ(registry.flags(0), BlockFlags::None);
    EXPECT_TRUE(registry.isSolid(1));
    EXPECT_TRUE(registry.hasFlag(1, BlockFlags::Collision));
    EXPECT_TRUE(registry.hasFlag(2, BlockFlags::Transparent));
    // Collision is on unless a block turns it off, whatever its visibility
    EXPECT_TRUE(registry.hasFlag(2, BlockFlags::Collision));

    BlockPalette palette = registry.buildPalette();
    EXPECT_FLOAT_EQ(palette.fetch(2).color.w, 0.6f);
    EXPECT_FLOAT_EQ(palette.fetch(2).emissive.w, 0.0f);
    EXPECT_NEAR(palette.fetch(1).color.x, 0.21404f, 1e-4f);
}

TEST(BlockDefinitionsTest, CollisionDefaultsOn) {
    auto loader = DataLoader::parse(R"(
        [[block]]
        id = "barrier"
        visibility = "invisible"

        [[block]]
        id = "leaves"
        visibility = "transparent"

        [[block]]
        id = "tall_grass"
        visibility = "transparent"
        collision = false
    )");
    ASSERT_TRUE(loader.isOk());

    BlockRegistry registry;
    ASSERT_TRUE(loadBlockDefinitions(loader.value(), registry).isOk());
    ASSERT_EQ(registry.size(), 3u);

    EXPECT_EQ(registry.flags(0), BlockFlags::Collision);
    EXPECT_TRUE(registry.hasFlag(1, BlockFlags::Collision));
    EXPECT_FALSE(registry.hasFlag(2, BlockFlags::Collision));
    EXPECT_TRUE(registry.hasFlag(2, BlockFlags::Transparent));
}

TEST(BlockDefinitionsTest, DuplicateIdStopsLoading) {
    auto loader = DataLoader::parse(R"(
        [[block]]
        id = "stone"

        [[block]]
        id = "stone"

        [[block]]
        id = "dirt"
    )",
                                    "dup.toml");
    ASSERT_TRUE(loader.isOk());

    BlockRegistry registry;
    auto result = loadBlockDefinitions(loader.value(), registry);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), ErrorCode::AlreadyExists);
    EXPECT_NE(result.message().find("dup.toml:block[1]"), std::string::npos);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(BlockDefinitionsTest, MissingIdAndBadVisibility) {
    BlockRegistry registry;

    auto noId = DataLoader::parse("[[block]]\ncolor = [1, 1, 1]");
    ASSERT_TRUE(noId.isOk());
    EXPECT_EQ(loadBlockDefinitions(noId.value(), registry).code(), ErrorCode::NotFound);

    auto badVis = DataLoader::parse("[[block]]\nid = \"fog\"\nvisibility = \"misty\"");
    ASSERT_TRUE(badVis.isOk());
    EXPECT_EQ(loadBlockDefinitions(badVis.value(), registry).code(), ErrorCode::InvalidState);
    EXPECT_EQ(registry.size(), 0u);
}

TEST(BlockDefinitionsTest, BundledBlocksLoad) {
    auto loader = DataLoader::load(std::string(STRATA_CONFIG_DIR) + "/blocks.toml");
    ASSERT_TRUE(loader.isOk()) << loader.message();

    BlockRegistry registry;
    ASSERT_TRUE(loadBlockDefinitions(loader.value(), registry).isOk());
    ASSERT_TRUE(registry.find("glowstone").has_value());
    EXPECT_EQ(registry.identifier(0), "air");
}
