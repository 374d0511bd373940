#include "strata/core/ShadingConfig.hh"

#include "strata/core/Log.hh"

#include <cmath>
#include <string>

namespace strata {

namespace {

Result<float> getUnitFloat(const DataLoader& loader, std::string_view key, float defaultValue) {
    auto r = loader.getFloatOr(key, defaultValue);
    if (r.isError()) {
        return Result<float>::errorFrom(r);
    }
    const double v = r.value();
    if (v < 0.0 || v > 1.0) {
        return Result<float>::error(ErrorCode::OutOfRange, loader.formatError(key, "must be within [0, 1]"));
    }
    return Result<float>::ok(static_cast<float>(v));
}

// Three-component array, or a default when the key is absent.
template <typename S>
Result<Vector3<float, S>> getVector3(const DataLoader& loader, std::string_view key,
                                     const Vector3<float, S>& defaultValue) {
    using R = Result<Vector3<float, S>>;
    if (!loader.hasKey(key)) {
        return R::ok(defaultValue);
    }
    auto arr = loader.getFloatArray(key);
    if (arr.isError()) {
        return R::errorFrom(arr);
    }
    const auto& v = arr.value();
    if (v.size() != 3) {
        return R::error(ErrorCode::InvalidState, loader.formatError(key, "must have 3 components"));
    }
    return R::ok(Vector3<float, S>(static_cast<float>(v[0]), static_cast<float>(v[1]), static_cast<float>(v[2])));
}

// Three or four components; alpha defaults to `defaultAlpha`.
Result<Rgba> getRgba(const DataLoader& loader, std::string_view key, const Rgba& defaultValue, float defaultAlpha) {
    if (!loader.hasKey(key)) {
        return Result<Rgba>::ok(defaultValue);
    }
    auto arr = loader.getFloatArray(key);
    if (arr.isError()) {
        return Result<Rgba>::errorFrom(arr);
    }
    const auto& v = arr.value();
    if (v.size() != 3 && v.size() != 4) {
        return Result<Rgba>::error(ErrorCode::InvalidState, loader.formatError(key, "must have 3 or 4 components"));
    }
    const float alpha = v.size() == 4 ? static_cast<float>(v[3]) : defaultAlpha;
    return Result<Rgba>::ok(
        Rgba(static_cast<float>(v[0]), static_cast<float>(v[1]), static_cast<float>(v[2]), alpha));
}

Result<void> parsePipeline(const DataLoader& loader, PipelineKey& key) {
    auto pass = loader.getStringOr("pipeline.pass", "forward");
    if (pass.isError()) {
        return Result<void>::errorFrom(pass);
    }
    if (pass.value() == "forward") {
        key.pass = ShadingPass::Forward;
    } else if (pass.value() == "deferred_prepass") {
        key.pass = ShadingPass::DeferredPrepass;
    } else if (pass.value() == "default_prepass") {
        key.pass = ShadingPass::DefaultPrepass;
    } else {
        return Result<void>::error(ErrorCode::InvalidState,
                                   loader.formatError("pipeline.pass", "has unknown value '" + pass.value() + "'"));
    }

    struct Flag {
        const char* key;
        bool* target;
    };
    const Flag flags[] = {
        {"pipeline.load_prepass_normals", &key.loadPrepassNormals},
        {"pipeline.normal_prepass", &key.normalPrepass},
        {"pipeline.depth_clamp_ortho", &key.depthClampOrtho},
    };
    for (const auto& flag : flags) {
        auto value = loader.getBoolOr(flag.key, false);
        if (value.isError()) {
            return Result<void>::errorFrom(value);
        }
        *flag.target = value.value();
    }
    return Result<void>::ok();
}

Result<void> parseMaterial(const DataLoader& loader, ChunkMaterial& material) {
    struct Scalar {
        const char* key;
        float* target;
    };
    const Scalar scalars[] = {
        {"material.reflectance", &material.reflectance},
        {"material.perceptual_roughness", &material.perceptualRoughness},
        {"material.metallic", &material.metallic},
    };
    for (const auto& scalar : scalars) {
        auto value = getUnitFloat(loader, scalar.key, *scalar.target);
        if (value.isError()) {
            return Result<void>::errorFrom(value);
        }
        *scalar.target = value.value();
    }

    auto mode = loader.getStringOr("material.alpha_mode", "opaque");
    if (mode.isError()) {
        return Result<void>::errorFrom(mode);
    }
    if (mode.value() == "opaque") {
        material.alphaMode = AlphaMode::Opaque;
    } else if (mode.value() == "premultiplied") {
        material.alphaMode = AlphaMode::Premultiplied;
    } else {
        return Result<void>::error(
            ErrorCode::InvalidState,
            loader.formatError("material.alpha_mode", "has unknown value '" + mode.value() + "'"));
    }
    return Result<void>::ok();
}

Result<DirectionalLight> parseDirectionalLight(const DataLoader& loader) {
    DirectionalLight light;

    auto dir = getVector3(loader, "direction", light.direction);
    if (dir.isError()) {
        return Result<DirectionalLight>::errorFrom(dir);
    }
    const Vec3f direction = dir.value();
    if (direction.dot(direction) <= 0.0f) {
        return Result<DirectionalLight>::error(ErrorCode::OutOfRange,
                                               loader.formatError("direction", "must be non-zero"));
    }
    light.direction = direction.normalized();

    auto color = getVector3(loader, "color", light.color);
    if (color.isError()) {
        return Result<DirectionalLight>::errorFrom(color);
    }
    light.color = color.value();

    auto intensity = loader.getFloatOr("intensity", light.intensity);
    if (intensity.isError()) {
        return Result<DirectionalLight>::errorFrom(intensity);
    }
    if (intensity.value() < 0.0) {
        return Result<DirectionalLight>::error(ErrorCode::OutOfRange,
                                               loader.formatError("intensity", "must not be negative"));
    }
    light.intensity = static_cast<float>(intensity.value());
    return Result<DirectionalLight>::ok(light);
}

Result<void> parseLighting(const DataLoader& loader, LightingEnvironment& env) {
    auto ambient = getVector3(loader, "lighting.ambient_color", env.ambientColor);
    if (ambient.isError()) {
        return Result<void>::errorFrom(ambient);
    }
    env.ambientColor = ambient.value();

    auto brightness = loader.getFloatOr("lighting.ambient_brightness", env.ambientBrightness);
    if (brightness.isError()) {
        return Result<void>::errorFrom(brightness);
    }
    env.ambientBrightness = static_cast<float>(brightness.value());

    auto exposure = loader.getFloatOr("lighting.exposure", env.exposure);
    if (exposure.isError()) {
        return Result<void>::errorFrom(exposure);
    }
    if (exposure.value() <= 0.0) {
        return Result<void>::error(ErrorCode::OutOfRange,
                                   loader.formatError("lighting.exposure", "must be positive"));
    }
    env.exposure = static_cast<float>(exposure.value());

    auto tonemap = loader.getBoolOr("lighting.tonemap", env.tonemap);
    if (tonemap.isError()) {
        return Result<void>::errorFrom(tonemap);
    }
    env.tonemap = tonemap.value();

    auto lights = loader.getTableArray("lighting.directional");
    if (lights.isError()) {
        return Result<void>::errorFrom(lights);
    }
    for (const auto& entry : lights.value()) {
        auto light = parseDirectionalLight(entry);
        if (light.isError()) {
            return Result<void>::errorFrom(light);
        }
        env.directionalLights.push_back(light.value());
    }
    return Result<void>::ok();
}

Result<void> parseLogLevels(const DataLoader& loader, log::LogLevels& levels) {
    struct Level {
        const char* key;
        quill::LogLevel* target;
    };
    const Level entries[] = {
        {"log.level", &levels.root},
        {"log.render", &levels.render},
        {"log.terrain", &levels.terrain},
    };
    for (const auto& entry : entries) {
        if (!loader.hasKey(entry.key)) {
            continue;
        }
        auto name = loader.getString(entry.key);
        if (name.isError()) {
            return Result<void>::errorFrom(name);
        }
        auto level = log::levelFromName(name.value());
        if (!level) {
            return Result<void>::error(ErrorCode::InvalidState,
                                       loader.formatError(entry.key, "has unknown level '" + name.value() + "'"));
        }
        *entry.target = *level;
    }
    return Result<void>::ok();
}

Result<BlockVisibility> parseVisibility(const DataLoader& loader) {
    auto value = loader.getStringOr("visibility", "solid");
    if (value.isError()) {
        return Result<BlockVisibility>::errorFrom(value);
    }
    if (value.value() == "solid") {
        return Result<BlockVisibility>::ok(BlockVisibility::Solid);
    }
    if (value.value() == "transparent") {
        return Result<BlockVisibility>::ok(BlockVisibility::Transparent);
    }
    if (value.value() == "invisible") {
        return Result<BlockVisibility>::ok(BlockVisibility::Invisible);
    }
    return Result<BlockVisibility>::error(
        ErrorCode::InvalidState, loader.formatError("visibility", "has unknown value '" + value.value() + "'"));
}

} // namespace

Result<ShadingConfig> parseShadingConfig(const DataLoader& loader) {
    ShadingConfig config;

    auto pipeline = parsePipeline(loader, config.pipeline);
    if (pipeline.isError()) {
        return Result<ShadingConfig>::errorFrom(pipeline);
    }
    auto material = parseMaterial(loader, config.material);
    if (material.isError()) {
        return Result<ShadingConfig>::errorFrom(material);
    }
    auto lighting = parseLighting(loader, config.lighting);
    if (lighting.isError()) {
        return Result<ShadingConfig>::errorFrom(lighting);
    }
    auto levels = parseLogLevels(loader, config.logLevels);
    if (levels.isError()) {
        return Result<ShadingConfig>::errorFrom(levels);
    }

    STRATA_LOG_DEBUG("Shading config from {}: pass={} lights={}", loader.sourceName(),
                     shadingPassName(config.pipeline.pass), config.lighting.directionalLights.size());
    return Result<ShadingConfig>::ok(std::move(config));
}

Result<ShadingConfig> loadShadingConfig(const std::filesystem::path& path) {
    auto loader = DataLoader::load(path);
    if (loader.isError()) {
        return Result<ShadingConfig>::errorFrom(loader);
    }
    return parseShadingConfig(loader.value());
}

Result<ShadingConfig> parseShadingConfigString(std::string_view content, std::string_view sourceName) {
    auto loader = DataLoader::parse(content, sourceName);
    if (loader.isError()) {
        return Result<ShadingConfig>::errorFrom(loader);
    }
    return parseShadingConfig(loader.value());
}

Result<void> loadBlockDefinitions(const DataLoader& loader, BlockRegistry& registry) {
    auto blocks = loader.getTableArray("block");
    if (blocks.isError()) {
        return Result<void>::errorFrom(blocks);
    }

    for (const auto& entry : blocks.value()) {
        auto id = entry.getString("id");
        if (id.isError()) {
            return Result<void>::errorFrom(id);
        }

        BlockDefinition def;
        auto visibility = parseVisibility(entry);
        if (visibility.isError()) {
            return Result<void>::errorFrom(visibility);
        }
        def.visibility = visibility.value();

        auto collision = entry.getBoolOr("collision", def.collision);
        if (collision.isError()) {
            return Result<void>::errorFrom(collision);
        }
        def.collision = collision.value();

        auto color = getRgba(entry, "color", def.color, 1.0f);
        if (color.isError()) {
            return Result<void>::errorFrom(color);
        }
        def.color = color.value();

        auto emissive = getRgba(entry, "emissive", def.emissive, 0.0f);
        if (emissive.isError()) {
            return Result<void>::errorFrom(emissive);
        }
        def.emissive = emissive.value();

        auto added = registry.addBlock(id.value(), def);
        if (added.isError()) {
            return Result<void>::error(added.code(), entry.sourceName() + ": " + added.message());
        }
    }

    STRATA_LOG_INFO("Loaded {} block definitions from {}", blocks.value().size(), loader.sourceName());
    return Result<void>::ok();
}

} // namespace strata
