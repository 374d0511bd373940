#pragma once

#include "strata/core/Spatial.hh"

#include <vector>

namespace strata {

using LinearRgb = Vector3<float, Space::Color>;

struct DirectionalLight {
    Vec3f direction = Vec3f(0.0f, 1.0f, 0.0f); // Points toward the light
    LinearRgb color = LinearRgb(1.0f, 1.0f, 1.0f);
    float intensity = 1.0f;
};

struct LightingEnvironment {
    std::vector<DirectionalLight> directionalLights;
    LinearRgb ambientColor = LinearRgb(1.0f, 1.0f, 1.0f);
    float ambientBrightness = 0.1f;
    float exposure = 1.0f;
    bool tonemap = true;
};

// Per-fragment material input. Built fresh for each fragment and discarded.
struct PbrInput {
    Vec3f worldPosition;
    Vec3f worldNormal;
    Vec3f view; // Unit vector from the surface toward the eye
    Rgba baseColor;
    Rgba emissive;
    float reflectance = 0.5f;
    float perceptualRoughness = 1.0f;
    float metallic = 0.0f;
    float diffuseOcclusion = 1.0f;
};

// Direct (GGX specular + Lambert diffuse) and ambient lighting plus emissive.
// Returns linear HDR radiance; alpha is the base color alpha.
Rgba applyPbrLighting(const PbrInput& in, const LightingEnvironment& env);

// Exposure and ACES filmic tonemapping, RGB only.
Rgba postLightingProcessing(const Rgba& color, const LightingEnvironment& env);

// Roughness floor keeps the GGX lobe finite for mirror-like inputs.
float perceptualRoughnessToRoughness(float perceptualRoughness);

} // namespace strata
