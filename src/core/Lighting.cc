#include "strata/core/Lighting.hh"

#include <glm/gtc/constants.hpp>

#include <algorithm>
#include <cmath>

namespace strata {

namespace {

float distributionGgx(float roughness, float NoH) {
    float a2 = roughness * roughness;
    float d = (NoH * a2 - NoH) * NoH + 1.0f;
    return a2 / (glm::pi<float>() * d * d);
}

float visibilitySmithGgxCorrelated(float roughness, float NoV, float NoL) {
    float a2 = roughness * roughness;
    float lambdaV = NoL * std::sqrt((NoV - a2 * NoV) * NoV + a2);
    float lambdaL = NoV * std::sqrt((NoL - a2 * NoL) * NoL + a2);
    return 0.5f / (lambdaV + lambdaL);
}

glm::vec3 fresnelSchlick(const glm::vec3& f0, float f90, float VoH) {
    float f = std::pow(1.0f - VoH, 5.0f);
    return f0 + (glm::vec3(f90) - f0) * f;
}

// Analytic fit of the split-sum environment BRDF (Karis, mobile approximation).
glm::vec3 environmentBrdfApprox(const glm::vec3& f0, float perceptualRoughness, float NoV) {
    const glm::vec4 c0(-1.0f, -0.0275f, -0.572f, 0.022f);
    const glm::vec4 c1(1.0f, 0.0425f, 1.04f, -0.04f);
    glm::vec4 r = perceptualRoughness * c0 + c1;
    float a004 = std::min(r.x * r.x, std::exp2(-9.28f * NoV)) * r.x + r.y;
    glm::vec2 ab = glm::vec2(-1.04f, 1.04f) * a004 + glm::vec2(r.z, r.w);
    return f0 * ab.x + glm::vec3(ab.y);
}

float acesFitted(float x) {
    constexpr float a = 2.51f;
    constexpr float b = 0.03f;
    constexpr float c = 2.43f;
    constexpr float d = 0.59f;
    constexpr float e = 0.14f;
    return std::clamp((x * (a * x + b)) / (x * (c * x + d) + e), 0.0f, 1.0f);
}

} // namespace

float perceptualRoughnessToRoughness(float perceptualRoughness) {
    float clamped = std::clamp(perceptualRoughness, 0.089f, 1.0f);
    return clamped * clamped;
}

Rgba applyPbrLighting(const PbrInput& in, const LightingEnvironment& env) {
    const glm::vec3 base(in.baseColor.x, in.baseColor.y, in.baseColor.z);
    const glm::vec3 N = glm::normalize(toGlm(in.worldNormal));
    const glm::vec3 V = glm::normalize(toGlm(in.view));
    const float NoV = std::max(glm::dot(N, V), 1e-4f);

    const float roughness = perceptualRoughnessToRoughness(in.perceptualRoughness);
    const glm::vec3 diffuseColor = base * (1.0f - in.metallic);
    const glm::vec3 f0 =
        glm::vec3(0.16f * in.reflectance * in.reflectance * (1.0f - in.metallic)) + base * in.metallic;

    glm::vec3 direct(0.0f);
    for (const auto& light : env.directionalLights) {
        const glm::vec3 L = glm::normalize(toGlm(light.direction));
        const float NoL = glm::clamp(glm::dot(N, L), 0.0f, 1.0f);
        if (NoL <= 0.0f) {
            continue;
        }
        const glm::vec3 H = glm::normalize(L + V);
        const float NoH = glm::clamp(glm::dot(N, H), 0.0f, 1.0f);
        const float LoH = glm::clamp(glm::dot(L, H), 0.0f, 1.0f);

        const glm::vec3 specular = distributionGgx(roughness, NoH) * visibilitySmithGgxCorrelated(roughness, NoV, NoL) *
                                   fresnelSchlick(f0, 1.0f, LoH);
        const glm::vec3 diffuse = diffuseColor * glm::one_over_pi<float>();

        direct += (diffuse + specular) * toGlm(light.color) * (light.intensity * NoL);
    }

    const glm::vec3 ambientLight = toGlm(env.ambientColor) * env.ambientBrightness;
    const glm::vec3 ambient = (diffuseColor + environmentBrdfApprox(f0, in.perceptualRoughness, NoV)) *
                              ambientLight * in.diffuseOcclusion;

    const glm::vec3 emissive(in.emissive.x, in.emissive.y, in.emissive.z);
    const glm::vec3 total = direct + ambient + emissive * in.baseColor.w;

    return Rgba(total.x, total.y, total.z, in.baseColor.w);
}

Rgba postLightingProcessing(const Rgba& color, const LightingEnvironment& env) {
    Rgba exposed(color.x * env.exposure, color.y * env.exposure, color.z * env.exposure, color.w);
    if (!env.tonemap) {
        return exposed;
    }
    return Rgba(acesFitted(exposed.x), acesFitted(exposed.y), acesFitted(exposed.z), exposed.w);
}

} // namespace strata
