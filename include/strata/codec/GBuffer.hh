#pragma once

#include "strata/core/Spatial.hh"

#include <array>
#include <cstdint>

namespace strata::codec {

// Lighting pass id carried next to every gbuffer texel. 0 means "nothing
// written"; the first deferred lighting layer picks up id 1.
inline constexpr uint8_t kNoLightingPassId = 0;
inline constexpr uint8_t kDefaultLightingPassId = 1;

// Four 32-bit words per texel:
//   word0: base color (sRGB) rgb + perceptual roughness, unorm4x8
//   word1: emissive, RGB9E5 shared-exponent float
//   word2: reflectance, metallic, diffuse occlusion, reserved, unorm4x8
//   word3: octahedral normal (2 x unorm12) | flags[31:24]
struct GBufferRecord {
    std::array<uint32_t, 4> words = {};

    bool operator==(const GBufferRecord& other) const { return words == other.words; }
};

// Decoded form of a texel. Colors are linear.
struct GBufferData {
    Rgba baseColor;
    float perceptualRoughness = 1.0f;
    Vector3<float, Space::Color> emissive;
    float reflectance = 0.5f;
    float metallic = 0.0f;
    float diffuseOcclusion = 1.0f;
    Vec3f normal = Vec3f(0.0f, 1.0f, 0.0f);
    uint8_t flags = 0;
};

GBufferRecord encodeGBuffer(const GBufferData& data);
GBufferData decodeGBuffer(const GBufferRecord& record);

// Octahedral mapping of a unit vector to [0, 1]^2 and back.
glm::vec2 octahedralEncode(const Vec3f& n);
Vec3f octahedralDecode(const glm::vec2& uv);

// 24-bit normal (two 12-bit unorm channels) with 8 flag bits on top.
uint32_t packNormalAndFlags(const Vec3f& n, uint8_t flags);
Vec3f unpackNormal(uint32_t packed);
uint8_t unpackFlags(uint32_t packed);

// Shared-exponent HDR color.
uint32_t packRgb9e5(const Vector3<float, Space::Color>& rgb);
Vector3<float, Space::Color> unpackRgb9e5(uint32_t packed);

// Prepass normal target texel: n * 0.5 + 0.5 in rgb, alpha 1, unorm4x8.
uint32_t packPrepassNormal(const Vec3f& n);
Vec3f unpackPrepassNormal(uint32_t packed);

} // namespace strata::codec
