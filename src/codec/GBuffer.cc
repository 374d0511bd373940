#include "strata/codec/GBuffer.hh"

#include "strata/core/ColorSpace.hh"

#include <glm/gtc/packing.hpp>

#include <cmath>

namespace strata::codec {

namespace {

constexpr float kU12Max = 4095.0f;

} // namespace

glm::vec2 octahedralEncode(const Vec3f& v) {
    glm::vec3 n = toGlm(v);
    n /= std::abs(n.x) + std::abs(n.y) + std::abs(n.z);
    glm::vec2 xy(n.x, n.y);
    if (n.z < 0.0f) {
        glm::vec2 wrap = (1.0f - glm::abs(glm::vec2(n.y, n.x)));
        xy = glm::vec2(wrap.x * (n.x > 0.0f ? 1.0f : -1.0f), wrap.y * (n.y > 0.0f ? 1.0f : -1.0f));
    }
    return xy * 0.5f + 0.5f;
}

Vec3f octahedralDecode(const glm::vec2& uv) {
    glm::vec2 f = uv * 2.0f - 1.0f;
    glm::vec3 n(f.x, f.y, 1.0f - std::abs(f.x) - std::abs(f.y));
    float t = glm::clamp(-n.z, 0.0f, 1.0f);
    n.x += n.x >= 0.0f ? -t : t;
    n.y += n.y >= 0.0f ? -t : t;
    return fromGlm(glm::normalize(n));
}

uint32_t packNormalAndFlags(const Vec3f& n, uint8_t flags) {
    glm::vec2 oct = glm::clamp(octahedralEncode(n), 0.0f, 1.0f);
    auto u = static_cast<uint32_t>(oct.x * kU12Max + 0.5f);
    auto v = static_cast<uint32_t>(oct.y * kU12Max + 0.5f);
    return (u & 0xFFFu) | ((v & 0xFFFu) << 12) | (static_cast<uint32_t>(flags) << 24);
}

Vec3f unpackNormal(uint32_t packed) {
    float u = static_cast<float>(packed & 0xFFFu) / kU12Max;
    float v = static_cast<float>((packed >> 12) & 0xFFFu) / kU12Max;
    return octahedralDecode(glm::vec2(u, v));
}

uint8_t unpackFlags(uint32_t packed) {
    return static_cast<uint8_t>(packed >> 24);
}

uint32_t packRgb9e5(const Vector3<float, Space::Color>& rgb) {
    return glm::packF3x9_E1x5(toGlm(rgb));
}

Vector3<float, Space::Color> unpackRgb9e5(uint32_t packed) {
    glm::vec3 v = glm::unpackF3x9_E1x5(packed);
    return Vector3<float, Space::Color>(v.x, v.y, v.z);
}

uint32_t packPrepassNormal(const Vec3f& n) {
    return glm::packUnorm4x8(glm::vec4(toGlm(n) * 0.5f + 0.5f, 1.0f));
}

Vec3f unpackPrepassNormal(uint32_t packed) {
    glm::vec4 v = glm::unpackUnorm4x8(packed);
    return fromGlm(glm::normalize(glm::vec3(v) * 2.0f - 1.0f));
}

GBufferRecord encodeGBuffer(const GBufferData& data) {
    Rgba srgb = linearToSrgb(data.baseColor);

    GBufferRecord record;
    record.words[0] = glm::packUnorm4x8(glm::vec4(srgb.x, srgb.y, srgb.z, data.perceptualRoughness));
    record.words[1] = packRgb9e5(data.emissive);
    record.words[2] = glm::packUnorm4x8(glm::vec4(data.reflectance, data.metallic, data.diffuseOcclusion, 0.0f));
    record.words[3] = packNormalAndFlags(data.normal, data.flags);
    return record;
}

GBufferData decodeGBuffer(const GBufferRecord& record) {
    GBufferData data;

    glm::vec4 base = glm::unpackUnorm4x8(record.words[0]);
    data.baseColor = srgbToLinear(Rgba(base.x, base.y, base.z, 1.0f));
    data.perceptualRoughness = base.w;

    data.emissive = unpackRgb9e5(record.words[1]);

    glm::vec4 props = glm::unpackUnorm4x8(record.words[2]);
    data.reflectance = props.x;
    data.metallic = props.y;
    data.diffuseOcclusion = props.z;

    data.normal = unpackNormal(record.words[3]);
    data.flags = unpackFlags(record.words[3]);
    return data;
}

} // namespace strata::codec
