#pragma once

#include <array>
#include <cstdint>

namespace strata {

enum class AlphaMode : uint8_t {
    Opaque,
    Premultiplied
};

// Material uniform shared by every chunk in a material group. Only the three
// scalars reach the shader; the palette arrays are bound separately.
struct ChunkMaterial {
    float reflectance = 0.5f;
    float perceptualRoughness = 1.0f;
    float metallic = 0.01f;
    AlphaMode alphaMode = AlphaMode::Opaque;

    // vec4 uniform layout: reflectance, roughness, metallic, reserved.
    std::array<float, 4> uniformData() const { return {reflectance, perceptualRoughness, metallic, 0.0f}; }

    static ChunkMaterial opaque() { return ChunkMaterial{}; }

    static ChunkMaterial transparent() {
        ChunkMaterial m;
        m.alphaMode = AlphaMode::Premultiplied;
        return m;
    }
};

} // namespace strata
