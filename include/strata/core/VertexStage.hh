#pragma once

#include "strata/core/BlockPalette.hh"
#include "strata/core/ChunkMesh.hh"
#include "strata/core/Spatial.hh"

#include <array>
#include <cstdint>
#include <optional>

namespace strata {

// Camera matrices for one view. Clip depth is [0, 1].
struct ViewUniform {
    Mat4f view;
    Mat4f projection;
    Mat4f viewProjection;
    Vec3f cameraPosition;
    bool orthographic = false;

    static ViewUniform fromMatrices(const Mat4f& view, const Mat4f& projection, bool orthographic = false);
};

enum class DepthMode : uint8_t {
    Standard,  // Clip position passed through
    ClampOrtho // Clip z clamped to 1.0, unclamped depth written by the fragment stage
};

// Per-vertex results, interpolated across the primitive before fragment shading.
struct VertexOutput {
    Vector4<float, Space::Clip> clipPosition;
    float unclippedDepth = 0.0f;
    Vec3f worldPosition;
    Vec3f worldNormal;
    Rgba color; // Palette color with AO applied to RGB
    Rgba emissive;
    uint32_t instanceIndex = 0;
};

// Decodes one packed vertex word and runs it through the instance and view
// transforms. Color and emissive are left zero.
template <DepthMode Depth>
VertexOutput shadeVertexGeometry(uint32_t word, uint32_t instanceIndex, const InstanceTransform& instance,
                                 const ViewUniform& view);

// shadeVertexGeometry plus palette lookup and AO, once per vertex.
template <DepthMode Depth>
VertexOutput shadeVertex(uint32_t word, uint32_t instanceIndex, const InstanceTransform& instance,
                         const ViewUniform& view, const BlockPalette& palette);

extern template VertexOutput shadeVertexGeometry<DepthMode::Standard>(uint32_t, uint32_t, const InstanceTransform&,
                                                                      const ViewUniform&);
extern template VertexOutput shadeVertexGeometry<DepthMode::ClampOrtho>(uint32_t, uint32_t,
                                                                        const InstanceTransform&, const ViewUniform&);

extern template VertexOutput shadeVertex<DepthMode::Standard>(uint32_t, uint32_t, const InstanceTransform&,
                                                              const ViewUniform&, const BlockPalette&);
extern template VertexOutput shadeVertex<DepthMode::ClampOrtho>(uint32_t, uint32_t, const InstanceTransform&,
                                                                const ViewUniform&, const BlockPalette&);

// Attributes at one covered pixel, as the rasterizer would hand them over.
struct FragmentInput {
    float depth = 0.0f; // Rasterized clip z / w
    float unclippedDepth = 0.0f;
    Vec3f worldPosition;
    Vec3f worldNormal;
    Rgba color;
    Rgba emissive;
    // Normal read back from the prepass target, present when the frame ran a
    // normal prepass.
    std::optional<Vec3f> prepassNormal;
};

// Barycentric blend of three vertex outputs. Weights are expected to already
// be perspective-corrected and sum to one.
FragmentInput interpolate(const VertexOutput& a, const VertexOutput& b, const VertexOutput& c,
                          const std::array<float, 3>& weights);

} // namespace strata
