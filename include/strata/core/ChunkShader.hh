#pragma once

#include "strata/codec/GBuffer.hh"
#include "strata/core/ChunkMaterial.hh"
#include "strata/core/Lighting.hh"
#include "strata/core/VertexStage.hh"

#include <cstdint>
#include <optional>

namespace strata {

enum class ShadingPass : uint8_t {
    Forward,         // Lit color
    DeferredPrepass, // Gbuffer record from the chunk material
    DefaultPrepass   // No chunk material bound: placeholder gbuffer record
};

// Everything a pipeline is specialized on. Chosen before dispatch; the fragment
// stages below never branch on it.
struct PipelineKey {
    ShadingPass pass = ShadingPass::Forward;
    bool loadPrepassNormals = false; // Forward: shade with the prepass normal
    bool normalPrepass = false;      // Prepass: also write the packed normal target
    bool depthClampOrtho = false;    // Prepass: clamp clip z, write unclamped depth

    bool operator==(const PipelineKey& other) const {
        return pass == other.pass && loadPrepassNormals == other.loadPrepassNormals &&
               normalPrepass == other.normalPrepass && depthClampOrtho == other.depthClampOrtho;
    }
};

const char* shadingPassName(ShadingPass pass);

struct PrepassOutput {
    std::optional<uint32_t> normal;  // packPrepassNormal() texel
    std::optional<float> fragDepth;  // Explicit depth, depth-clamp mode only
    std::optional<codec::GBufferRecord> deferred;
    uint8_t lightingPassId = codec::kNoLightingPassId;
};

// Emissive written by the default prepass so unshaded geometry stands out.
inline const LinearRgb kPlaceholderEmissive = LinearRgb(1.0f, 0.0f, 1.0f);

// Direction from the fragment toward the eye. Orthographic views use the
// camera's forward axis for every fragment.
Vec3f calculateView(const Vec3f& worldPosition, const ViewUniform& view);

// Material input from interpolated attributes. `normal` is the shading
// normal picked by the caller (geometric or prepass).
PbrInput buildPbrInput(const FragmentInput& in, const ChunkMaterial& material, const ViewUniform& view,
                       const Vec3f& normal);

template <bool LoadPrepassNormals> struct ForwardFragment {
    static constexpr ShadingPass kPass = ShadingPass::Forward;

    Rgba operator()(const FragmentInput& in, const ChunkMaterial& material, const ViewUniform& view,
                    const LightingEnvironment& env) const;
};

template <bool NormalPrepass, bool DepthClamp> struct DeferredPrepassFragment {
    static constexpr ShadingPass kPass = ShadingPass::DeferredPrepass;

    PrepassOutput operator()(const FragmentInput& in, const ChunkMaterial& material, const ViewUniform& view) const;
};

template <bool NormalPrepass, bool DepthClamp> struct DefaultPrepassFragment {
    static constexpr ShadingPass kPass = ShadingPass::DefaultPrepass;

    PrepassOutput operator()(const FragmentInput& in) const;
};

extern template struct ForwardFragment<false>;
extern template struct ForwardFragment<true>;
extern template struct DeferredPrepassFragment<false, false>;
extern template struct DeferredPrepassFragment<false, true>;
extern template struct DeferredPrepassFragment<true, false>;
extern template struct DeferredPrepassFragment<true, true>;
extern template struct DefaultPrepassFragment<false, false>;
extern template struct DefaultPrepassFragment<false, true>;
extern template struct DefaultPrepassFragment<true, false>;
extern template struct DefaultPrepassFragment<true, true>;

} // namespace strata
