#include "strata/core/ChunkShader.hh"

namespace strata {

const char* shadingPassName(ShadingPass pass) {
    switch (pass) {
        case ShadingPass::Forward:
            return "Forward";
        case ShadingPass::DeferredPrepass:
            return "DeferredPrepass";
        case ShadingPass::DefaultPrepass:
            return "DefaultPrepass";
    }
    return "Unknown";
}

Vec3f calculateView(const Vec3f& worldPosition, const ViewUniform& view) {
    if (view.orthographic) {
        // Third row of the view matrix is the camera's back axis in world space.
        return Vec3f(view.view(2, 0), view.view(2, 1), view.view(2, 2)).normalized();
    }
    return (view.cameraPosition - worldPosition).normalized();
}

PbrInput buildPbrInput(const FragmentInput& in, const ChunkMaterial& material, const ViewUniform& view,
                       const Vec3f& normal) {
    PbrInput pbr;
    pbr.worldPosition = in.worldPosition;
    pbr.worldNormal = normal.normalized();
    pbr.view = calculateView(in.worldPosition, view);
    pbr.baseColor = in.color;
    pbr.emissive = in.emissive;
    pbr.reflectance = material.reflectance;
    pbr.perceptualRoughness = material.perceptualRoughness;
    pbr.metallic = material.metallic;
    return pbr;
}

namespace {

template <bool NormalPrepass, bool DepthClamp> void writePrepassTargets(const FragmentInput& in, PrepassOutput& out) {
    if constexpr (NormalPrepass) {
        out.normal = codec::packPrepassNormal(in.worldNormal.normalized());
    }
    if constexpr (DepthClamp) {
        out.fragDepth = in.unclippedDepth;
    }
}

} // namespace

template <bool LoadPrepassNormals>
Rgba ForwardFragment<LoadPrepassNormals>::operator()(const FragmentInput& in, const ChunkMaterial& material,
                                                     const ViewUniform& view, const LightingEnvironment& env) const {
    Vec3f normal = in.worldNormal;
    if constexpr (LoadPrepassNormals) {
        // A fragment the prepass did not cover keeps its geometric normal.
        normal = in.prepassNormal.value_or(in.worldNormal);
    }

    PbrInput pbr = buildPbrInput(in, material, view, normal);
    Rgba color = postLightingProcessing(applyPbrLighting(pbr, env), env);

    switch (material.alphaMode) {
        case AlphaMode::Opaque:
            color.w = 1.0f;
            break;
        case AlphaMode::Premultiplied:
            color = Rgba(color.x * color.w, color.y * color.w, color.z * color.w, color.w);
            break;
    }
    return color;
}

template <bool NormalPrepass, bool DepthClamp>
PrepassOutput DeferredPrepassFragment<NormalPrepass, DepthClamp>::operator()(const FragmentInput& in,
                                                                             const ChunkMaterial& material,
                                                                             const ViewUniform& view) const {
    PbrInput pbr = buildPbrInput(in, material, view, in.worldNormal);

    codec::GBufferData data;
    data.baseColor = pbr.baseColor;
    data.perceptualRoughness = pbr.perceptualRoughness;
    data.emissive = LinearRgb(pbr.emissive.x, pbr.emissive.y, pbr.emissive.z);
    data.reflectance = pbr.reflectance;
    data.metallic = pbr.metallic;
    data.diffuseOcclusion = pbr.diffuseOcclusion;
    data.normal = pbr.worldNormal;

    PrepassOutput out;
    writePrepassTargets<NormalPrepass, DepthClamp>(in, out);
    out.deferred = codec::encodeGBuffer(data);
    out.lightingPassId = codec::kDefaultLightingPassId;
    return out;
}

template <bool NormalPrepass, bool DepthClamp>
PrepassOutput DefaultPrepassFragment<NormalPrepass, DepthClamp>::operator()(const FragmentInput& in) const {
    PrepassOutput out;
    writePrepassTargets<NormalPrepass, DepthClamp>(in, out);

    codec::GBufferRecord record;
    record.words[1] = codec::packRgb9e5(kPlaceholderEmissive);
    out.deferred = record;
    out.lightingPassId = codec::kDefaultLightingPassId;
    return out;
}

template struct ForwardFragment<false>;
template struct ForwardFragment<true>;
template struct DeferredPrepassFragment<false, false>;
template struct DeferredPrepassFragment<false, true>;
template struct DeferredPrepassFragment<true, false>;
template struct DeferredPrepassFragment<true, true>;
template struct DefaultPrepassFragment<false, false>;
template struct DefaultPrepassFragment<false, true>;
template struct DefaultPrepassFragment<true, false>;
template struct DefaultPrepassFragment<true, true>;

} // namespace strata
