#include "strata/core/VertexStage.hh"

#include "strata/core/ShadingTables.hh"
#include "strata/core/VoxelVertex.hh"

#include <algorithm>

namespace strata {

ViewUniform ViewUniform::fromMatrices(const Mat4f& view, const Mat4f& projection, bool orthographic) {
    ViewUniform u;
    u.view = view;
    u.projection = projection;
    u.viewProjection = projection * view;
    Mat4f invView = view.inverse();
    u.cameraPosition = Vec3f(invView(0, 3), invView(1, 3), invView(2, 3));
    u.orthographic = orthographic;
    return u;
}

template <DepthMode Depth>
VertexOutput shadeVertexGeometry(uint32_t word, uint32_t instanceIndex, const InstanceTransform& instance,
                                 const ViewUniform& view) {
    const VoxelVertex vertex = VoxelVertex::unpack(word);

    VertexOutput out;
    out.instanceIndex = instanceIndex;
    out.worldPosition = instance.model.transformPoint<Space::Local, Space::World>(vertex.position());
    out.clipPosition =
        view.viewProjection.transform<Space::World, Space::Clip>(Vector4<float, Space::World>(out.worldPosition, 1.0f));
    out.unclippedDepth = out.clipPosition.z;

    if constexpr (Depth == DepthMode::ClampOrtho) {
        // Geometry past the far plane of an orthographic shadow view still has
        // to cast; keep it in the clip volume and restore depth per fragment.
        out.clipPosition.z = std::min(out.clipPosition.z, 1.0f);
    }

    out.worldNormal =
        instance.normal.transformDirection<Space::Local, Space::World>(faceNormal(vertex.normalIndex)).normalized();
    return out;
}

template <DepthMode Depth>
VertexOutput shadeVertex(uint32_t word, uint32_t instanceIndex, const InstanceTransform& instance,
                         const ViewUniform& view, const BlockPalette& palette) {
    VertexOutput out = shadeVertexGeometry<Depth>(word, instanceIndex, instance, view);

    const VoxelVertex vertex = VoxelVertex::unpack(word);
    const PaletteEntry entry = palette.fetch(vertex.blockIndex);
    const float ao = aoMultiplier(vertex.ao);
    out.color = Rgba(entry.color.x * ao, entry.color.y * ao, entry.color.z * ao, entry.color.w);
    out.emissive = entry.emissive;

    return out;
}

template VertexOutput shadeVertexGeometry<DepthMode::Standard>(uint32_t, uint32_t, const InstanceTransform&,
                                                               const ViewUniform&);
template VertexOutput shadeVertexGeometry<DepthMode::ClampOrtho>(uint32_t, uint32_t, const InstanceTransform&,
                                                                 const ViewUniform&);
template VertexOutput shadeVertex<DepthMode::Standard>(uint32_t, uint32_t, const InstanceTransform&,
                                                       const ViewUniform&, const BlockPalette&);
template VertexOutput shadeVertex<DepthMode::ClampOrtho>(uint32_t, uint32_t, const InstanceTransform&,
                                                         const ViewUniform&, const BlockPalette&);

namespace {

template <typename V> V blend3(const V& a, const V& b, const V& c, const std::array<float, 3>& w) {
    return a * w[0] + b * w[1] + c * w[2];
}

float ndcDepth(const VertexOutput& v) {
    return v.clipPosition.w != 0.0f ? v.clipPosition.z / v.clipPosition.w : v.clipPosition.z;
}

} // namespace

FragmentInput interpolate(const VertexOutput& a, const VertexOutput& b, const VertexOutput& c,
                          const std::array<float, 3>& weights) {
    FragmentInput in;
    in.depth = ndcDepth(a) * weights[0] + ndcDepth(b) * weights[1] + ndcDepth(c) * weights[2];
    in.unclippedDepth =
        a.unclippedDepth * weights[0] + b.unclippedDepth * weights[1] + c.unclippedDepth * weights[2];
    in.worldPosition = blend3(a.worldPosition, b.worldPosition, c.worldPosition, weights);
    in.worldNormal = blend3(a.worldNormal, b.worldNormal, c.worldNormal, weights);
    in.color = blend3(a.color, b.color, c.color, weights);
    in.emissive = blend3(a.emissive, b.emissive, c.emissive, weights);
    return in;
}

} // namespace strata
