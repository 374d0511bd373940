#include "strata/core/ChunkPipeline.hh"

#include "strata/core/Log.hh"
#include "strata/utils/Profiler.hh"

#include <string>
#include <type_traits>

namespace strata {

Result<void> validateDraw(const ChunkDraw& draw, const PipelineKey& key) {
    if (!draw.instances || !draw.view) {
        return Result<void>::error(ErrorCode::InvalidState, "draw is missing instances or view");
    }
    if (!draw.palette && key.pass != ShadingPass::DefaultPrepass) {
        return Result<void>::error(ErrorCode::InvalidState,
                                   std::string(shadingPassName(key.pass)) + " draw is missing a block palette");
    }
    if (draw.vertices.size() != draw.instanceIndices.size()) {
        return Result<void>::error(ErrorCode::InvalidState,
                                   "vertex count " + std::to_string(draw.vertices.size()) +
                                       " does not match instance index count " +
                                       std::to_string(draw.instanceIndices.size()));
    }
    for (size_t i = 0; i < draw.instanceIndices.size(); ++i) {
        if (draw.instanceIndices[i] >= draw.instances->size()) {
            return Result<void>::error(ErrorCode::NotFound, "vertex " + std::to_string(i) + " references instance " +
                                                                std::to_string(draw.instanceIndices[i]) +
                                                                " outside table of " +
                                                                std::to_string(draw.instances->size()));
        }
    }
    return Result<void>::ok();
}

namespace {

template <DepthMode Depth>
VertexOutput paletteVertex(uint32_t word, uint32_t instanceIndex, const InstanceTransform& instance,
                           const ViewUniform& view, const BlockPalette* palette) {
    return shadeVertex<Depth>(word, instanceIndex, instance, view, *palette);
}

template <DepthMode Depth>
VertexOutput geometryVertex(uint32_t word, uint32_t instanceIndex, const InstanceTransform& instance,
                            const ViewUniform& view, const BlockPalette*) {
    return shadeVertexGeometry<Depth>(word, instanceIndex, instance, view);
}

template <template <bool, bool> class Stage, typename Variant> Variant selectPrepassStage(const PipelineKey& key) {
    if (key.normalPrepass) {
        if (key.depthClampOrtho) {
            return Stage<true, true>{};
        }
        return Stage<true, false>{};
    }
    if (key.depthClampOrtho) {
        return Stage<false, true>{};
    }
    return Stage<false, false>{};
}

} // namespace

ChunkPipeline::ChunkPipeline(const PipelineKey& key, VertexFn vertexFn, FragmentStage fragment, WorkerPool* pool)
    : key_(key), vertexFn_(vertexFn), fragment_(fragment), pool_(pool) {}

Result<ChunkPipeline> ChunkPipeline::specialize(const PipelineKey& key, WorkerPool* pool) {
    const bool isPrepass = key.pass != ShadingPass::Forward;

    if (!isPrepass && (key.normalPrepass || key.depthClampOrtho)) {
        return Result<ChunkPipeline>::error(ErrorCode::InvalidState,
                                            "normal prepass and depth clamp only apply to prepass pipelines");
    }
    if (isPrepass && key.loadPrepassNormals) {
        return Result<ChunkPipeline>::error(ErrorCode::InvalidState,
                                            "a prepass pipeline cannot load prepass normals");
    }

    // The default prepass output does not depend on block colors, so it
    // skips the palette fetch entirely.
    VertexFn vertexFn = nullptr;
    if (key.pass == ShadingPass::DefaultPrepass) {
        vertexFn = key.depthClampOrtho ? &geometryVertex<DepthMode::ClampOrtho> : &geometryVertex<DepthMode::Standard>;
    } else {
        vertexFn = key.depthClampOrtho ? &paletteVertex<DepthMode::ClampOrtho> : &paletteVertex<DepthMode::Standard>;
    }

    FragmentStage fragment;
    switch (key.pass) {
        case ShadingPass::Forward:
            if (key.loadPrepassNormals) {
                fragment = ForwardFragment<true>{};
            } else {
                fragment = ForwardFragment<false>{};
            }
            break;
        case ShadingPass::DeferredPrepass:
            fragment = selectPrepassStage<DeferredPrepassFragment, FragmentStage>(key);
            break;
        case ShadingPass::DefaultPrepass:
            fragment = selectPrepassStage<DefaultPrepassFragment, FragmentStage>(key);
            break;
    }

    STRATA_LOG_RENDER_DEBUG("Specialized chunk pipeline: pass={} loadPrepassNormals={} normalPrepass={} "
                            "depthClampOrtho={}",
                            shadingPassName(key.pass), key.loadPrepassNormals, key.normalPrepass,
                            key.depthClampOrtho);

    return Result<ChunkPipeline>::ok(ChunkPipeline(key, vertexFn, fragment, pool));
}

void ChunkPipeline::dispatch(size_t count, size_t batch, const std::function<void(size_t, size_t)>& body) const {
    if (pool_) {
        pool_->parallelFor(count, batch, body);
    } else if (count > 0) {
        body(0, count);
    }
}

Result<std::vector<VertexOutput>> ChunkPipeline::runVertices(const ChunkDraw& draw) const {
    STRATA_ZONE_SCOPED_N("ChunkPipeline::runVertices");
    STRATA_ZONE_PASS(shadingPassName(key_.pass));

    auto valid = validateDraw(draw, key_);
    if (valid.isError()) {
        STRATA_LOG_RENDER_WARN("Chunk draw rejected: {}", valid.message());
        return Result<std::vector<VertexOutput>>::errorFrom(valid);
    }

    std::vector<VertexOutput> out(draw.vertices.size());
    const VertexFn fn = vertexFn_;
    dispatch(out.size(), kVertexBatch, [&](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            const uint32_t instance = draw.instanceIndices[i];
            out[i] = fn(draw.vertices[i], instance, (*draw.instances)[instance], *draw.view, draw.palette);
        }
    });

    STRATA_PLOT_COUNT("chunk vertices");
    STRATA_PLOT("chunk vertices", static_cast<int64_t>(out.size()));
    return Result<std::vector<VertexOutput>>::ok(std::move(out));
}

Result<std::vector<Rgba>> ChunkPipeline::shadeForward(std::span<const FragmentInput> fragments,
                                                      const ChunkMaterial& material, const ViewUniform& view,
                                                      const LightingEnvironment& env) const {
    STRATA_ZONE_SCOPED_N("ChunkPipeline::shadeForward");
    STRATA_ZONE_PASS(shadingPassName(key_.pass));

    return std::visit(
        [&](const auto& stage) -> Result<std::vector<Rgba>> {
            using Stage = std::decay_t<decltype(stage)>;
            if constexpr (Stage::kPass == ShadingPass::Forward) {
                std::vector<Rgba> out(fragments.size());
                dispatch(out.size(), kFragmentBatch, [&](size_t begin, size_t end) {
                    for (size_t i = begin; i < end; ++i) {
                        out[i] = stage(fragments[i], material, view, env);
                    }
                });
                return Result<std::vector<Rgba>>::ok(std::move(out));
            } else {
                return Result<std::vector<Rgba>>::error(ErrorCode::InvalidState,
                                                        std::string("shadeForward on a ") +
                                                            shadingPassName(Stage::kPass) + " pipeline");
            }
        },
        fragment_);
}

Result<std::vector<PrepassOutput>> ChunkPipeline::shadePrepass(std::span<const FragmentInput> fragments,
                                                               const ChunkMaterial* material,
                                                               const ViewUniform& view) const {
    STRATA_ZONE_SCOPED_N("ChunkPipeline::shadePrepass");
    STRATA_ZONE_PASS(shadingPassName(key_.pass));

    return std::visit(
        [&](const auto& stage) -> Result<std::vector<PrepassOutput>> {
            using Stage = std::decay_t<decltype(stage)>;
            if constexpr (Stage::kPass == ShadingPass::Forward) {
                return Result<std::vector<PrepassOutput>>::error(ErrorCode::InvalidState,
                                                                 "shadePrepass on a Forward pipeline");
            } else if constexpr (Stage::kPass == ShadingPass::DeferredPrepass) {
                if (!material) {
                    return Result<std::vector<PrepassOutput>>::error(
                        ErrorCode::InvalidState, "deferred prepass requires a chunk material");
                }
                std::vector<PrepassOutput> out(fragments.size());
                dispatch(out.size(), kFragmentBatch, [&](size_t begin, size_t end) {
                    for (size_t i = begin; i < end; ++i) {
                        out[i] = stage(fragments[i], *material, view);
                    }
                });
                return Result<std::vector<PrepassOutput>>::ok(std::move(out));
            } else {
                std::vector<PrepassOutput> out(fragments.size());
                dispatch(out.size(), kFragmentBatch, [&](size_t begin, size_t end) {
                    for (size_t i = begin; i < end; ++i) {
                        out[i] = stage(fragments[i]);
                    }
                });
                return Result<std::vector<PrepassOutput>>::ok(std::move(out));
            }
        },
        fragment_);
}

} // namespace strata
