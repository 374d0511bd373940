#pragma once

#include "strata/core/BlockPalette.hh"
#include "strata/core/ChunkMaterial.hh"
#include "strata/core/ChunkMesh.hh"
#include "strata/core/ChunkShader.hh"
#include "strata/core/Lighting.hh"
#include "strata/core/VertexStage.hh"
#include "strata/utils/ErrorHandling.hh"
#include "strata/utils/WorkerPool.hh"

#include <cstdint>
#include <span>
#include <variant>
#include <vector>

namespace strata {

// Inputs of one chunk draw. Everything is borrowed and must stay unchanged
// until the draw returns.
struct ChunkDraw {
    std::span<const uint32_t> vertices;
    std::span<const uint32_t> instanceIndices; // One per vertex
    const InstanceTable* instances = nullptr;
    const ViewUniform* view = nullptr;
    const BlockPalette* palette = nullptr;
};

// Checks bindings, buffer lengths and instance indices before any work is
// dispatched. The palette is only required when the key's pass reads it;
// DefaultPrepass runs without one.
Result<void> validateDraw(const ChunkDraw& draw, const PipelineKey& key);

// A pipeline specialized for one PipelineKey. Construction picks the vertex
// and fragment stage instantiations once; per-vertex and per-fragment work
// then runs without consulting the key.
//
// With a WorkerPool the stages run in batches on the pool; without one they
// run on the calling thread. Both produce identical output.
class ChunkPipeline {
  public:
    static constexpr size_t kVertexBatch = 1024;
    static constexpr size_t kFragmentBatch = 4096;

    // Rejects flag combinations that have no meaning for the chosen pass.
    static Result<ChunkPipeline> specialize(const PipelineKey& key, WorkerPool* pool = nullptr);

    const PipelineKey& key() const { return key_; }

    // Vertex stage over every vertex of the draw, in input order.
    Result<std::vector<VertexOutput>> runVertices(const ChunkDraw& draw) const;

    // Fragment stage of a Forward pipeline.
    Result<std::vector<Rgba>> shadeForward(std::span<const FragmentInput> fragments, const ChunkMaterial& material,
                                           const ViewUniform& view, const LightingEnvironment& env) const;

    // Fragment stage of a prepass pipeline. `material` is required for
    // DeferredPrepass and ignored by DefaultPrepass.
    Result<std::vector<PrepassOutput>> shadePrepass(std::span<const FragmentInput> fragments,
                                                    const ChunkMaterial* material, const ViewUniform& view) const;

  private:
    using VertexFn = VertexOutput (*)(uint32_t, uint32_t, const InstanceTransform&, const ViewUniform&,
                                      const BlockPalette*);

    using FragmentStage =
        std::variant<ForwardFragment<false>, ForwardFragment<true>, DeferredPrepassFragment<false, false>,
                     DeferredPrepassFragment<false, true>, DeferredPrepassFragment<true, false>,
                     DeferredPrepassFragment<true, true>, DefaultPrepassFragment<false, false>,
                     DefaultPrepassFragment<false, true>, DefaultPrepassFragment<true, false>,
                     DefaultPrepassFragment<true, true>>;

    ChunkPipeline(const PipelineKey& key, VertexFn vertexFn, FragmentStage fragment, WorkerPool* pool);

    // Runs body over [0, count) on the pool or inline.
    void dispatch(size_t count, size_t batch, const std::function<void(size_t, size_t)>& body) const;

    PipelineKey key_;
    VertexFn vertexFn_;
    FragmentStage fragment_;
    WorkerPool* pool_;
};

} // namespace strata
