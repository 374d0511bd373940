#include "strata/core/ChunkMesh.hh"

#include "strata/core/VoxelVertex.hh"
#include "strata/utils/Profiler.hh"

#include <string>

namespace strata {

Vector3<float, Space::Local> AABB::center() const {
    return Vector3<float, Space::Local>((min.x + max.x) * 0.5f, (min.y + max.y) * 0.5f, (min.z + max.z) * 0.5f);
}

Vector3<float, Space::Local> AABB::extents() const {
    return Vector3<float, Space::Local>((max.x - min.x) * 0.5f, (max.y - min.y) * 0.5f, (max.z - min.z) * 0.5f);
}

void AABB::expand(const Vector3<float, Space::Local>& point) {
    min = min.min(point);
    max = max.max(point);
}

bool AABB::contains(const Vector3<float, Space::Local>& point) const {
    return point.x >= min.x && point.x <= max.x && point.y >= min.y && point.y <= max.y && point.z >= min.z &&
           point.z <= max.z;
}

std::optional<AABB> ChunkMesh::calculateAabb() const {
    STRATA_ZONE_SCOPED;

    if (vertices.empty()) {
        return std::nullopt;
    }

    auto first = VoxelVertex::positionOf(vertices.front());
    AABB box{first, first};
    for (uint32_t word : vertices) {
        box.expand(VoxelVertex::positionOf(word));
    }
    return box;
}

std::vector<uint32_t> generateQuadIndices(size_t vertexCount) {
    size_t quadCount = vertexCount / 4;
    std::vector<uint32_t> indices;
    indices.reserve(quadCount * 6);

    for (size_t q = 0; q < quadCount; ++q) {
        auto base = static_cast<uint32_t>(q * 4);
        indices.push_back(base);
        indices.push_back(base + 1);
        indices.push_back(base + 2);
        indices.push_back(base);
        indices.push_back(base + 2);
        indices.push_back(base + 3);
    }

    return indices;
}

Mat4f chunkTransform(const ChunkCoord& coord) {
    return Mat4f::translation(Vec3f(static_cast<float>(coord.x * kChunkSize), static_cast<float>(coord.y * kChunkSize),
                                    static_cast<float>(coord.z * kChunkSize)));
}

ChunkCoord worldToChunk(const Vec3f& position) {
    constexpr float kHalf = static_cast<float>(kChunkSize) * 0.5f;
    constexpr float kInv = 1.0f / static_cast<float>(kChunkSize);
    return ChunkCoord{static_cast<int>((position.x - kHalf) * kInv), static_cast<int>((position.y - kHalf) * kInv),
                      static_cast<int>((position.z - kHalf) * kInv)};
}

uint32_t InstanceTable::add(const Mat4f& model) {
    auto index = static_cast<uint32_t>(instances_.size());
    instances_.push_back(InstanceTransform{model, model.normalMatrix()});
    return index;
}

Result<const InstanceTransform*> InstanceTable::at(uint32_t index) const {
    if (index >= instances_.size()) {
        return Result<const InstanceTransform*>::error(ErrorCode::NotFound,
                                                       "instance " + std::to_string(index) + " not in table of " +
                                                           std::to_string(instances_.size()));
    }
    return Result<const InstanceTransform*>::ok(&instances_[index]);
}

} // namespace strata
