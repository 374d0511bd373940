#pragma once

#include "strata/core/Spatial.hh"
#include "strata/utils/ErrorHandling.hh"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace strata {

// Voxels per chunk edge. Vertex positions span 0..kChunkSize inclusive, which
// the 6-bit position fields cover with room to spare.
inline constexpr int kChunkSize = 32;

// Axis-aligned bounding box in chunk-local space
struct AABB {
    Vector3<float, Space::Local> min;
    Vector3<float, Space::Local> max;

    Vector3<float, Space::Local> center() const;
    Vector3<float, Space::Local> extents() const;

    void expand(const Vector3<float, Space::Local>& point);
    bool contains(const Vector3<float, Space::Local>& point) const;
};

// GPU-ready chunk payload as handed over by the mesher: packed vertex words
// and a 32-bit index list.
struct ChunkMesh {
    std::vector<uint32_t> vertices;
    std::vector<uint32_t> indices;

    // Bounds of the decoded positions; nullopt for an empty mesh.
    std::optional<AABB> calculateAabb() const;
};

// Index list for vertices laid out as counter-clockwise quads (4 per quad):
// 0,1,2 0,2,3 per quad. A trailing partial quad is ignored.
std::vector<uint32_t> generateQuadIndices(size_t vertexCount);

struct ChunkCoord {
    int x = 0;
    int y = 0;
    int z = 0;

    bool operator==(const ChunkCoord& other) const { return x == other.x && y == other.y && z == other.z; }
};

// Local-to-world transform of a chunk: translation by coord * kChunkSize.
Mat4f chunkTransform(const ChunkCoord& coord);

// Chunk containing a world position, measured from chunk centers and
// truncated toward zero.
ChunkCoord worldToChunk(const Vec3f& position);

struct InstanceTransform {
    Mat4f model;
    Mat4f normal; // inverse-transpose of model's upper 3x3
};

// Per-instance transform table indexed by the instance index each vertex
// carries. Written by the chunk layer between draws, read-only during one.
class InstanceTable {
  public:
    uint32_t add(const Mat4f& model);
    uint32_t add(const ChunkCoord& coord) { return add(chunkTransform(coord)); }

    // Unchecked; draws are validated against size() before dispatch.
    const InstanceTransform& operator[](uint32_t index) const { return instances_[index]; }

    Result<const InstanceTransform*> at(uint32_t index) const;

    size_t size() const { return instances_.size(); }
    void clear() { instances_.clear(); }

  private:
    std::vector<InstanceTransform> instances_;
};

} // namespace strata
