#include "strata/core/ShadingTables.hh"

#include <algorithm>

namespace strata {

const std::array<Vector3<float, Space::Local>, kFaceDirectionCount> kFaceNormals = {
    Vector3<float, Space::Local>(-1.0f, 0.0f, 0.0f), // Left
    Vector3<float, Space::Local>(1.0f, 0.0f, 0.0f),  // Right
    Vector3<float, Space::Local>(0.0f, -1.0f, 0.0f), // Down
    Vector3<float, Space::Local>(0.0f, 1.0f, 0.0f),  // Up
    Vector3<float, Space::Local>(0.0f, 0.0f, -1.0f), // Forward
    Vector3<float, Space::Local>(0.0f, 0.0f, 1.0f),  // Back
};

const Vector3<float, Space::Local>& faceNormal(uint32_t normalIndex) {
    return kFaceNormals[std::min(normalIndex, kFaceDirectionCount - 1)];
}

float aoMultiplier(uint32_t aoLevel) {
    return kAmbientOcclusionCurve[std::min<uint32_t>(aoLevel, kAmbientOcclusionCurve.size() - 1)];
}

} // namespace strata
