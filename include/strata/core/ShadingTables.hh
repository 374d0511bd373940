#pragma once

#include "strata/core/Spatial.hh"

#include <array>
#include <cstdint>

namespace strata {

// Face direction encoded in the 3-bit normal field. The order is shared by the
// mesher, the prepass and the main pass; all of them read kFaceNormals.
enum class FaceDirection : uint8_t {
    Left = 0,
    Right = 1,
    Down = 2,
    Up = 3,
    Forward = 4,
    Back = 5
};

inline constexpr uint32_t kFaceDirectionCount = 6;

// Brightness multiplier per AO level, strictly decreasing.
inline constexpr std::array<float, 4> kAmbientOcclusionCurve = {1.0f, 0.7f, 0.5f, 0.15f};

// Unit normals in chunk-local space, indexed by FaceDirection.
extern const std::array<Vector3<float, Space::Local>, kFaceDirectionCount> kFaceNormals;

// Table lookups for the decoded vertex fields. Out-of-domain indices (normal
// 6-7, AO 4-7) clamp to the last entry, the same thing a bounds-clamped shader
// array read does. The result is meaningless but never reads past the table.
const Vector3<float, Space::Local>& faceNormal(uint32_t normalIndex);
float aoMultiplier(uint32_t aoLevel);

inline const Vector3<float, Space::Local>& faceNormal(FaceDirection face) {
    return faceNormal(static_cast<uint32_t>(face));
}

} // namespace strata
