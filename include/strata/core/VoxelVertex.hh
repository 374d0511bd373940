#pragma once

#include "strata/core/Spatial.hh"

#include <cstdint>

namespace strata {

// Packed 4-byte chunk vertex, produced by the mesher and consumed unchanged.
// word: px[5:0] | py[11:6] | pz[17:12] | ao[20:18] | normalIdx[23:21] | block[31:24]
//
// Decoding is total: every word yields a value for each field. AO levels 4-7
// and normal indices 6-7 are representable but meaningless; the mesher never
// emits them and nothing downstream checks.
struct VoxelVertex {
    static constexpr uint32_t kPosBits = 6;
    static constexpr uint32_t kAoBits = 3;
    static constexpr uint32_t kNormalBits = 3;
    static constexpr uint32_t kBlockBits = 8;

    static constexpr uint32_t kPosYShift = 6;
    static constexpr uint32_t kPosZShift = 12;
    static constexpr uint32_t kAoShift = 18;
    static constexpr uint32_t kNormalShift = 21;
    static constexpr uint32_t kBlockShift = 24;

    static constexpr uint32_t mask(uint32_t bits) { return (1u << bits) - 1u; }

    uint8_t x = 0;
    uint8_t y = 0;
    uint8_t z = 0;
    uint8_t ao = 0;
    uint8_t normalIndex = 0;
    uint8_t blockIndex = 0;

    // Every field is masked to its width before shifting so an oversized input
    // can never bleed into a neighbouring field.
    static constexpr uint32_t pack(uint32_t px, uint32_t py, uint32_t pz, uint32_t ao, uint32_t normalIdx,
                                   uint32_t block) {
        return (px & mask(kPosBits)) | ((py & mask(kPosBits)) << kPosYShift) |
               ((pz & mask(kPosBits)) << kPosZShift) | ((ao & mask(kAoBits)) << kAoShift) |
               ((normalIdx & mask(kNormalBits)) << kNormalShift) | ((block & mask(kBlockBits)) << kBlockShift);
    }

    static constexpr VoxelVertex unpack(uint32_t word) {
        VoxelVertex v;
        v.x = static_cast<uint8_t>(word & mask(kPosBits));
        v.y = static_cast<uint8_t>((word >> kPosYShift) & mask(kPosBits));
        v.z = static_cast<uint8_t>((word >> kPosZShift) & mask(kPosBits));
        v.ao = static_cast<uint8_t>((word >> kAoShift) & mask(kAoBits));
        v.normalIndex = static_cast<uint8_t>((word >> kNormalShift) & mask(kNormalBits));
        v.blockIndex = static_cast<uint8_t>((word >> kBlockShift) & mask(kBlockBits));
        return v;
    }

    constexpr uint32_t packed() const { return pack(x, y, z, ao, normalIndex, blockIndex); }

    // Local chunk-space position; every field is exact in float.
    Vector3<float, Space::Local> position() const {
        return Vector3<float, Space::Local>(static_cast<float>(x), static_cast<float>(y), static_cast<float>(z));
    }

    static Vector3<float, Space::Local> positionOf(uint32_t word) { return unpack(word).position(); }
};

static_assert(VoxelVertex::pack(63, 63, 63, 7, 7, 255) == 0xFFFFFFFFu, "vertex fields must cover all 32 bits");
static_assert(VoxelVertex::pack(1, 0, 0, 0, 0, 0) == 1u, "x occupies the low bits");
static_assert(VoxelVertex::pack(0, 0, 0, 0, 0, 1) == (1u << 24), "block index occupies the high byte");

} // namespace strata
