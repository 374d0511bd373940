#pragma once

#include "strata/core/ColorSpace.hh"
#include "strata/core/Spatial.hh"
#include "strata/utils/ErrorHandling.hh"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace strata {

struct PaletteEntry {
    Rgba color;
    Rgba emissive;
};

// Per-block color and emissive arrays, indexed by the 8-bit block field of a
// vertex word. Bound read-only for a whole draw; entries that were never set
// are transparent black.
class BlockPalette {
  public:
    static constexpr size_t kMaxEntries = 256;

    BlockPalette() = default;

    void set(uint8_t blockIndex, const Rgba& color, const Rgba& emissive);

    // Total over the index domain; no bounds check needed.
    PaletteEntry fetch(uint8_t blockIndex) const { return {colors_[blockIndex], emissive_[blockIndex]}; }

    const std::array<Rgba, kMaxEntries>& colors() const { return colors_; }
    const std::array<Rgba, kMaxEntries>& emissive() const { return emissive_; }

    // Number of entries written through set() (distinct indices).
    size_t definedCount() const;

  private:
    std::array<Rgba, kMaxEntries> colors_{};
    std::array<Rgba, kMaxEntries> emissive_{};
    std::array<bool, kMaxEntries> defined_{};
};

enum class BlockFlags : uint8_t {
    None = 0,
    Solid = 1 << 0,       // Appears in the opaque mesh
    Transparent = 1 << 1, // Appears in the transparent mesh
    Collision = 1 << 2    // Contributes to the collision mesh
};

inline BlockFlags operator|(BlockFlags a, BlockFlags b) {
    return static_cast<BlockFlags>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline BlockFlags operator&(BlockFlags a, BlockFlags b) {
    return static_cast<BlockFlags>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

inline bool hasFlag(BlockFlags flags, BlockFlags flag) {
    return (flags & flag) == flag;
}

enum class BlockVisibility : uint8_t {
    Solid,
    Transparent,
    Invisible
};

// Authoring description of a block. Colors are sRGB.
struct BlockDefinition {
    BlockVisibility visibility = BlockVisibility::Solid;
    bool collision = true;
    Rgba color = Rgba(1.0f, 0.0f, 1.0f, 1.0f);
    Rgba emissive = Rgba(0.0f, 0.0f, 0.0f, 0.0f);
};

using BlockId = uint16_t;

// Registry of block types. Ids are dense and assigned in registration order;
// they are stable only for the lifetime of the registry, string identifiers
// are the persistent key.
class BlockRegistry {
  public:
    Result<BlockId> addBlock(std::string identifier, const BlockDefinition& block);

    std::optional<BlockId> find(std::string_view identifier) const;
    const std::string& identifier(BlockId id) const;
    BlockFlags flags(BlockId id) const;

    bool isSolid(BlockId id) const { return strata::hasFlag(flags(id), BlockFlags::Solid); }
    bool hasFlag(BlockId id, BlockFlags flag) const { return strata::hasFlag(flags(id), flag); }

    size_t size() const { return identifiers_.size(); }

    // Linear-space palette, one entry per registered block.
    BlockPalette buildPalette() const;

  private:
    void checkId(BlockId id, const char* caller) const;

    std::unordered_map<std::string, BlockId> idsByIdentifier_;
    std::vector<std::string> identifiers_;
    std::vector<BlockFlags> flags_;
    std::vector<Rgba> colors_;
    std::vector<Rgba> emissive_;
};

} // namespace strata
