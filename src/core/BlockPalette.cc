#include "strata/core/BlockPalette.hh"

#include "strata/core/Log.hh"

#include <algorithm>

namespace strata {

void BlockPalette::set(uint8_t blockIndex, const Rgba& color, const Rgba& emissive) {
    colors_[blockIndex] = color;
    emissive_[blockIndex] = emissive;
    defined_[blockIndex] = true;
}

size_t BlockPalette::definedCount() const {
    return static_cast<size_t>(std::count(defined_.begin(), defined_.end(), true));
}

Result<BlockId> BlockRegistry::addBlock(std::string identifier, const BlockDefinition& block) {
    if (idsByIdentifier_.count(identifier) != 0) {
        return Result<BlockId>::error(ErrorCode::AlreadyExists, "block '" + identifier + "' already registered");
    }
    if (identifiers_.size() >= BlockPalette::kMaxEntries) {
        return Result<BlockId>::error(ErrorCode::ResourceExhausted,
                                      "block '" + identifier + "' exceeds the 256-entry palette");
    }

    BlockFlags blockFlags = BlockFlags::None;
    switch (block.visibility) {
        case BlockVisibility::Solid:
            blockFlags = BlockFlags::Solid;
            break;
        case BlockVisibility::Transparent:
            blockFlags = BlockFlags::Transparent;
            break;
        case BlockVisibility::Invisible:
            break;
    }
    if (block.collision) {
        blockFlags = blockFlags | BlockFlags::Collision;
    }

    auto id = static_cast<BlockId>(identifiers_.size());
    identifiers_.push_back(identifier);
    flags_.push_back(blockFlags);
    colors_.push_back(block.color);
    emissive_.push_back(block.emissive);
    idsByIdentifier_.emplace(std::move(identifier), id);
    return Result<BlockId>::ok(id);
}

std::optional<BlockId> BlockRegistry::find(std::string_view identifier) const {
    auto it = idsByIdentifier_.find(std::string(identifier));
    if (it == idsByIdentifier_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void BlockRegistry::checkId(BlockId id, const char* caller) const {
    if (id >= identifiers_.size()) {
        throwError(ErrorCode::OutOfRange,
                   std::string("BlockRegistry::") + caller + ": block id " + std::to_string(id) + " out of range");
    }
}

const std::string& BlockRegistry::identifier(BlockId id) const {
    checkId(id, "identifier");
    return identifiers_[id];
}

BlockFlags BlockRegistry::flags(BlockId id) const {
    checkId(id, "flags");
    return flags_[id];
}

BlockPalette BlockRegistry::buildPalette() const {
    BlockPalette palette;
    for (size_t i = 0; i < identifiers_.size(); ++i) {
        palette.set(static_cast<uint8_t>(i), srgbToLinear(colors_[i]), srgbToLinear(emissive_[i]));
    }
    STRATA_LOG_DEBUG("Built block palette with {} entries", identifiers_.size());
    return palette;
}

} // namespace strata
