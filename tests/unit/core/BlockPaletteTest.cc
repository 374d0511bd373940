#include "strata/core/BlockPalette.hh"

#include <gtest/gtest.h>

#include <string>

using namespace strata;

TEST(BlockPaletteTest, UnsetEntriesAreTransparentBlack) {
    BlockPalette palette;
    EXPECT_EQ(palette.definedCount(), 0u);
    PaletteEntry entry = palette.fetch(200);
    EXPECT_EQ(entry.color, Rgba(0.0f, 0.0f, 0.0f, 0.0f));
    EXPECT_EQ(entry.emissive, Rgba(0.0f, 0.0f, 0.0f, 0.0f));
}

TEST(BlockPaletteTest, SetAndFetch) {
    BlockPalette palette;
    palette.set(255, Rgba(0.1f, 0.2f, 0.3f, 1.0f), Rgba(1.0f, 0.5f, 0.0f, 1.0f));
    palette.set(255, Rgba(0.4f, 0.2f, 0.3f, 1.0f), Rgba(1.0f, 0.5f, 0.0f, 1.0f));

    EXPECT_EQ(palette.definedCount(), 1u);
    EXPECT_EQ(palette.fetch(255).color, Rgba(0.4f, 0.2f, 0.3f, 1.0f));
    EXPECT_EQ(palette.colors()[255], palette.fetch(255).color);
    EXPECT_EQ(palette.emissive()[255], Rgba(1.0f, 0.5f, 0.0f, 1.0f));
}

TEST(BlockRegistryTest, IdsAreDenseInRegistrationOrder) {
    BlockRegistry registry;
    auto air = registry.addBlock("air", BlockDefinition{BlockVisibility::Invisible, false});
    auto stone = registry.addBlock("stone", BlockDefinition{});
    ASSERT_TRUE(air.isOk());
    ASSERT_TRUE(stone.isOk());
    EXPECT_EQ(air.value(), 0);
    EXPECT_EQ(stone.value(), 1);
    EXPECT_EQ(registry.size(), 2u);

    ASSERT_TRUE(registry.find("stone").has_value());
    EXPECT_EQ(*registry.find("stone"), 1);
    EXPECT_FALSE(registry.find("dirt").has_value());
    EXPECT_EQ(registry.identifier(1), "stone");
}

TEST(BlockRegistryTest, FlagsFollowVisibilityAndCollision) {
    BlockRegistry registry;
    BlockId stone = registry.addBlock("stone", BlockDefinition{}).value();
    BlockId glass =
        registry.addBlock("glass", BlockDefinition{BlockVisibility::Transparent, true}).value();
    BlockId air = registry.addBlock("air", BlockDefinition{BlockVisibility::Invisible, false}).value();

    EXPECT_TRUE(registry.isSolid(stone));
    EXPECT_TRUE(registry.hasFlag(stone, BlockFlags::Collision));
    EXPECT_FALSE(registry.hasFlag(stone, BlockFlags::Transparent));

    EXPECT_FALSE(registry.isSolid(glass));
    EXPECT_TRUE(registry.hasFlag(glass, BlockFlags::Transparent));
    EXPECT_TRUE(registry.hasFlag(glass, BlockFlags::Collision));

    EXPECT_EQ(registry.flags(air), BlockFlags::None);
}

TEST(BlockRegistryTest, EmptyFlagSetIsAlwaysContained) {
    EXPECT_TRUE(hasFlag(BlockFlags::None, BlockFlags::None));
    EXPECT_TRUE(hasFlag(BlockFlags::Solid | BlockFlags::Collision, BlockFlags::None));
    EXPECT_TRUE(hasFlag(BlockFlags::Solid | BlockFlags::Collision, BlockFlags::Solid | BlockFlags::Collision));
    EXPECT_FALSE(hasFlag(BlockFlags::Solid, BlockFlags::Solid | BlockFlags::Collision));
    EXPECT_FALSE(hasFlag(BlockFlags::None, BlockFlags::Transparent));
}

TEST(BlockRegistryTest, DuplicateIdentifierRejected) {
    BlockRegistry registry;
    ASSERT_TRUE(registry.addBlock("stone", BlockDefinition{}).isOk());
    auto again = registry.addBlock("stone", BlockDefinition{});
    ASSERT_TRUE(again.isError());
    EXPECT_EQ(again.code(), ErrorCode::AlreadyExists);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(BlockRegistryTest, OverflowPastPaletteRejected) {
    BlockRegistry registry;
    for (size_t i = 0; i < BlockPalette::kMaxEntries; ++i) {
        ASSERT_TRUE(registry.addBlock("block_" + std::to_string(i), BlockDefinition{}).isOk());
    }
    auto overflow = registry.addBlock("one_too_many", BlockDefinition{});
    ASSERT_TRUE(overflow.isError());
    EXPECT_EQ(overflow.code(), ErrorCode::ResourceExhausted);
    EXPECT_EQ(registry.size(), BlockPalette::kMaxEntries);
}

TEST(BlockRegistryTest, OutOfRangeIdThrows) {
    BlockRegistry registry;
    EXPECT_THROW(registry.identifier(3), StrataException);
    EXPECT_THROW(registry.flags(0), StrataException);

    try {
        (void)registry.identifier(7);
        FAIL() << "expected StrataException";
    } catch (const StrataException& e) {
        EXPECT_EQ(e.code(), ErrorCode::OutOfRange);
    }
}

TEST(BlockRegistryTest, PaletteIsLinear) {
    BlockRegistry registry;
    BlockDefinition grey;
    grey.color = Rgba(0.5f, 1.0f, 0.0f, 0.75f);
    grey.emissive = Rgba(1.0f, 0.0f, 0.0f, 1.0f);
    BlockId id = registry.addBlock("grey", grey).value();

    BlockPalette palette = registry.buildPalette();
    EXPECT_EQ(palette.definedCount(), 1u);

    PaletteEntry entry = palette.fetch(static_cast<uint8_t>(id));
    EXPECT_NEAR(entry.color.x, 0.21404f, 1e-4f);
    EXPECT_FLOAT_EQ(entry.color.y, 1.0f);
    EXPECT_FLOAT_EQ(entry.color.z, 0.0f);
    EXPECT_FLOAT_EQ(entry.color.w, 0.75f);
    EXPECT_FLOAT_EQ(entry.emissive.x, 1.0f);
}
