#include "strata/core/SimplexNoise.hh"

#include "strata/utils/WorkerPool.hh"

#include <gtest/gtest.h>

#include <algorithm>
#include <bit>
#include <cstdint>

using namespace strata;

TEST(SimplexNoiseTest, DeterministicBitForBit) {
    const float coords[][2] = {{0.5f, 0.25f}, {-123.75f, 98.5f}, {1e4f, -3e3f}, {17.3f, 17.3f}};
    for (const auto& c : coords) {
        float a = simplexNoise2(c[0], c[1]);
        float b = simplexNoise2(c[0], c[1]);
        EXPECT_EQ(std::bit_cast<uint32_t>(a), std::bit_cast<uint32_t>(b));
    }
}

TEST(SimplexNoiseTest, ZeroAtLatticeOrigin) {
    EXPECT_EQ(simplexNoise2(0.0f, 0.0f), 0.0f);
}

TEST(SimplexNoiseTest, BoundedOverLargeRange) {
    float lo = 0.0f;
    float hi = 0.0f;
    for (int j = 0; j < 400; ++j) {
        for (int i = 0; i < 400; ++i) {
            float v = simplexNoise2(-1000.0f + static_cast<float>(i) * 5.013f, -800.0f + static_cast<float>(j) * 4.37f);
            ASSERT_GE(v, -1.02f);
            ASSERT_LE(v, 1.02f);
            lo = std::min(lo, v);
            hi = std::max(hi, v);
        }
    }
    // The field actually varies
    EXPECT_LT(lo, -0.5f);
    EXPECT_GT(hi, 0.5f);
}

TEST(SimplexNoiseTest, ContinuousAtSmallSteps) {
    float prev = simplexNoise2(3.0f, 7.0f);
    for (int i = 1; i < 1000; ++i) {
        float v = simplexNoise2(3.0f + static_cast<float>(i) * 0.001f, 7.0f);
        EXPECT_LT(std::abs(v - prev), 0.05f);
        prev = v;
    }
}

TEST(SimplexNoiseTest, GridLayoutIsRowMajor) {
    NoiseGridDesc desc;
    desc.originX = 10.0f;
    desc.originY = -4.0f;
    desc.step = 0.25f;
    desc.width = 7;
    desc.height = 5;

    std::vector<float> grid = sampleNoiseGrid(desc);
    ASSERT_EQ(grid.size(), 35u);
    EXPECT_EQ(grid[0], simplexNoise2(10.0f, -4.0f));
    EXPECT_EQ(grid[2 * 7 + 3], simplexNoise2(10.0f + 3 * 0.25f, -4.0f + 2 * 0.25f));
}

TEST(SimplexNoiseTest, EmptyGrid) {
    NoiseGridDesc desc;
    desc.width = 16;
    EXPECT_TRUE(sampleNoiseGrid(desc).empty());
}

TEST(SimplexNoiseTest, ParallelGridMatchesSerial) {
    NoiseGridDesc desc;
    desc.originX = -64.0f;
    desc.originY = 32.0f;
    desc.step = 0.37f;
    desc.width = 129;
    desc.height = 97;

    WorkerPool pool(4);
    std::vector<float> serial = sampleNoiseGrid(desc);
    std::vector<float> parallel = sampleNoiseGrid(desc, &pool);
    ASSERT_EQ(serial.size(), parallel.size());
    for (size_t i = 0; i < serial.size(); ++i) {
        ASSERT_EQ(std::bit_cast<uint32_t>(serial[i]), std::bit_cast<uint32_t>(parallel[i])) << "sample " << i;
    }
}
