#pragma once

#include <cstddef>
#include <vector>

namespace strata {

class WorkerPool;

// 2D simplex noise over the mod-289 permutation polynomial. Pure and
// stateless: the same input always gives the same output at a given float
// precision. Output lies within about [-1, 1].
float simplexNoise2(float x, float y);

// Rectangular sample grid: sample (i, j) is taken at
// (originX + i * step, originY + j * step).
struct NoiseGridDesc {
    float originX = 0.0f;
    float originY = 0.0f;
    float step = 1.0f;
    size_t width = 0;
    size_t height = 0;
};

// Row-major width * height samples. Rows are split across the pool when one
// is given; the result matches serial evaluation exactly.
std::vector<float> sampleNoiseGrid(const NoiseGridDesc& desc, WorkerPool* pool = nullptr);

} // namespace strata
