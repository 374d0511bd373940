#include "strata/core/SimplexNoise.hh"

#include "strata/core/Log.hh"
#include "strata/utils/Profiler.hh"
#include "strata/utils/WorkerPool.hh"

#include <glm/glm.hpp>

namespace strata {

namespace {

// Skew / unskew factors: (3 - sqrt(3)) / 6, (sqrt(3) - 1) / 2, -1 + 2 * C.x, 1 / 41
constexpr glm::vec4 kC(0.211324865405187f, 0.366025403784439f, -0.577350269189626f, 0.024390243902439f);

template <typename V> V mod289(const V& x) {
    return x - glm::floor(x * (1.0f / 289.0f)) * 289.0f;
}

glm::vec3 permute(const glm::vec3& x) {
    return mod289(((x * 34.0f) + 1.0f) * x);
}

} // namespace

float simplexNoise2(float x, float y) {
    const glm::vec2 v(x, y);

    // First corner
    glm::vec2 i = glm::floor(v + glm::dot(v, glm::vec2(kC.y)));
    const glm::vec2 x0 = v - i + glm::dot(i, glm::vec2(kC.x));

    // Middle corner
    const glm::vec2 i1 = (x0.x > x0.y) ? glm::vec2(1.0f, 0.0f) : glm::vec2(0.0f, 1.0f);
    glm::vec4 x12 = glm::vec4(x0.x, x0.y, x0.x, x0.y) + glm::vec4(kC.x, kC.x, kC.z, kC.z);
    x12.x -= i1.x;
    x12.y -= i1.y;

    // Permutations
    i = mod289(i);
    const glm::vec3 p =
        permute(permute(i.y + glm::vec3(0.0f, i1.y, 1.0f)) + i.x + glm::vec3(0.0f, i1.x, 1.0f));

    glm::vec3 m = glm::max(
        0.5f - glm::vec3(glm::dot(x0, x0), glm::dot(glm::vec2(x12.x, x12.y), glm::vec2(x12.x, x12.y)),
                         glm::dot(glm::vec2(x12.z, x12.w), glm::vec2(x12.z, x12.w))),
        0.0f);
    m = m * m;
    m = m * m;

    // Gradients: 41 points uniformly over a line, mapped onto a diamond
    const glm::vec3 gx = 2.0f * glm::fract(p * kC.w) - 1.0f;
    const glm::vec3 h = glm::abs(gx) - 0.5f;
    const glm::vec3 ox = glm::floor(gx + 0.5f);
    const glm::vec3 a0 = gx - ox;

    // Normalise gradients implicitly by scaling m
    m *= 1.79284291400159f - 0.85373472095314f * (a0 * a0 + h * h);

    glm::vec3 g;
    g.x = a0.x * x0.x + h.x * x0.y;
    g.y = a0.y * x12.x + h.y * x12.y;
    g.z = a0.z * x12.z + h.z * x12.w;
    return 130.0f * glm::dot(m, g);
}

std::vector<float> sampleNoiseGrid(const NoiseGridDesc& desc, WorkerPool* pool) {
    STRATA_ZONE_SCOPED;

    std::vector<float> out(desc.width * desc.height);
    if (out.empty()) {
        return out;
    }

    auto rows = [&](size_t begin, size_t end) {
        for (size_t j = begin; j < end; ++j) {
            const float y = desc.originY + static_cast<float>(j) * desc.step;
            for (size_t i = 0; i < desc.width; ++i) {
                out[j * desc.width + i] = simplexNoise2(desc.originX + static_cast<float>(i) * desc.step, y);
            }
        }
    };

    if (pool) {
        pool->parallelFor(desc.height, 8, rows);
    } else {
        rows(0, desc.height);
    }

    STRATA_LOG_TERRAIN_DEBUG("Sampled {}x{} noise grid at ({}, {}) step {}", desc.width, desc.height, desc.originX,
                             desc.originY, desc.step);
    return out;
}

} // namespace strata
