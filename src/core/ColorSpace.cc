#include "strata/core/ColorSpace.hh"

#include <cmath>

namespace strata {

float srgbToLinear(float c) {
    if (c <= 0.04045f) {
        return c / 12.92f;
    }
    return std::pow((c + 0.055f) / 1.055f, 2.4f);
}

float linearToSrgb(float c) {
    if (c <= 0.0031308f) {
        return c * 12.92f;
    }
    return 1.055f * std::pow(c, 1.0f / 2.4f) - 0.055f;
}

Rgba srgbToLinear(const Rgba& srgb) {
    return Rgba(srgbToLinear(srgb.x), srgbToLinear(srgb.y), srgbToLinear(srgb.z), srgb.w);
}

Rgba linearToSrgb(const Rgba& linear) {
    return Rgba(linearToSrgb(linear.x), linearToSrgb(linear.y), linearToSrgb(linear.z), linear.w);
}

} // namespace strata
