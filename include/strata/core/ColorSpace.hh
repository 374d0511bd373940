#pragma once

#include "strata/core/Spatial.hh"

namespace strata {

// sRGB transfer functions. The Rgba overloads convert RGB only; alpha passes
// through unchanged.
float srgbToLinear(float c);
float linearToSrgb(float c);
Rgba srgbToLinear(const Rgba& srgb);
Rgba linearToSrgb(const Rgba& linear);

} // namespace strata
