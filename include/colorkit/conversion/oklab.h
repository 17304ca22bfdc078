#pragma once
#include <colorkit/color/color.h>

namespace colorkit::conversion {

// Linear sRGB <-> OKLab using Ottosson's reference matrices.
Oklab linear_rgb_to_oklab(const LinearRgb& rgb);
LinearRgb oklab_to_linear_rgb(const Oklab& lab);

// Rectangular <-> polar. Chroma under 1e-4 reports hue 0.
Color oklab_to_oklch(const Oklab& lab);
Oklab oklch_to_oklab(const Color& color);

} // namespace colorkit::conversion
