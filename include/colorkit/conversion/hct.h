#pragma once
#include <colorkit/color/color.h>

namespace colorkit::conversion {

// Hue/chroma/tone appearance model: CAM16 hue and chroma under the default
// viewing conditions (D65, L* 50 background, average surround) and CIE L*
// tone. Derived from the 8-bit sRGB color, so alpha is carried through only.
Hct rgb_to_hct(const Rgb& rgb);

double lstar_from_y(double y);
double y_from_lstar(double lstar);

} // namespace colorkit::conversion
