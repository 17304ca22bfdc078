#pragma once
#include <colorkit/color/color.h>

namespace colorkit::conversion {

// Hexcone models over 8-bit sRGB. Saturation/lightness/value are 0-100.
Hsl rgb_to_hsl(const Rgb& rgb);
Rgb hsl_to_rgb(const Hsl& hsl);

Hsv rgb_to_hsv(const Rgb& rgb);
Rgb hsv_to_rgb(const Hsv& hsv);

} // namespace colorkit::conversion
