#pragma once
#include <colorkit/color/color.h>

namespace colorkit::conversion {

// Linear sRGB <-> linear Display P3 (CSS Color 4 matrices via XYZ D65).
P3 linear_srgb_to_linear_p3(const LinearRgb& rgb);
LinearRgb linear_p3_to_linear_srgb(const P3& p3);

// P3 shares the sRGB transfer curve. Neither direction clamps.
P3 linear_p3_to_p3(const P3& linear);
P3 p3_to_linear_p3(const P3& p3);

} // namespace colorkit::conversion
