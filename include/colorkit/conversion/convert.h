#pragma once
#include <colorkit/color/color.h>

#include <string>
#include <string_view>

namespace colorkit {

// Canonical <-> device/text representations. All of these route through
// OKLab and linear sRGB; none of them mutate their input.

Rgb to_rgb(const Color& color);
Color from_rgb(const Rgb& rgb);

std::string to_hex(const Color& color);
Color from_hex(std::string_view hex);

Hsl to_hsl(const Color& color);
Color from_hsl(const Hsl& hsl);

Hsv to_hsv(const Color& color);
Color from_hsv(const Hsv& hsv);

Oklab to_oklab(const Color& color);
Color from_oklab(const Oklab& lab);

// The canonical color is OKLCH, so these are copies.
Color to_oklch(const Color& color);
Color from_oklch(const Color& oklch);

// Gamma-encoded Display P3, clamped to 0-1 as device output.
P3 to_p3(const Color& color);
Color from_p3(const P3& p3);

Hct to_hct(const Color& color);

// Unclamped linear-light sRGB; the gamut and contrast code reads this.
LinearRgb to_linear_srgb(const Color& color);

} // namespace colorkit
