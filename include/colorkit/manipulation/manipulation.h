#pragma once
#include <colorkit/color/color.h>

namespace colorkit {

// Relative adjustments in OKLCH. amount is a 0-1 fraction; every function
// returns a new color and clamps to the canonical ranges.
Color lighten(const Color& color, double amount);
Color darken(const Color& color, double amount);
Color saturate(const Color& color, double amount);
Color desaturate(const Color& color, double amount);

Color adjust_hue(const Color& color, double degrees);
Color set_alpha(const Color& color, double alpha);

// Interpolates l, c and alpha linearly and hue along the shorter arc.
// t = 0 gives a, t = 1 gives b.
Color mix(const Color& a, const Color& b, double t = 0.5);

// Complements lightness and rotates hue by 180 degrees.
Color invert(const Color& color);
Color grayscale(const Color& color);

} // namespace colorkit
