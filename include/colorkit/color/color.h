#pragma once
#include <string_view>

namespace colorkit {

// Canonical color: OKLCH lightness/chroma/hue plus alpha. Every conversion
// routes through this value. Treat it as immutable; the with_* helpers return
// a copy with one field replaced.
struct Color {
    double l = 0;      // 0 (black) .. 1 (white)
    double c = 0;      // 0 (gray) .. ~0.4, soft ceiling
    double h = 0;      // degrees, [0, 360)
    double alpha = 1;  // 0 (transparent) .. 1 (opaque)

    Color with_l(double value) const { return {value, c, h, alpha}; }
    Color with_c(double value) const { return {l, value, h, alpha}; }
    Color with_h(double value) const { return {l, c, value, alpha}; }
    Color with_alpha(double value) const { return {l, c, h, value}; }

    bool operator==(const Color& other) const = default;
};

// sRGB, 0-255 per channel.
struct Rgb {
    double r = 0;
    double g = 0;
    double b = 0;
    double alpha = 1;

    bool operator==(const Rgb& other) const = default;
};

// Linear-light RGB, nominally 0-1 but never clamped.
struct LinearRgb {
    double r = 0;
    double g = 0;
    double b = 0;
    double alpha = 1;
};

struct Hsl {
    double h = 0;  // 0-360
    double s = 0;  // 0-100
    double l = 0;  // 0-100
    double alpha = 1;
};

struct Hsv {
    double h = 0;  // 0-360
    double s = 0;  // 0-100
    double v = 0;  // 0-100
    double alpha = 1;
};

struct Oklab {
    double L = 0;
    double a = 0;
    double b = 0;
    double alpha = 1;
};

// Gamma-encoded (or, for the linear helpers, linear) Display P3, 0-1.
struct P3 {
    double r = 0;
    double g = 0;
    double b = 0;
    double alpha = 1;
};

// CAM16 hue/chroma with CIE L* tone.
struct Hct {
    double h = 0;
    double c = 0;
    double t = 0;
    double alpha = 1;
};

enum class GamutTarget {
    Srgb,
    DisplayP3,
};

const char* gamut_name(GamutTarget gamut);

enum class CssFormat {
    Hex,
    Rgb,
    Hsl,
    Oklch,
    Oklab,
    P3,
};

const char* css_format_name(CssFormat format);

} // namespace colorkit
