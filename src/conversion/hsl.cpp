#include <colorkit/conversion/hsl.h>

#include <colorkit/color/math.h>

#include <algorithm>
#include <cmath>

namespace colorkit::conversion {

namespace {

// Hue of the max channel, shared by both hexcone models.
double hexcone_hue(double r, double g, double b, double max_c, double delta) {
    if (delta == 0) return 0;
    double h;
    if (max_c == r) h = 60.0 * ((g - b) / delta);
    else if (max_c == g) h = 60.0 * ((b - r) / delta) + 120.0;
    else h = 60.0 * ((r - g) / delta) + 240.0;
    return normalize_hue(h);
}

double hue_to_rgb(double p, double q, double t) {
    if (t < 0) t += 1;
    if (t > 1) t -= 1;
    if (t < 1.0 / 6.0) return p + (q - p) * 6.0 * t;
    if (t < 1.0 / 2.0) return q;
    if (t < 2.0 / 3.0) return p + (q - p) * (2.0 / 3.0 - t) * 6.0;
    return p;
}

} // namespace

Hsl rgb_to_hsl(const Rgb& rgb) {
    const double r = rgb.r / 255.0, g = rgb.g / 255.0, b = rgb.b / 255.0;
    const double max_c = std::max({r, g, b});
    const double min_c = std::min({r, g, b});
    const double delta = max_c - min_c;
    const double l = (max_c + min_c) / 2.0;

    double s = 0;
    if (delta != 0) {
        s = delta / (1.0 - std::fabs(2.0 * l - 1.0));
    }
    return {hexcone_hue(r, g, b, max_c, delta), s * 100.0, l * 100.0, rgb.alpha};
}

Rgb hsl_to_rgb(const Hsl& hsl) {
    const double h = normalize_hue(hsl.h) / 360.0;
    const double s = clamp(hsl.s, 0, 100) / 100.0;
    const double l = clamp(hsl.l, 0, 100) / 100.0;

    double r, g, b;
    if (s == 0) {
        r = g = b = l;
    } else {
        const double q = l < 0.5 ? l * (1 + s) : l + s - l * s;
        const double p = 2 * l - q;
        r = hue_to_rgb(p, q, h + 1.0 / 3.0);
        g = hue_to_rgb(p, q, h);
        b = hue_to_rgb(p, q, h - 1.0 / 3.0);
    }
    return {r * 255.0, g * 255.0, b * 255.0, hsl.alpha};
}

Hsv rgb_to_hsv(const Rgb& rgb) {
    const double r = rgb.r / 255.0, g = rgb.g / 255.0, b = rgb.b / 255.0;
    const double max_c = std::max({r, g, b});
    const double min_c = std::min({r, g, b});
    const double delta = max_c - min_c;

    const double s = max_c == 0 ? 0 : delta / max_c;
    return {hexcone_hue(r, g, b, max_c, delta), s * 100.0, max_c * 100.0, rgb.alpha};
}

Rgb hsv_to_rgb(const Hsv& hsv) {
    const double h = normalize_hue(hsv.h) / 60.0;
    const double s = clamp(hsv.s, 0, 100) / 100.0;
    const double v = clamp(hsv.v, 0, 100) / 100.0;

    const double chroma = v * s;
    const double x = chroma * (1 - std::fabs(std::fmod(h, 2.0) - 1));
    const double m = v - chroma;

    double r = 0, g = 0, b = 0;
    switch (static_cast<int>(h)) {
        case 0: r = chroma; g = x; break;
        case 1: r = x; g = chroma; break;
        case 2: g = chroma; b = x; break;
        case 3: g = x; b = chroma; break;
        case 4: r = x; b = chroma; break;
        default: r = chroma; b = x; break;
    }
    return {(r + m) * 255.0, (g + m) * 255.0, (b + m) * 255.0, hsv.alpha};
}

} // namespace colorkit::conversion
