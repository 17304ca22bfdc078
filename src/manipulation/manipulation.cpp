#include <colorkit/manipulation/manipulation.h>

#include <colorkit/color/math.h>
#include <colorkit/core/config.h>

namespace colorkit {

using core::config::kMaxChroma;

Color lighten(const Color& color, double amount) {
    return color.with_l(clamp(color.l + amount * (1 - color.l), 0, 1));
}

Color darken(const Color& color, double amount) {
    return color.with_l(clamp(color.l - amount * color.l, 0, 1));
}

Color saturate(const Color& color, double amount) {
    return color.with_c(clamp(color.c + amount * kMaxChroma, 0, kMaxChroma));
}

Color desaturate(const Color& color, double amount) {
    return color.with_c(clamp(color.c - amount * color.c, 0, kMaxChroma));
}

Color adjust_hue(const Color& color, double degrees) {
    return color.with_h(normalize_hue(color.h + degrees));
}

Color set_alpha(const Color& color, double alpha) {
    return color.with_alpha(clamp(alpha, 0, 1));
}

Color mix(const Color& a, const Color& b, double t) {
    double h1 = a.h;
    double h2 = b.h;
    const double diff = h2 - h1;
    if (diff > 180) {
        h1 += 360;
    } else if (diff < -180) {
        h2 += 360;
    }

    return {
        lerp(a.l, b.l, t),
        lerp(a.c, b.c, t),
        normalize_hue(lerp(h1, h2, t)),
        lerp(a.alpha, b.alpha, t),
    };
}

Color invert(const Color& color) {
    return {1 - color.l, color.c, normalize_hue(color.h + 180), color.alpha};
}

Color grayscale(const Color& color) {
    return color.with_c(0);
}

} // namespace colorkit
