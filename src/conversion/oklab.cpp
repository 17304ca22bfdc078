#include <colorkit/conversion/oklab.h>

#include <colorkit/color/math.h>
#include <colorkit/core/config.h>

#include <cmath>

namespace colorkit::conversion {

Oklab linear_rgb_to_oklab(const LinearRgb& rgb) {
    // Linear sRGB -> LMS
    const double l = 0.4122214708 * rgb.r + 0.5363325363 * rgb.g + 0.0514459929 * rgb.b;
    const double m = 0.2119034982 * rgb.r + 0.6806995451 * rgb.g + 0.1073969566 * rgb.b;
    const double s = 0.0883024619 * rgb.r + 0.2817188376 * rgb.g + 0.6299787005 * rgb.b;

    const double l_ = std::cbrt(l);
    const double m_ = std::cbrt(m);
    const double s_ = std::cbrt(s);

    return {
        0.2104542553 * l_ + 0.7936177850 * m_ - 0.0040720468 * s_,
        1.9779984951 * l_ - 2.4285922050 * m_ + 0.4505937099 * s_,
        0.0259040371 * l_ + 0.7827717662 * m_ - 0.8086757660 * s_,
        rgb.alpha,
    };
}

LinearRgb oklab_to_linear_rgb(const Oklab& lab) {
    const double l_ = lab.L + 0.3963377774 * lab.a + 0.2158037573 * lab.b;
    const double m_ = lab.L - 0.1055613458 * lab.a - 0.0638541728 * lab.b;
    const double s_ = lab.L - 0.0894841775 * lab.a - 1.2914855480 * lab.b;

    const double l = l_ * l_ * l_;
    const double m = m_ * m_ * m_;
    const double s = s_ * s_ * s_;

    // LMS -> linear sRGB
    return {
        +4.0767416621 * l - 3.3077115913 * m + 0.2309699292 * s,
        -1.2684380046 * l + 2.6097574011 * m - 0.3413193965 * s,
        -0.0041960863 * l - 0.7034186147 * m + 1.7076147010 * s,
        lab.alpha,
    };
}

Color oklab_to_oklch(const Oklab& lab) {
    const double c = std::hypot(lab.a, lab.b);
    double h = normalize_hue(rad_to_deg(std::atan2(lab.b, lab.a)));
    if (c < core::config::kAchromaticThreshold) {
        h = 0;
    }
    return {lab.L, c, h, lab.alpha};
}

Oklab oklch_to_oklab(const Color& color) {
    const double h_rad = deg_to_rad(color.h);
    return {
        color.l,
        color.c * std::cos(h_rad),
        color.c * std::sin(h_rad),
        color.alpha,
    };
}

} // namespace colorkit::conversion
