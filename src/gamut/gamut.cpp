#include <colorkit/gamut/gamut.h>

#include <colorkit/conversion/convert.h>
#include <colorkit/conversion/p3.h>
#include <colorkit/core/config.h>

namespace colorkit {

namespace {

bool channel_in_range(double v) {
    constexpr double eps = core::config::kGamutEpsilon;
    return v >= -eps && v <= 1 + eps;
}

} // namespace

bool in_gamut(const Color& color, GamutTarget gamut) {
    LinearRgb linear = to_linear_srgb(color);
    if (gamut == GamutTarget::DisplayP3) {
        P3 p3 = conversion::linear_srgb_to_linear_p3(linear);
        return channel_in_range(p3.r) && channel_in_range(p3.g) &&
               channel_in_range(p3.b);
    }
    return channel_in_range(linear.r) && channel_in_range(linear.g) &&
           channel_in_range(linear.b);
}

Color to_gamut(const Color& color, GamutTarget gamut) {
    if (in_gamut(color, gamut)) return color;
    if (color.l <= 0 || color.l >= 1) return color.with_c(0);

    double lo = 0;
    double hi = color.c;
    while (hi - lo > core::config::kMappingTolerance) {
        double mid = (lo + hi) / 2;
        if (in_gamut(color.with_c(mid), gamut)) {
            lo = mid;
        } else {
            hi = mid;
        }
    }
    return color.with_c(lo);
}

bool in_srgb_gamut(const Color& color) {
    return in_gamut(color, GamutTarget::Srgb);
}

bool in_p3_gamut(const Color& color) {
    return in_gamut(color, GamutTarget::DisplayP3);
}

Color to_srgb_gamut(const Color& color) {
    return to_gamut(color, GamutTarget::Srgb);
}

Color to_p3_gamut(const Color& color) {
    return to_gamut(color, GamutTarget::DisplayP3);
}

} // namespace colorkit
