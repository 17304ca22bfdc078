#include <colorkit/conversion/convert.h>

#include <colorkit/color/math.h>
#include <colorkit/conversion/hct.h>
#include <colorkit/conversion/hsl.h>
#include <colorkit/conversion/oklab.h>
#include <colorkit/conversion/p3.h>
#include <colorkit/conversion/srgb.h>

namespace colorkit {

using namespace conversion;

LinearRgb to_linear_srgb(const Color& color) {
    return oklab_to_linear_rgb(oklch_to_oklab(color));
}

Rgb to_rgb(const Color& color) {
    return linear_to_srgb(to_linear_srgb(color));
}

Color from_rgb(const Rgb& rgb) {
    return oklab_to_oklch(linear_rgb_to_oklab(srgb_to_linear(rgb)));
}

std::string to_hex(const Color& color) {
    return rgb_to_hex(to_rgb(color));
}

Color from_hex(std::string_view hex) {
    return from_rgb(hex_to_rgb(hex));
}

Hsl to_hsl(const Color& color) {
    return rgb_to_hsl(to_rgb(color));
}

Color from_hsl(const Hsl& hsl) {
    return from_rgb(hsl_to_rgb(hsl));
}

Hsv to_hsv(const Color& color) {
    return rgb_to_hsv(to_rgb(color));
}

Color from_hsv(const Hsv& hsv) {
    return from_rgb(hsv_to_rgb(hsv));
}

Oklab to_oklab(const Color& color) {
    return oklch_to_oklab(color);
}

Color from_oklab(const Oklab& lab) {
    return oklab_to_oklch(lab);
}

Color to_oklch(const Color& color) {
    return color;
}

Color from_oklch(const Color& oklch) {
    return oklch;
}

P3 to_p3(const Color& color) {
    P3 p3 = linear_p3_to_p3(linear_srgb_to_linear_p3(to_linear_srgb(color)));
    p3.r = clamp(p3.r, 0, 1);
    p3.g = clamp(p3.g, 0, 1);
    p3.b = clamp(p3.b, 0, 1);
    return p3;
}

Color from_p3(const P3& p3) {
    return from_oklab(linear_rgb_to_oklab(linear_p3_to_linear_srgb(p3_to_linear_p3(p3))));
}

Hct to_hct(const Color& color) {
    Hct hct = rgb_to_hct(to_rgb(color));
    hct.alpha = color.alpha;
    return hct;
}

} // namespace colorkit
