#include <colorkit/conversion/p3.h>

#include <colorkit/color/math.h>

namespace colorkit::conversion {

P3 linear_srgb_to_linear_p3(const LinearRgb& rgb) {
    return {
        0.8224621724 * rgb.r + 0.1775378276 * rgb.g,
        0.0331941980 * rgb.r + 0.9668058020 * rgb.g,
        0.0170826307 * rgb.r + 0.0723974407 * rgb.g + 0.9105199286 * rgb.b,
        rgb.alpha,
    };
}

LinearRgb linear_p3_to_linear_srgb(const P3& p3) {
    return {
        1.2249401764 * p3.r - 0.2249401764 * p3.g,
        -0.0420569549 * p3.r + 1.0420569549 * p3.g,
        -0.0196375546 * p3.r - 0.0786360236 * p3.g + 1.0982735782 * p3.b,
        p3.alpha,
    };
}

P3 linear_p3_to_p3(const P3& linear) {
    return {
        linear_to_srgb_channel(linear.r),
        linear_to_srgb_channel(linear.g),
        linear_to_srgb_channel(linear.b),
        linear.alpha,
    };
}

P3 p3_to_linear_p3(const P3& p3) {
    return {
        srgb_to_linear_channel(p3.r),
        srgb_to_linear_channel(p3.g),
        srgb_to_linear_channel(p3.b),
        p3.alpha,
    };
}

} // namespace colorkit::conversion
