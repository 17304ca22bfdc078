#include <colorkit/contrast/contrast.h>

#include <colorkit/color/math.h>
#include <colorkit/conversion/convert.h>
#include <colorkit/conversion/srgb.h>
#include <colorkit/core/config.h>

#include <algorithm>
#include <cmath>

namespace colorkit {

namespace {

// APCA-W3 0.0.98G constants
constexpr double kApcaNormBg = 0.56;
constexpr double kApcaNormTxt = 0.57;
constexpr double kApcaRevTxt = 0.62;
constexpr double kApcaRevBg = 0.65;
constexpr double kApcaScale = 1.14;
constexpr double kApcaOffset = 0.027;
constexpr double kApcaBlackThreshold = 0.022;
constexpr double kApcaBlackClamp = 1.414;
constexpr double kApcaLoClip = 0.1;
constexpr double kApcaDeltaYMin = 0.0005;

double apca_luminance(const Color& color) {
    LinearRgb linear = conversion::srgb_to_linear(to_rgb(color));
    return 0.2126729 * linear.r + 0.7151522 * linear.g + 0.0721750 * linear.b;
}

double apca_soft_clamp(double y) {
    if (y > kApcaBlackThreshold) return y;
    return y + std::pow(kApcaBlackThreshold - y, kApcaBlackClamp);
}

} // namespace

double contrast_level_threshold(ContrastLevel level) {
    switch (level) {
        case ContrastLevel::AA:
            return core::config::kWcagAaThreshold;
        case ContrastLevel::AAA:
            return core::config::kWcagAaaThreshold;
    }
    return core::config::kWcagAaThreshold;
}

double relative_luminance(const Color& color) {
    LinearRgb linear = conversion::srgb_to_linear(to_rgb(color));
    return 0.2126 * linear.r + 0.7152 * linear.g + 0.0722 * linear.b;
}

double continuous_luminance(const Color& color) {
    LinearRgb linear = to_linear_srgb(color);
    double y = 0.2126 * linear.r + 0.7152 * linear.g + 0.0722 * linear.b;
    return std::max(0.0, y);
}

double contrast_ratio_from_luminance(double y1, double y2) {
    const double lighter = std::max(y1, y2);
    const double darker = std::min(y1, y2);
    return (lighter + 0.05) / (darker + 0.05);
}

double contrast_ratio(const Color& a, const Color& b) {
    return contrast_ratio_from_luminance(relative_luminance(a),
                                         relative_luminance(b));
}

bool meets_aa(const Color& a, const Color& b, bool large_text) {
    const double ratio = contrast_ratio(a, b);
    return ratio >= (large_text ? core::config::kWcagAaLargeThreshold
                                : core::config::kWcagAaThreshold);
}

bool meets_aaa(const Color& a, const Color& b, bool large_text) {
    const double ratio = contrast_ratio(a, b);
    return ratio >= (large_text ? core::config::kWcagAaaLargeThreshold
                                : core::config::kWcagAaaThreshold);
}

double contrast_apca(const Color& text, const Color& background) {
    const double txt = apca_soft_clamp(apca_luminance(text));
    const double bg = apca_soft_clamp(apca_luminance(background));
    if (std::fabs(bg - txt) < kApcaDeltaYMin) return 0;

    double sapc;
    if (bg > txt) {
        // dark text on a light background
        sapc = (std::pow(bg, kApcaNormBg) - std::pow(txt, kApcaNormTxt)) * kApcaScale;
        if (sapc < kApcaLoClip) return 0;
        return (sapc - kApcaOffset) * 100.0;
    }
    sapc = (std::pow(bg, kApcaRevBg) - std::pow(txt, kApcaRevTxt)) * kApcaScale;
    if (sapc > -kApcaLoClip) return 0;
    return (sapc + kApcaOffset) * 100.0;
}

} // namespace colorkit
