#include <colorkit/color/math.h>

#include <algorithm>
#include <cmath>

namespace colorkit {

double clamp(double value, double min, double max) {
    return std::min(std::max(value, min), max);
}

double round_to(double value, int decimals) {
    const double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

double deg_to_rad(double degrees) {
    return degrees * kPi / 180.0;
}

double rad_to_deg(double radians) {
    return radians * 180.0 / kPi;
}

double normalize_hue(double hue) {
    double h = std::fmod(hue, 360.0);
    if (h < 0) h += 360.0;
    // -1e-17 + 360 rounds to 360
    if (h >= 360.0) h = 0;
    return h;
}

double lerp(double a, double b, double t) {
    return a + (b - a) * t;
}

double linear_to_srgb_channel(double c) {
    const double abs = std::fabs(c);
    if (abs <= 0.0031308) {
        return 12.92 * c;
    }
    return std::copysign(1.055 * std::pow(abs, 1.0 / 2.4) - 0.055, c);
}

double srgb_to_linear_channel(double c) {
    const double abs = std::fabs(c);
    if (abs <= 0.04045) {
        return c / 12.92;
    }
    return std::copysign(std::pow((abs + 0.055) / 1.055, 2.4), c);
}

} // namespace colorkit
