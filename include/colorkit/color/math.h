#pragma once

namespace colorkit {

inline constexpr double kPi = 3.14159265358979323846;

double clamp(double value, double min, double max);

// Round half away from zero at the given number of decimals.
double round_to(double value, int decimals = 0);

double deg_to_rad(double degrees);
double rad_to_deg(double radians);

// Wraps any finite angle into [0, 360).
double normalize_hue(double hue);

double lerp(double a, double b, double t);

// sRGB transfer function, shared by Display P3. Both directions preserve the
// sign of out-of-range inputs instead of clamping them.
double linear_to_srgb_channel(double c);
double srgb_to_linear_channel(double c);

} // namespace colorkit
