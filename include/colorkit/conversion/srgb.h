#pragma once
#include <colorkit/color/color.h>

#include <optional>
#include <string>
#include <string_view>

namespace colorkit::conversion {

// 8-bit sRGB (0-255) to linear light (0-1).
LinearRgb srgb_to_linear(const Rgb& rgb);

// Linear light to 8-bit sRGB. This is the device end of the pipeline, so the
// channels are rounded and clamped to 0-255 here and nowhere earlier.
Rgb linear_to_srgb(const LinearRgb& linear);

// "#rrggbb", or "#rrggbbaa" when alpha < 1. Lowercase.
std::string rgb_to_hex(const Rgb& rgb);

// Accepts 3, 4, 6 or 8 hex digits, with or without a leading '#'.
std::optional<Rgb> try_hex_to_rgb(std::string_view hex);
// Same, but throws std::runtime_error naming the input on failure.
Rgb hex_to_rgb(std::string_view hex);

} // namespace colorkit::conversion
