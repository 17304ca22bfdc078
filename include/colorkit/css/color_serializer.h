#pragma once
#include <colorkit/color/color.h>

#include <string>

namespace colorkit::css {

// Formats a number rounded to `decimals` places without trailing zeros
// ("0.7", "30", "-0.0123"). Negative zero prints as "0".
std::string format_number(double value, int decimals);

} // namespace colorkit::css

namespace colorkit {

// CSS text for the color. rgb() channels are integers, hsl() uses one
// decimal, oklch() four for l/c and two for h, oklab() and display-p3 four.
// Alpha is appended as " / a" (three decimals) only when below 1.
std::string to_css(const Color& color, CssFormat format = CssFormat::Hex);

} // namespace colorkit
