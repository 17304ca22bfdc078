#pragma once
#include <colorkit/color/color.h>

#include <optional>
#include <string_view>

namespace colorkit::css {

// Parses hex (#rgb, #rgba, #rrggbb, #rrggbbaa), rgb()/rgba(), hsl()/hsla(),
// oklch(), oklab() and color(display-p3 ...). Function and keyword names are
// case-insensitive. rgb and hsl also take the legacy comma form, where a
// fourth argument is the alpha; the other syntaxes are space-separated with
// an optional "/ alpha". Out-of-range components are clamped, hues are
// wrapped into [0, 360).
std::optional<Color> try_parse_color(std::string_view text);

// Same as try_parse_color() but throws std::runtime_error naming the input.
Color parse_color(std::string_view text);

} // namespace colorkit::css

namespace colorkit {

inline std::optional<Color> try_parse(std::string_view text) {
    return css::try_parse_color(text);
}

inline Color parse(std::string_view text) {
    return css::parse_color(text);
}

} // namespace colorkit
