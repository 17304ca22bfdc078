#pragma once
#include <colorkit/color/color.h>

namespace colorkit {

enum class ContrastLevel {
    AA,
    AAA,
};

// Minimum WCAG ratio for normal-size text at the level.
double contrast_level_threshold(ContrastLevel level);

// WCAG 2.x relative luminance of the 8-bit sRGB color. Alpha is ignored.
double relative_luminance(const Color& color);

// Luminance from unclamped, unquantized linear sRGB, floored at 0. Matches
// relative_luminance() for in-gamut colors up to 8-bit rounding and keeps
// ordering for wide-gamut colors.
double continuous_luminance(const Color& color);

// (lighter + 0.05) / (darker + 0.05), in [1, 21]. Symmetric.
double contrast_ratio(const Color& a, const Color& b);
double contrast_ratio_from_luminance(double y1, double y2);

bool meets_aa(const Color& a, const Color& b, bool large_text = false);
bool meets_aaa(const Color& a, const Color& b, bool large_text = false);

// APCA-W3 0.0.98G lightness contrast (Lc), roughly -108..106. Positive when
// the background is lighter than the text. Scores under Lc 10 clip to 0.
double contrast_apca(const Color& text, const Color& background);

} // namespace colorkit
