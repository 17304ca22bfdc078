#pragma once
#include <colorkit/color/color.h>

namespace colorkit {

// True when every unclamped linear-light channel of the target space lies in
// [-epsilon, 1 + epsilon].
bool in_gamut(const Color& color, GamutTarget gamut = GamutTarget::Srgb);

// Chroma-reduction mapping. Lightness, hue and alpha are held; chroma is
// binary-searched down to the highest in-gamut value.
Color to_gamut(const Color& color, GamutTarget gamut = GamutTarget::Srgb);

bool in_srgb_gamut(const Color& color);
bool in_p3_gamut(const Color& color);
Color to_srgb_gamut(const Color& color);
Color to_p3_gamut(const Color& color);

} // namespace colorkit
