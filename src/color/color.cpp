#include <colorkit/color/color.h>

namespace colorkit {

const char* gamut_name(GamutTarget gamut) {
    switch (gamut) {
        case GamutTarget::Srgb:      return "srgb";
        case GamutTarget::DisplayP3: return "display-p3";
    }
    return "unknown";
}

const char* css_format_name(CssFormat format) {
    switch (format) {
        case CssFormat::Hex:   return "hex";
        case CssFormat::Rgb:   return "rgb";
        case CssFormat::Hsl:   return "hsl";
        case CssFormat::Oklch: return "oklch";
        case CssFormat::Oklab: return "oklab";
        case CssFormat::P3:    return "p3";
    }
    return "unknown";
}

} // namespace colorkit
