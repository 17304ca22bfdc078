#include <colorkit/css/color_serializer.h>

#include <colorkit/color/math.h>
#include <colorkit/conversion/convert.h>

#include <cstdio>

namespace colorkit::css {

std::string format_number(double value, int decimals) {
    double rounded = round_to(value, decimals);
    if (rounded == 0) rounded = 0;  // drop the sign of -0

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, rounded);
    std::string out = buf;
    if (out.find('.') != std::string::npos) {
        while (!out.empty() && out.back() == '0') out.pop_back();
        if (!out.empty() && out.back() == '.') out.pop_back();
    }
    if (out == "-0") out = "0";
    return out;
}

namespace {

std::string with_alpha(std::string body, double alpha) {
    if (alpha < 1) {
        body += " / ";
        body += format_number(alpha, 3);
    }
    body += ')';
    return body;
}

} // namespace

} // namespace colorkit::css

namespace colorkit {

std::string to_css(const Color& color, CssFormat format) {
    using css::format_number;
    using css::with_alpha;

    switch (format) {
        case CssFormat::Hex:
            return to_hex(color);
        case CssFormat::Rgb: {
            Rgb rgb = to_rgb(color);
            return with_alpha("rgb(" + format_number(rgb.r, 0) + " " +
                                  format_number(rgb.g, 0) + " " +
                                  format_number(rgb.b, 0),
                              rgb.alpha);
        }
        case CssFormat::Hsl: {
            Hsl hsl = to_hsl(color);
            return with_alpha("hsl(" + format_number(hsl.h, 1) + " " +
                                  format_number(hsl.s, 1) + "% " +
                                  format_number(hsl.l, 1) + "%",
                              hsl.alpha);
        }
        case CssFormat::Oklch:
            return with_alpha("oklch(" + format_number(color.l, 4) + " " +
                                  format_number(color.c, 4) + " " +
                                  format_number(color.h, 2),
                              color.alpha);
        case CssFormat::Oklab: {
            Oklab lab = to_oklab(color);
            return with_alpha("oklab(" + format_number(lab.L, 4) + " " +
                                  format_number(lab.a, 4) + " " +
                                  format_number(lab.b, 4),
                              lab.alpha);
        }
        case CssFormat::P3: {
            P3 p3 = to_p3(color);
            return with_alpha("color(display-p3 " + format_number(p3.r, 4) + " " +
                                  format_number(p3.g, 4) + " " +
                                  format_number(p3.b, 4),
                              p3.alpha);
        }
    }
    return to_hex(color);
}

} // namespace colorkit
