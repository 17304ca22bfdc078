#include <colorkit/conversion/srgb.h>

#include <colorkit/color/math.h>

#include <cmath>
#include <stdexcept>

namespace colorkit::conversion {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

int to_byte(double channel) {
    return static_cast<int>(clamp(std::round(channel), 0, 255));
}

void append_hex_pair(std::string& out, int value) {
    static constexpr char kDigits[] = "0123456789abcdef";
    out += kDigits[(value >> 4) & 0xF];
    out += kDigits[value & 0xF];
}

} // namespace

LinearRgb srgb_to_linear(const Rgb& rgb) {
    return {
        srgb_to_linear_channel(rgb.r / 255.0),
        srgb_to_linear_channel(rgb.g / 255.0),
        srgb_to_linear_channel(rgb.b / 255.0),
        rgb.alpha,
    };
}

Rgb linear_to_srgb(const LinearRgb& linear) {
    return {
        static_cast<double>(to_byte(linear_to_srgb_channel(linear.r) * 255.0)),
        static_cast<double>(to_byte(linear_to_srgb_channel(linear.g) * 255.0)),
        static_cast<double>(to_byte(linear_to_srgb_channel(linear.b) * 255.0)),
        linear.alpha,
    };
}

std::string rgb_to_hex(const Rgb& rgb) {
    std::string out = "#";
    out.reserve(9);
    append_hex_pair(out, to_byte(rgb.r));
    append_hex_pair(out, to_byte(rgb.g));
    append_hex_pair(out, to_byte(rgb.b));
    if (rgb.alpha < 1) {
        append_hex_pair(out, to_byte(rgb.alpha * 255.0));
    }
    return out;
}

std::optional<Rgb> try_hex_to_rgb(std::string_view hex) {
    if (!hex.empty() && hex.front() == '#') {
        hex.remove_prefix(1);
    }

    int digits[8] = {};
    if (hex.size() != 3 && hex.size() != 4 && hex.size() != 6 && hex.size() != 8) {
        return std::nullopt;
    }
    for (size_t i = 0; i < hex.size(); ++i) {
        digits[i] = hex_digit(hex[i]);
        if (digits[i] < 0) return std::nullopt;
    }

    Rgb rgb;
    if (hex.size() <= 4) {
        // #RGB[A] -> #RRGGBB[AA]
        rgb.r = digits[0] * 17;
        rgb.g = digits[1] * 17;
        rgb.b = digits[2] * 17;
        rgb.alpha = hex.size() == 4 ? (digits[3] * 17) / 255.0 : 1.0;
    } else {
        rgb.r = digits[0] * 16 + digits[1];
        rgb.g = digits[2] * 16 + digits[3];
        rgb.b = digits[4] * 16 + digits[5];
        rgb.alpha = hex.size() == 8 ? (digits[6] * 16 + digits[7]) / 255.0 : 1.0;
    }
    return rgb;
}

Rgb hex_to_rgb(std::string_view hex) {
    auto rgb = try_hex_to_rgb(hex);
    if (!rgb) {
        throw std::runtime_error("Invalid hex color: " + std::string(hex));
    }
    return *rgb;
}

} // namespace colorkit::conversion
