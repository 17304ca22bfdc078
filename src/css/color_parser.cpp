#include <colorkit/css/color_parser.h>

#include <colorkit/color/math.h>
#include <colorkit/conversion/convert.h>
#include <colorkit/conversion/srgb.h>
#include <colorkit/core/config.h>
#include <colorkit/css/tokenizer.h>

#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

namespace colorkit::css {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// Components of a color function between its parentheses.
struct Arguments {
    std::vector<CSSToken> values;
    std::optional<CSSToken> alpha;
    bool legacy = false;  // comma-separated
};

// Splits the argument list of the function token at tokens[pos - 1]. The
// closing parenthesis must be followed only by whitespace.
std::optional<Arguments> split_arguments(const std::vector<CSSToken>& tokens,
                                         size_t pos, bool allow_commas) {
    std::vector<CSSToken> items;
    bool closed = false;
    for (; pos < tokens.size(); ++pos) {
        const auto& tok = tokens[pos];
        if (tok.type == CSSToken::Whitespace) continue;
        if (tok.type == CSSToken::RightParen) {
            closed = true;
            ++pos;
            break;
        }
        switch (tok.type) {
            case CSSToken::Number:
            case CSSToken::Percentage:
            case CSSToken::Dimension:
            case CSSToken::Ident:
            case CSSToken::Comma:
                items.push_back(tok);
                break;
            case CSSToken::Delim:
                if (tok.value != "/") return std::nullopt;
                items.push_back(tok);
                break;
            default:
                return std::nullopt;
        }
    }
    if (!closed) return std::nullopt;
    for (; pos < tokens.size(); ++pos) {
        if (tokens[pos].type != CSSToken::Whitespace &&
            tokens[pos].type != CSSToken::EndOfFile) {
            return std::nullopt;
        }
    }

    Arguments args;
    bool has_comma = false;
    for (const auto& item : items) {
        if (item.type == CSSToken::Comma) has_comma = true;
    }

    if (has_comma) {
        if (!allow_commas) return std::nullopt;
        // value (, value)*
        for (size_t i = 0; i < items.size(); ++i) {
            bool expect_value = (i % 2 == 0);
            bool is_comma = items[i].type == CSSToken::Comma;
            bool is_slash = items[i].type == CSSToken::Delim;
            if (is_slash) return std::nullopt;
            if (expect_value == is_comma) return std::nullopt;
            if (expect_value) args.values.push_back(items[i]);
        }
        if (items.size() % 2 == 0) return std::nullopt;  // trailing comma
        if (args.values.size() == 4) {
            args.alpha = args.values.back();
            args.values.pop_back();
        }
        args.legacy = true;
        return args;
    }

    // value* [/ value]
    for (size_t i = 0; i < items.size(); ++i) {
        if (items[i].type == CSSToken::Delim) {
            if (i + 2 != items.size()) return std::nullopt;
            if (items[i + 1].type == CSSToken::Delim) return std::nullopt;
            args.alpha = items[i + 1];
            break;
        }
        args.values.push_back(items[i]);
    }
    return args;
}

std::optional<double> parse_alpha(const std::optional<CSSToken>& tok) {
    if (!tok) return 1.0;
    if (tok->type == CSSToken::Number) return clamp(tok->numeric_value, 0, 1);
    if (tok->type == CSSToken::Percentage) {
        return clamp(tok->numeric_value / 100.0, 0, 1);
    }
    return std::nullopt;
}

std::optional<double> parse_hue(const CSSToken& tok) {
    if (tok.type == CSSToken::Number) return normalize_hue(tok.numeric_value);
    if (tok.type == CSSToken::Dimension && iequals(tok.unit, "deg")) {
        return normalize_hue(tok.numeric_value);
    }
    return std::nullopt;
}

// Number as-is, percentage multiplied by percent_scale / 100.
std::optional<double> parse_scaled(const CSSToken& tok, double percent_scale) {
    if (tok.type == CSSToken::Number) return tok.numeric_value;
    if (tok.type == CSSToken::Percentage) {
        return tok.numeric_value * percent_scale / 100.0;
    }
    return std::nullopt;
}

std::optional<Color> parse_rgb(const Arguments& args) {
    if (args.values.size() != 3) return std::nullopt;
    double channels[3];
    for (int i = 0; i < 3; ++i) {
        auto v = parse_scaled(args.values[i], 255.0);
        if (!v) return std::nullopt;
        channels[i] = clamp(*v, 0, 255);
    }
    auto alpha = parse_alpha(args.alpha);
    if (!alpha) return std::nullopt;
    return from_rgb({channels[0], channels[1], channels[2], *alpha});
}

std::optional<Color> parse_hsl(const Arguments& args) {
    if (args.values.size() != 3) return std::nullopt;
    auto h = parse_hue(args.values[0]);
    if (!h) return std::nullopt;
    if (args.values[1].type != CSSToken::Percentage ||
        args.values[2].type != CSSToken::Percentage) {
        return std::nullopt;
    }
    auto alpha = parse_alpha(args.alpha);
    if (!alpha) return std::nullopt;
    return from_hsl({*h, clamp(args.values[1].numeric_value, 0, 100),
                     clamp(args.values[2].numeric_value, 0, 100), *alpha});
}

std::optional<Color> parse_oklch(const Arguments& args) {
    if (args.values.size() != 3) return std::nullopt;
    auto l = parse_scaled(args.values[0], 1.0);
    auto c = parse_scaled(args.values[1], core::config::kPercentChromaScale);
    auto h = parse_hue(args.values[2]);
    auto alpha = parse_alpha(args.alpha);
    if (!l || !c || !h || !alpha) return std::nullopt;
    return Color{clamp(*l, 0, 1), *c < 0 ? 0 : *c, *h, *alpha};
}

std::optional<Color> parse_oklab(const Arguments& args) {
    if (args.values.size() != 3) return std::nullopt;
    auto l = parse_scaled(args.values[0], 1.0);
    auto a = parse_scaled(args.values[1], core::config::kPercentChromaScale);
    auto b = parse_scaled(args.values[2], core::config::kPercentChromaScale);
    auto alpha = parse_alpha(args.alpha);
    if (!l || !a || !b || !alpha) return std::nullopt;
    return from_oklab({clamp(*l, 0, 1), *a, *b, *alpha});
}

// color(display-p3 r g b [/ a])
std::optional<Color> parse_color_function(const Arguments& args) {
    if (args.values.size() != 4) return std::nullopt;
    if (args.values[0].type != CSSToken::Ident ||
        !iequals(args.values[0].value, "display-p3")) {
        return std::nullopt;
    }
    double channels[3];
    for (int i = 0; i < 3; ++i) {
        auto v = parse_scaled(args.values[i + 1], 1.0);
        if (!v) return std::nullopt;
        channels[i] = clamp(*v, 0, 1);
    }
    auto alpha = parse_alpha(args.alpha);
    if (!alpha) return std::nullopt;
    return from_p3({channels[0], channels[1], channels[2], *alpha});
}

} // namespace

std::optional<Color> try_parse_color(std::string_view text) {
    auto tokens = CSSTokenizer::tokenize_all(text);

    size_t pos = 0;
    while (pos < tokens.size() && tokens[pos].type == CSSToken::Whitespace) {
        ++pos;
    }
    if (pos >= tokens.size()) return std::nullopt;
    const CSSToken& head = tokens[pos++];

    if (head.type == CSSToken::Hash) {
        for (; pos < tokens.size(); ++pos) {
            if (tokens[pos].type != CSSToken::Whitespace &&
                tokens[pos].type != CSSToken::EndOfFile) {
                return std::nullopt;
            }
        }
        auto rgb = conversion::try_hex_to_rgb(head.value);
        if (!rgb) return std::nullopt;
        return from_rgb(*rgb);
    }

    if (head.type != CSSToken::Function) return std::nullopt;

    const std::string& name = head.value;
    bool legacy_name = iequals(name, "rgb") || iequals(name, "rgba") ||
                       iequals(name, "hsl") || iequals(name, "hsla");
    auto args = split_arguments(tokens, pos, legacy_name);
    if (!args) return std::nullopt;

    if (iequals(name, "rgb") || iequals(name, "rgba")) return parse_rgb(*args);
    if (iequals(name, "hsl") || iequals(name, "hsla")) return parse_hsl(*args);
    if (iequals(name, "oklch")) return parse_oklch(*args);
    if (iequals(name, "oklab")) return parse_oklab(*args);
    if (iequals(name, "color")) return parse_color_function(*args);
    return std::nullopt;
}

Color parse_color(std::string_view text) {
    auto color = try_parse_color(text);
    if (!color) {
        throw std::runtime_error("Unable to parse color: \"" +
                                 std::string(text) + "\"");
    }
    return *color;
}

} // namespace colorkit::css
