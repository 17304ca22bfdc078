#include <colorkit/conversion/hct.h>

#include <colorkit/color/math.h>

#include <cmath>

namespace colorkit::conversion {

namespace {

constexpr double kSrgbToXyz[3][3] = {
    {0.41233895, 0.35762064, 0.18051042},
    {0.2126, 0.7152, 0.0722},
    {0.01932141, 0.11916382, 0.95034478},
};

// CAT16 cone response
constexpr double kXyzToCam16Rgb[3][3] = {
    {0.401288, 0.650173, -0.051461},
    {-0.250268, 1.204414, 0.045854},
    {-0.002079, 0.048952, 0.953127},
};

constexpr double kWhitePointD65[3] = {95.047, 100.0, 108.883};

constexpr double kLabEpsilon = 216.0 / 24389.0;
constexpr double kLabKappa = 24389.0 / 27.0;

double lab_f(double t) {
    if (t > kLabEpsilon) return std::cbrt(t);
    return (kLabKappa * t + 16) / 116;
}

double lab_inv_f(double ft) {
    const double ft3 = ft * ft * ft;
    if (ft3 > kLabEpsilon) return ft3;
    return (116 * ft - 16) / kLabKappa;
}

double signum(double x) {
    if (x < 0) return -1.0;
    if (x > 0) return 1.0;
    return 0.0;
}

struct ViewingConditions {
    double n = 0;
    double aw = 0;
    double nbb = 0;
    double ncb = 0;
    double c = 0;
    double nc = 0;
    double rgb_d[3] = {};
    double fl = 0;
    double z = 0;

    static const ViewingConditions& standard() {
        static const ViewingConditions conditions = make(
            (200.0 / kPi) * y_from_lstar(50.0) / 100.0, 50.0, 2.0);
        return conditions;
    }

    static ViewingConditions make(double adapting_luminance, double background_lstar,
                                  double surround) {
        const double* wp = kWhitePointD65;
        double white[3];
        for (int i = 0; i < 3; ++i) {
            white[i] = wp[0] * kXyzToCam16Rgb[i][0] + wp[1] * kXyzToCam16Rgb[i][1] +
                       wp[2] * kXyzToCam16Rgb[i][2];
        }

        ViewingConditions vc;
        const double f = 0.8 + surround / 10.0;
        vc.c = f >= 0.9 ? lerp(0.59, 0.69, (f - 0.9) * 10.0)
                        : lerp(0.525, 0.59, (f - 0.8) * 10.0);
        double d = f * (1.0 - (1.0 / 3.6) * std::exp((-adapting_luminance - 42.0) / 92.0));
        d = clamp(d, 0.0, 1.0);
        vc.nc = f;
        for (int i = 0; i < 3; ++i) {
            vc.rgb_d[i] = d * (100.0 / white[i]) + 1.0 - d;
        }

        const double k = 1.0 / (5.0 * adapting_luminance + 1.0);
        const double k4 = k * k * k * k;
        const double k4f = 1.0 - k4;
        vc.fl = k4 * adapting_luminance +
                0.1 * k4f * k4f * std::cbrt(5.0 * adapting_luminance);
        vc.n = y_from_lstar(background_lstar) / wp[1];
        vc.z = 1.48 + std::sqrt(vc.n);
        vc.nbb = 0.725 / std::pow(vc.n, 0.2);
        vc.ncb = vc.nbb;

        double rgb_a[3];
        for (int i = 0; i < 3; ++i) {
            const double factor = std::pow(vc.fl * vc.rgb_d[i] * white[i] / 100.0, 0.42);
            rgb_a[i] = 400.0 * factor / (factor + 27.13);
        }
        vc.aw = (2.0 * rgb_a[0] + rgb_a[1] + 0.05 * rgb_a[2]) * vc.nbb;
        return vc;
    }
};

} // namespace

double y_from_lstar(double lstar) {
    return 100.0 * lab_inv_f((lstar + 16.0) / 116.0);
}

double lstar_from_y(double y) {
    return 116.0 * lab_f(y / 100.0) - 16.0;
}

Hct rgb_to_hct(const Rgb& rgb) {
    const auto& vc = ViewingConditions::standard();

    double linear[3] = {
        srgb_to_linear_channel(clamp(std::round(rgb.r), 0, 255) / 255.0) * 100.0,
        srgb_to_linear_channel(clamp(std::round(rgb.g), 0, 255) / 255.0) * 100.0,
        srgb_to_linear_channel(clamp(std::round(rgb.b), 0, 255) / 255.0) * 100.0,
    };
    double xyz[3];
    for (int i = 0; i < 3; ++i) {
        xyz[i] = kSrgbToXyz[i][0] * linear[0] + kSrgbToXyz[i][1] * linear[1] +
                 kSrgbToXyz[i][2] * linear[2];
    }

    double adapted[3];
    for (int i = 0; i < 3; ++i) {
        const double cone = kXyzToCam16Rgb[i][0] * xyz[0] + kXyzToCam16Rgb[i][1] * xyz[1] +
                            kXyzToCam16Rgb[i][2] * xyz[2];
        const double discounted = vc.rgb_d[i] * cone;
        const double af = std::pow(vc.fl * std::fabs(discounted) / 100.0, 0.42);
        adapted[i] = signum(discounted) * 400.0 * af / (af + 27.13);
    }
    const double r_a = adapted[0], g_a = adapted[1], b_a = adapted[2];

    // redness-greenness
    const double a = (11.0 * r_a + -12.0 * g_a + b_a) / 11.0;
    // yellowness-blueness
    const double b = (r_a + g_a - 2.0 * b_a) / 9.0;
    const double u = (20.0 * r_a + 20.0 * g_a + 21.0 * b_a) / 20.0;
    const double p2 = (40.0 * r_a + 20.0 * g_a + b_a) / 20.0;

    const double hue = normalize_hue(rad_to_deg(std::atan2(b, a)));
    const double ac = p2 * vc.nbb;
    const double j = 100.0 * std::pow(ac / vc.aw, vc.c * vc.z);

    const double hue_prime = hue < 20.14 ? hue + 360.0 : hue;
    const double e_hue = 0.25 * (std::cos(deg_to_rad(hue_prime) + 2.0) + 3.8);
    const double p1 = 50000.0 / 13.0 * e_hue * vc.nc * vc.ncb;
    const double t = p1 * std::hypot(a, b) / (u + 0.305);
    const double alpha = std::pow(t, 0.9) * std::pow(1.64 - std::pow(0.29, vc.n), 0.73);
    const double chroma = alpha * std::sqrt(j / 100.0);

    return {hue, chroma, lstar_from_y(xyz[1]), rgb.alpha};
}

} // namespace colorkit::conversion
