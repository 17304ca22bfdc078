#include <colorkit/gamut/boundary.h>

#include <colorkit/color/math.h>
#include <colorkit/gamut/gamut.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace colorkit {

double max_chroma_at(double l, double h, const MaxChromaOptions& options) {
    const double lightness = clamp(l, 0, 1);
    const double hue = normalize_hue(h);
    const double ceiling = options.max_chroma;

    if (lightness <= 0 || lightness >= 1) return 0;
    if (!std::isfinite(ceiling) || ceiling <= 0) return 0;

    const Color probe{lightness, ceiling, hue, options.alpha};
    if (in_gamut(probe, options.gamut)) return ceiling;

    // Capped before the int conversion; requests may carry any double.
    const double iterations =
        std::isfinite(options.max_iterations)
            ? std::clamp(std::floor(options.max_iterations), 1.0,
                         static_cast<double>(std::numeric_limits<int>::max()))
            : core::config::kBoundaryMaxIterations;
    double lo = 0;
    double hi = ceiling;
    const int limit = static_cast<int>(iterations);
    for (int i = 0; i < limit; ++i) {
        if (hi - lo <= options.tolerance) break;
        const double mid = (lo + hi) / 2;
        // Interval is down to adjacent doubles
        if (mid <= lo || mid >= hi) break;
        if (in_gamut(probe.with_c(mid), options.gamut)) {
            lo = mid;
        } else {
            hi = mid;
        }
    }
    return lo;
}

std::vector<BoundaryPoint> gamut_boundary_path(double h,
                                               const GamutBoundaryOptions& options) {
    if (options.steps < 2) {
        throw std::invalid_argument("gamut_boundary_path() requires steps >= 2");
    }

    MaxChromaOptions chroma_options;
    chroma_options.gamut = options.gamut;
    chroma_options.tolerance = options.tolerance;
    chroma_options.max_iterations = options.max_iterations;
    chroma_options.max_chroma = options.max_chroma;

    const double hue = normalize_hue(h);
    std::vector<BoundaryPoint> points;
    points.reserve(static_cast<size_t>(options.steps) + 1);
    for (int i = 0; i <= options.steps; ++i) {
        const double l = static_cast<double>(i) / options.steps;
        points.push_back({l, max_chroma_at(l, hue, chroma_options)});
    }
    return points;
}

std::vector<Color> chroma_band(double h, double requested_chroma,
                               const ChromaBandOptions& options) {
    if (!std::isfinite(requested_chroma)) {
        throw std::invalid_argument("chroma_band() requires a finite requested chroma");
    }
    if (options.steps < 2) {
        throw std::invalid_argument("chroma_band() requires steps >= 2");
    }

    MaxChromaOptions chroma_options;
    chroma_options.gamut = options.gamut;
    chroma_options.tolerance = options.tolerance;
    chroma_options.max_iterations = options.max_iterations;
    chroma_options.max_chroma = options.max_chroma;
    chroma_options.alpha = options.alpha;

    const double hue = normalize_hue(h);
    const double requested = std::max(0.0, requested_chroma);

    double ratio = 0;
    if (options.mode == ChromaBandMode::Proportional) {
        const double selected_max =
            max_chroma_at(options.selected_lightness, hue, chroma_options);
        ratio = selected_max > 0 ? std::min(1.0, requested / selected_max) : 0;
    }

    std::vector<Color> band;
    band.reserve(static_cast<size_t>(options.steps) + 1);
    for (int i = 0; i <= options.steps; ++i) {
        const double l = static_cast<double>(i) / options.steps;
        const double max = max_chroma_at(l, hue, chroma_options);
        const double c = options.mode == ChromaBandMode::Proportional
                             ? ratio * max
                             : std::min(requested, max);
        band.push_back({l, c, hue, options.alpha});
    }
    return band;
}

} // namespace colorkit
