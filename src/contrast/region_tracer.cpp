#include <colorkit/contrast/region_tracer.h>

#include <colorkit/color/math.h>
#include <colorkit/contrast/contour.h>
#include <colorkit/gamut/boundary.h>

#include <cmath>
#include <stdexcept>

namespace colorkit {

double resolve_contrast_threshold(const ContrastRegionOptions& options) {
    if (!options.threshold) {
        return contrast_level_threshold(options.level);
    }
    const double threshold = *options.threshold;
    if (!std::isfinite(threshold) || threshold <= 1) {
        throw std::invalid_argument("contrast_region_paths() requires threshold > 1");
    }
    return threshold;
}

std::vector<RegionPath> contrast_region_paths(const Color& reference, double hue,
                                              const ContrastRegionOptions& options) {
    const double threshold = resolve_contrast_threshold(options);
    if (options.lightness_steps < 2) {
        throw std::invalid_argument(
            "contrast_region_paths() lightness_steps must be >= 2");
    }
    if (options.chroma_steps < 2) {
        throw std::invalid_argument(
            "contrast_region_paths() chroma_steps must be >= 2");
    }

    const double h = normalize_hue(hue);
    const double reference_y = continuous_luminance(reference);

    MaxChromaOptions chroma_options;
    chroma_options.gamut = options.gamut;
    chroma_options.tolerance = options.tolerance;
    chroma_options.max_iterations = options.max_iterations;
    chroma_options.max_chroma = options.max_chroma;
    chroma_options.alpha = options.alpha;

    detail::ContourGrid grid(options.lightness_steps, options.chroma_steps);
    bool any_pass = false;
    bool any_fail = false;
    for (int i = 0; i < grid.rows(); ++i) {
        const double l = static_cast<double>(i) / (grid.rows() - 1);
        const double row_max = max_chroma_at(l, h, chroma_options);
        grid.row_lightness(i) = l;
        for (int j = 0; j < grid.cols(); ++j) {
            const double c = row_max * j / (grid.cols() - 1);
            const Color sample{l, c, h, options.alpha};
            grid.chroma(i, j) = c;
            grid.value(i, j) =
                contrast_ratio_from_luminance(continuous_luminance(sample), reference_y) -
                threshold;
            if (grid.passes(i, j)) {
                any_pass = true;
            } else {
                any_fail = true;
            }
        }
    }

    if (!any_pass || !any_fail) return {};
    return detail::trace_contours(grid, options.edge_interpolation);
}

RegionPath contrast_region_path(const Color& reference, double hue,
                                const ContrastRegionOptions& options) {
    auto paths = contrast_region_paths(reference, hue, options);
    if (paths.empty()) return {};
    return paths.front();
}

} // namespace colorkit
