#pragma once
#include <colorkit/color/color.h>
#include <colorkit/contrast/contrast.h>
#include <colorkit/core/config.h>

#include <optional>
#include <vector>

namespace colorkit {

enum class EdgeInterpolation {
    Linear,    // where (contrast - threshold) crosses zero along the edge
    Midpoint,  // edge midpoint
};

struct ContrastRegionOptions {
    ContrastLevel level = ContrastLevel::AA;
    std::optional<double> threshold;  // overrides level; must be finite and > 1
    GamutTarget gamut = GamutTarget::Srgb;
    int lightness_steps = core::config::kDefaultRegionSteps;
    int chroma_steps = core::config::kDefaultRegionSteps;
    double max_chroma = core::config::kMaxChroma;
    double tolerance = core::config::kBoundaryTolerance;
    double max_iterations = core::config::kBoundaryMaxIterations;
    double alpha = 1;
    EdgeInterpolation edge_interpolation = EdgeInterpolation::Linear;
};

struct RegionPoint {
    double l = 0;
    double c = 0;

    bool operator==(const RegionPoint& other) const = default;
};

using RegionPath = std::vector<RegionPoint>;

// Validated contrast threshold for the options. Throws std::invalid_argument
// when an explicit threshold is not a finite number above 1.
double resolve_contrast_threshold(const ContrastRegionOptions& options);

// Iso-contrast contours against `reference` on the lightness/chroma plane at
// hue `hue`.
//
// The plane is sampled as lightness_steps rows (l = i / (rows - 1)), each
// with chroma_steps samples spread over [0, max_chroma_at(l)] so every sample
// is inside the gamut. A sample passes when its WCAG ratio against the
// reference reaches the threshold; luminance is taken from unclamped linear
// sRGB so wide-gamut samples are scored by their true luminance.
//
// Contours come from marching squares over that grid. Each polyline keeps
// the passing side on its left (x = chroma, y = lightness); closed loops end
// with their first point. Ambiguous saddle cells are resolved with the
// average of the four corners. Paths are ordered by the row-major position
// of the first cell they pass through.
//
// Throws std::invalid_argument for step counts below 2 or a bad threshold.
std::vector<RegionPath> contrast_region_paths(const Color& reference, double hue,
                                              const ContrastRegionOptions& options = {});

// First path of contrast_region_paths(), or an empty path.
RegionPath contrast_region_path(const Color& reference, double hue,
                                const ContrastRegionOptions& options = {});

} // namespace colorkit
