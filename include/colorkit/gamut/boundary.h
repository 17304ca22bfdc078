#pragma once
#include <colorkit/color/color.h>
#include <colorkit/core/config.h>

#include <vector>

namespace colorkit {

struct MaxChromaOptions {
    GamutTarget gamut = GamutTarget::Srgb;
    double tolerance = core::config::kBoundaryTolerance;
    double max_iterations = core::config::kBoundaryMaxIterations;
    double max_chroma = core::config::kMaxChroma;  // search ceiling
    double alpha = 1;
};

// Highest chroma at (l, h) that stays in the gamut. l is clamped to [0, 1];
// the extremes, and a ceiling that is not a positive finite number, give 0.
// At least one bisection step runs whatever max_iterations says.
double max_chroma_at(double l, double h, const MaxChromaOptions& options = {});

struct GamutBoundaryOptions {
    GamutTarget gamut = GamutTarget::Srgb;
    int steps = core::config::kDefaultBoundarySteps;
    double tolerance = core::config::kBoundaryTolerance;
    double max_iterations = core::config::kBoundaryMaxIterations;
    double max_chroma = core::config::kMaxChroma;
};

struct BoundaryPoint {
    double l = 0;
    double c = 0;

    bool operator==(const BoundaryPoint& other) const = default;
};

// steps + 1 points from l = 0 to l = 1. Throws std::invalid_argument when
// steps < 2.
std::vector<BoundaryPoint> gamut_boundary_path(double h,
                                               const GamutBoundaryOptions& options = {});

enum class ChromaBandMode {
    Clamped,       // requested chroma, cut at each row's maximum
    Proportional,  // requested/max ratio at selected_lightness, kept everywhere
};

struct ChromaBandOptions {
    ChromaBandMode mode = ChromaBandMode::Clamped;
    GamutTarget gamut = GamutTarget::Srgb;
    int steps = core::config::kDefaultBoundarySteps;
    double selected_lightness = core::config::kDefaultBandSelectedLightness;
    double tolerance = core::config::kBoundaryTolerance;
    double max_iterations = core::config::kBoundaryMaxIterations;
    double max_chroma = core::config::kMaxChroma;
    double alpha = 1;
};

// Tonal strip of steps + 1 colors at hue h. Throws std::invalid_argument
// for a non-finite requested chroma or steps < 2.
std::vector<Color> chroma_band(double h, double requested_chroma,
                               const ChromaBandOptions& options = {});

} // namespace colorkit
