#pragma once
#include <colorkit/color/color.h>
#include <colorkit/contrast/region_tracer.h>

#include <vector>

namespace colorkit::worker {

enum class AreaChannel {
    L,
    C,
    H,
};

const char* area_channel_name(AreaChannel channel);

struct AxisRange {
    double min = 0;
    double max = 1;
};

struct ColorAreaAxis {
    AreaChannel channel = AreaChannel::L;
    AxisRange range;
};

// Which color channel each side of a 2D picker area shows. Defaults to
// lightness across and chroma up.
struct ColorAreaAxes {
    ColorAreaAxis x{AreaChannel::L, {0, 1}};
    ColorAreaAxis y{AreaChannel::C, {0, 0.4}};
};

// Normalized area position: x grows rightwards, y grows downwards.
struct AreaPoint {
    double x = 0;
    double y = 0;

    bool operator==(const AreaPoint& other) const = default;
};

using AreaPath = std::vector<AreaPoint>;

// Throws std::invalid_argument when both axes use the same channel or a range
// is empty or not finite.
void validate_axes(const ColorAreaAxes& axes);

// {norm(x), 1 - norm(y)} with norm clamped to [0, 1]. An H axis reads `hue`.
AreaPoint project_region_point(const RegionPoint& point, double hue,
                               const ColorAreaAxes& axes);

// contrast_region_paths() projected into the area.
std::vector<AreaPath> color_area_contrast_region_paths(const Color& reference, double hue,
                                                       const ColorAreaAxes& axes,
                                                       const ContrastRegionOptions& options = {});

} // namespace colorkit::worker
