#include <colorkit/worker/color_area.h>

#include <colorkit/color/math.h>

#include <cmath>
#include <stdexcept>
#include <string>

namespace colorkit::worker {

namespace {

double channel_value(const RegionPoint& point, double hue, AreaChannel channel) {
    switch (channel) {
        case AreaChannel::L:
            return point.l;
        case AreaChannel::C:
            return point.c;
        case AreaChannel::H:
            return hue;
    }
    return 0;
}

double normalize(double value, const AxisRange& range) {
    return clamp((value - range.min) / (range.max - range.min), 0, 1);
}

void validate_range(const AxisRange& range, const char* axis) {
    if (!std::isfinite(range.min) || !std::isfinite(range.max) ||
        range.min == range.max) {
        throw std::invalid_argument(std::string("color area ") + axis +
                                    " range must be finite and non-empty");
    }
}

} // namespace

const char* area_channel_name(AreaChannel channel) {
    switch (channel) {
        case AreaChannel::L: return "l";
        case AreaChannel::C: return "c";
        case AreaChannel::H: return "h";
    }
    return "unknown";
}

void validate_axes(const ColorAreaAxes& axes) {
    if (axes.x.channel == axes.y.channel) {
        throw std::invalid_argument(
            std::string("color area axes must use different channels, both are ") +
            area_channel_name(axes.x.channel));
    }
    validate_range(axes.x.range, "x");
    validate_range(axes.y.range, "y");
}

AreaPoint project_region_point(const RegionPoint& point, double hue,
                               const ColorAreaAxes& axes) {
    const double x = channel_value(point, hue, axes.x.channel);
    const double y = channel_value(point, hue, axes.y.channel);
    return {normalize(x, axes.x.range), 1 - normalize(y, axes.y.range)};
}

std::vector<AreaPath> color_area_contrast_region_paths(const Color& reference, double hue,
                                                       const ColorAreaAxes& axes,
                                                       const ContrastRegionOptions& options) {
    validate_axes(axes);

    const double h = normalize_hue(hue);
    std::vector<AreaPath> projected;
    for (const auto& path : contrast_region_paths(reference, h, options)) {
        AreaPath out;
        out.reserve(path.size());
        for (const auto& point : path) {
            out.push_back(project_region_point(point, h, axes));
        }
        projected.push_back(std::move(out));
    }
    return projected;
}

} // namespace colorkit::worker
