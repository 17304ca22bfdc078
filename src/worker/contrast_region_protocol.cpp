#include <colorkit/worker/contrast_region_protocol.h>

#include <colorkit/ipc/serializer.h>

#include <stdexcept>

namespace colorkit::worker {

namespace {

void write_color(ipc::Serializer& s, const Color& color) {
    s.write_f64(color.l);
    s.write_f64(color.c);
    s.write_f64(color.h);
    s.write_f64(color.alpha);
}

Color read_color(ipc::Deserializer& d) {
    Color color;
    color.l = d.read_f64();
    color.c = d.read_f64();
    color.h = d.read_f64();
    color.alpha = d.read_f64();
    return color;
}

// Reads a u8 enum tag and checks it against the enum's last value.
template <typename Enum>
Enum read_tag(ipc::Deserializer& d, Enum last, const char* what) {
    const uint8_t tag = d.read_u8();
    if (tag > static_cast<uint8_t>(last)) {
        throw std::runtime_error(std::string("Invalid ") + what + " tag: " +
                                 std::to_string(tag));
    }
    return static_cast<Enum>(tag);
}

void write_axis(ipc::Serializer& s, const ColorAreaAxis& axis) {
    s.write_u8(static_cast<uint8_t>(axis.channel));
    s.write_f64(axis.range.min);
    s.write_f64(axis.range.max);
}

ColorAreaAxis read_axis(ipc::Deserializer& d) {
    ColorAreaAxis axis;
    axis.channel = read_tag(d, AreaChannel::H, "area channel");
    axis.range.min = d.read_f64();
    axis.range.max = d.read_f64();
    return axis;
}

void write_options(ipc::Serializer& s, const ContrastRegionOptions& options) {
    s.write_u8(static_cast<uint8_t>(options.level));
    s.write_bool(options.threshold.has_value());
    s.write_f64(options.threshold.value_or(0));
    s.write_u8(static_cast<uint8_t>(options.gamut));
    s.write_u32(static_cast<uint32_t>(options.lightness_steps));
    s.write_u32(static_cast<uint32_t>(options.chroma_steps));
    s.write_f64(options.max_chroma);
    s.write_f64(options.tolerance);
    s.write_f64(options.max_iterations);
    s.write_f64(options.alpha);
    s.write_u8(static_cast<uint8_t>(options.edge_interpolation));
}

ContrastRegionOptions read_options(ipc::Deserializer& d) {
    ContrastRegionOptions options;
    options.level = read_tag(d, ContrastLevel::AAA, "contrast level");
    const bool has_threshold = d.read_bool();
    const double threshold = d.read_f64();
    if (has_threshold) options.threshold = threshold;
    options.gamut = read_tag(d, GamutTarget::DisplayP3, "gamut");
    options.lightness_steps = static_cast<int32_t>(d.read_u32());
    options.chroma_steps = static_cast<int32_t>(d.read_u32());
    options.max_chroma = d.read_f64();
    options.tolerance = d.read_f64();
    options.max_iterations = d.read_f64();
    options.alpha = d.read_f64();
    options.edge_interpolation =
        read_tag(d, EdgeInterpolation::Midpoint, "edge interpolation");
    return options;
}

void expect_type(const ipc::Message& msg, uint32_t type) {
    if (msg.type != type) {
        throw std::runtime_error("Unexpected message type " + std::to_string(msg.type) +
                                 ", expected " + std::to_string(type));
    }
}

} // namespace

ipc::Message encode_request(const ContrastRegionRequest& request) {
    ipc::Serializer s;
    write_color(s, request.reference);
    s.write_f64(request.hue);
    write_axis(s, request.axes.x);
    write_axis(s, request.axes.y);
    write_options(s, request.options);
    return {kContrastRegionRequest, request.id, s.take_data()};
}

ContrastRegionRequest decode_request(const ipc::Message& msg) {
    expect_type(msg, kContrastRegionRequest);
    ipc::Deserializer d(msg.payload);

    ContrastRegionRequest request;
    request.id = msg.request_id;
    request.reference = read_color(d);
    request.hue = d.read_f64();
    request.axes.x = read_axis(d);
    request.axes.y = read_axis(d);
    request.options = read_options(d);
    return request;
}

ipc::Message encode_response(const ContrastRegionResponse& response) {
    ipc::Serializer s;
    s.write_u32(static_cast<uint32_t>(response.paths.size()));
    for (const auto& path : response.paths) {
        s.write_u32(static_cast<uint32_t>(path.size()));
        for (const auto& point : path) {
            s.write_f64(point.x);
            s.write_f64(point.y);
        }
    }
    s.write_bool(response.error.has_value());
    if (response.error) {
        s.write_string(*response.error);
    }
    s.write_f64(response.compute_time_ms);
    return {kContrastRegionResponse, response.id, s.take_data()};
}

ContrastRegionResponse decode_response(const ipc::Message& msg) {
    expect_type(msg, kContrastRegionResponse);
    ipc::Deserializer d(msg.payload);

    ContrastRegionResponse response;
    response.id = msg.request_id;
    const uint32_t path_count = d.read_u32();
    for (uint32_t i = 0; i < path_count; ++i) {
        const uint32_t point_count = d.read_u32();
        AreaPath path;
        for (uint32_t j = 0; j < point_count; ++j) {
            AreaPoint point;
            point.x = d.read_f64();
            point.y = d.read_f64();
            path.push_back(point);
        }
        response.paths.push_back(std::move(path));
    }
    if (d.read_bool()) {
        response.error = d.read_string();
    }
    response.compute_time_ms = d.read_f64();
    return response;
}

} // namespace colorkit::worker
