#pragma once
#include <colorkit/color/color.h>
#include <colorkit/contrast/region_tracer.h>
#include <colorkit/ipc/message.h>
#include <colorkit/worker/color_area.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace colorkit::worker {

inline constexpr uint32_t kContrastRegionRequest = 1;
inline constexpr uint32_t kContrastRegionResponse = 2;

struct ContrastRegionRequest {
    uint32_t id = 0;
    Color reference;
    double hue = 0;
    ColorAreaAxes axes;
    ContrastRegionOptions options;
};

// Either paths, or no paths and an error message.
struct ContrastRegionResponse {
    uint32_t id = 0;
    std::vector<AreaPath> paths;
    std::optional<std::string> error;
    double compute_time_ms = 0;
};

// The id travels as the message request_id. Decoding throws
// std::runtime_error on a wrong message type, a short payload or an unknown
// enum tag.
ipc::Message encode_request(const ContrastRegionRequest& request);
ContrastRegionRequest decode_request(const ipc::Message& msg);

ipc::Message encode_response(const ContrastRegionResponse& response);
ContrastRegionResponse decode_response(const ipc::Message& msg);

} // namespace colorkit::worker
