#pragma once
#include <cstdint>
#include <vector>

namespace colorkit::ipc {

// One framed unit on a MessageChannel. request_id pairs a response with the
// request that produced it.
struct Message {
    uint32_t type = 0;
    uint32_t request_id = 0;
    std::vector<uint8_t> payload;
};

} // namespace colorkit::ipc
