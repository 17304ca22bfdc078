#pragma once
#include <colorkit/ipc/message.h>

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace colorkit::ipc {

// One endpoint of an in-process duplex link. Messages travel as serialized
// frames: type(4) + request_id(4) + payload_len(4) + payload, big-endian.
// send() and receive() may be called from different threads.
class MessageChannel {
public:
    using MessageHandler = std::function<void(const Message&)>;

    // Two connected endpoints; what one sends the other receives.
    static std::pair<MessageChannel, MessageChannel> create_pair();

    MessageChannel(MessageChannel&&) noexcept = default;
    MessageChannel& operator=(MessageChannel&&) noexcept = default;
    MessageChannel(const MessageChannel&) = delete;
    MessageChannel& operator=(const MessageChannel&) = delete;

    // False once either side has closed.
    bool send(const Message& msg);

    // Blocks until a message arrives. Returns nullopt once the link is closed
    // and nothing is left to read.
    std::optional<Message> receive();

    std::optional<Message> try_receive();

    // Register a handler for a message type
    void on(uint32_t message_type, MessageHandler handler);

    // Dispatch a received message to registered handlers
    void dispatch(const Message& msg);

    bool is_open() const;

    // Closes both directions and wakes blocked receivers.
    void close();

private:
    struct FrameQueue {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<std::vector<uint8_t>> frames;
        bool closed = false;
    };

    MessageChannel(std::shared_ptr<FrameQueue> inbox,
                   std::shared_ptr<FrameQueue> outbox);

    static std::optional<Message> decode_frame(const std::vector<uint8_t>& frame);

    std::shared_ptr<FrameQueue> inbox_;
    std::shared_ptr<FrameQueue> outbox_;
    std::unordered_map<uint32_t, MessageHandler> handlers_;
};

} // namespace colorkit::ipc
