#include <colorkit/ipc/message_channel.h>

#include <colorkit/ipc/serializer.h>

namespace colorkit::ipc {

std::pair<MessageChannel, MessageChannel> MessageChannel::create_pair() {
    auto a_to_b = std::make_shared<FrameQueue>();
    auto b_to_a = std::make_shared<FrameQueue>();
    return {MessageChannel(b_to_a, a_to_b), MessageChannel(a_to_b, b_to_a)};
}

MessageChannel::MessageChannel(std::shared_ptr<FrameQueue> inbox,
                               std::shared_ptr<FrameQueue> outbox)
    : inbox_(std::move(inbox)), outbox_(std::move(outbox)) {}

bool MessageChannel::send(const Message& msg) {
    if (!outbox_) return false;

    Serializer s;
    s.write_u32(msg.type);
    s.write_u32(msg.request_id);
    s.write_u32(static_cast<uint32_t>(msg.payload.size()));
    s.write_raw(msg.payload);

    {
        std::lock_guard lock(outbox_->mutex);
        if (outbox_->closed) return false;
        outbox_->frames.push_back(s.take_data());
    }
    outbox_->cv.notify_one();
    return true;
}

std::optional<Message> MessageChannel::decode_frame(const std::vector<uint8_t>& frame) {
    Deserializer d(frame);
    if (d.remaining() < 12) return std::nullopt;

    Message msg;
    msg.type = d.read_u32();
    msg.request_id = d.read_u32();
    uint32_t payload_len = d.read_u32();
    if (d.remaining() < payload_len) return std::nullopt;

    msg.payload = d.read_raw(payload_len);
    return msg;
}

std::optional<Message> MessageChannel::receive() {
    if (!inbox_) return std::nullopt;

    std::vector<uint8_t> frame;
    {
        std::unique_lock lock(inbox_->mutex);
        inbox_->cv.wait(lock, [this] {
            return inbox_->closed || !inbox_->frames.empty();
        });
        if (inbox_->frames.empty()) return std::nullopt;
        frame = std::move(inbox_->frames.front());
        inbox_->frames.pop_front();
    }
    return decode_frame(frame);
}

std::optional<Message> MessageChannel::try_receive() {
    if (!inbox_) return std::nullopt;

    std::vector<uint8_t> frame;
    {
        std::lock_guard lock(inbox_->mutex);
        if (inbox_->frames.empty()) return std::nullopt;
        frame = std::move(inbox_->frames.front());
        inbox_->frames.pop_front();
    }
    return decode_frame(frame);
}

void MessageChannel::on(uint32_t message_type, MessageHandler handler) {
    handlers_[message_type] = std::move(handler);
}

void MessageChannel::dispatch(const Message& msg) {
    auto it = handlers_.find(msg.type);
    if (it != handlers_.end()) {
        it->second(msg);
    }
}

bool MessageChannel::is_open() const {
    if (!outbox_) return false;
    std::lock_guard lock(outbox_->mutex);
    return !outbox_->closed;
}

void MessageChannel::close() {
    for (const auto& queue : {inbox_, outbox_}) {
        if (!queue) continue;
        {
            std::lock_guard lock(queue->mutex);
            queue->closed = true;
        }
        queue->cv.notify_all();
    }
}

} // namespace colorkit::ipc
