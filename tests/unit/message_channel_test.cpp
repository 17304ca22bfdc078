#include <colorkit/ipc/message_channel.h>
#include <colorkit/ipc/message.h>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using colorkit::ipc::Message;
using colorkit::ipc::MessageChannel;

// ------------------------------------------------------------------
// 1. Send and receive
// ------------------------------------------------------------------

TEST(MessageChannelTest, SendAndReceiveMessage) {
    auto [a, b] = MessageChannel::create_pair();

    Message msg;
    msg.type = 1;
    msg.request_id = 42;
    msg.payload = {0xDE, 0xAD, 0xBE, 0xEF};

    ASSERT_TRUE(a.send(msg));

    auto received = b.receive();
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->type, 1u);
    EXPECT_EQ(received->request_id, 42u);
    EXPECT_EQ(received->payload, msg.payload);
}

TEST(MessageChannelTest, SendAndReceiveEmptyPayload) {
    auto [a, b] = MessageChannel::create_pair();

    Message msg;
    msg.type = 99;
    ASSERT_TRUE(a.send(msg));

    auto received = b.receive();
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->type, 99u);
    EXPECT_TRUE(received->payload.empty());
}

TEST(MessageChannelTest, BothDirectionsKeepOrder) {
    auto [a, b] = MessageChannel::create_pair();

    for (uint32_t i = 1; i <= 3; ++i) {
        Message msg;
        msg.type = 7;
        msg.request_id = i;
        ASSERT_TRUE(a.send(msg));
    }
    Message reply;
    reply.type = 8;
    ASSERT_TRUE(b.send(reply));

    for (uint32_t i = 1; i <= 3; ++i) {
        auto received = b.receive();
        ASSERT_TRUE(received.has_value());
        EXPECT_EQ(received->request_id, i);
    }
    auto back = a.receive();
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->type, 8u);
}

TEST(MessageChannelTest, TryReceiveDoesNotBlock) {
    auto [a, b] = MessageChannel::create_pair();
    EXPECT_FALSE(b.try_receive().has_value());

    Message msg;
    msg.type = 3;
    ASSERT_TRUE(a.send(msg));
    auto received = b.try_receive();
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->type, 3u);
}

TEST(MessageChannelTest, ReceiveWakesOnSendFromOtherThread) {
    auto channels = MessageChannel::create_pair();
    MessageChannel& a = channels.first;
    MessageChannel& b = channels.second;

    std::thread sender([&a]() {
        Message msg;
        msg.type = 11;
        msg.payload = {1, 2};
        a.send(msg);
    });

    auto received = b.receive();
    sender.join();
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->type, 11u);
}

// ------------------------------------------------------------------
// 2. Handlers
// ------------------------------------------------------------------

TEST(MessageChannelTest, RegisterHandlerAndDispatch) {
    auto [ch, other] = MessageChannel::create_pair();

    bool handler_called = false;
    uint32_t received_req_id = 0;
    ch.on(5, [&](const Message& m) {
        handler_called = true;
        received_req_id = m.request_id;
    });

    Message msg;
    msg.type = 5;
    msg.request_id = 100;
    ch.dispatch(msg);

    EXPECT_TRUE(handler_called);
    EXPECT_EQ(received_req_id, 100u);
}

TEST(MessageChannelTest, DispatchIgnoresUnknownType) {
    auto [ch, other] = MessageChannel::create_pair();
    bool handler_called = false;
    ch.on(5, [&](const Message&) { handler_called = true; });

    Message msg;
    msg.type = 6;
    ch.dispatch(msg);
    EXPECT_FALSE(handler_called);
}

// ------------------------------------------------------------------
// 3. Closing
// ------------------------------------------------------------------

TEST(MessageChannelTest, CloseStopsSendingButDrainsInbox) {
    auto [a, b] = MessageChannel::create_pair();

    Message msg;
    msg.type = 1;
    ASSERT_TRUE(a.send(msg));
    a.close();

    EXPECT_FALSE(a.is_open());
    EXPECT_FALSE(b.is_open());
    EXPECT_FALSE(a.send(msg));
    EXPECT_FALSE(b.send(msg));

    EXPECT_TRUE(b.receive().has_value());
    EXPECT_FALSE(b.receive().has_value());
}

TEST(MessageChannelTest, CloseWakesBlockedReceiver) {
    auto channels = MessageChannel::create_pair();
    MessageChannel& a = channels.first;
    MessageChannel& b = channels.second;

    std::thread receiver([&b]() {
        EXPECT_FALSE(b.receive().has_value());
    });
    a.close();
    receiver.join();
}

TEST(MessageChannelTest, MovedFromChannelIsClosed) {
    auto [a, b] = MessageChannel::create_pair();
    MessageChannel moved(std::move(a));
    EXPECT_TRUE(moved.is_open());
    EXPECT_FALSE(a.is_open());  // NOLINT(bugprone-use-after-move)
}
