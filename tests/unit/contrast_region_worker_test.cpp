#include <colorkit/conversion/convert.h>
#include <colorkit/worker/contrast_region_worker.h>

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>

using namespace colorkit;
using namespace colorkit::worker;

namespace {

ContrastRegionRequest white_request(uint32_t id, int steps = 16) {
    ContrastRegionRequest request;
    request.id = id;
    request.reference = from_hex("#ffffff");
    request.hue = 210;
    request.options.lightness_steps = steps;
    request.options.chroma_steps = steps;
    return request;
}

ContrastRegionOptions small_grid() {
    ContrastRegionOptions options;
    options.lightness_steps = 12;
    options.chroma_steps = 12;
    return options;
}

} // namespace

// ------------------------------------------------------------------
// 1. Synchronous compute
// ------------------------------------------------------------------

TEST(ContrastRegionWorkerTest, ComputeReturnsProjectedPaths) {
    ContrastRegionResponse response = ContrastRegionWorker::compute(white_request(3));
    EXPECT_EQ(response.id, 3u);
    EXPECT_FALSE(response.error.has_value());
    EXPECT_FALSE(response.paths.empty());
    EXPECT_GE(response.compute_time_ms, 0.0);
}

TEST(ContrastRegionWorkerTest, ComputeReportsFailureAsError) {
    ContrastRegionRequest request = white_request(4);
    request.options.threshold = 1;

    ContrastRegionResponse response = ContrastRegionWorker::compute(request);
    EXPECT_EQ(response.id, 4u);
    EXPECT_TRUE(response.paths.empty());
    ASSERT_TRUE(response.error.has_value());
    EXPECT_EQ(*response.error, "contrast_region_paths() requires threshold > 1");
}

TEST(ContrastRegionWorkerTest, ComputeReportsBadAxes) {
    ContrastRegionRequest request = white_request(5);
    request.axes.y.channel = AreaChannel::L;

    ContrastRegionResponse response = ContrastRegionWorker::compute(request);
    ASSERT_TRUE(response.error.has_value());
    EXPECT_NE(response.error->find("different channels"), std::string::npos);
}

TEST(ContrastRegionWorkerTest, DecodedHugeIterationCountIsTraced) {
    ContrastRegionRequest request = white_request(6, 8);
    request.options.max_iterations = 1e10;

    ContrastRegionResponse response =
        ContrastRegionWorker::compute(decode_request(encode_request(request)));
    EXPECT_FALSE(response.error.has_value());
    EXPECT_FALSE(response.paths.empty());
}

// ------------------------------------------------------------------
// 2. Pool lifecycle
// ------------------------------------------------------------------

TEST(ContrastRegionWorkerTest, ConstructsWithAtLeastOneThread) {
    ContrastRegionWorker none(0);
    EXPECT_EQ(none.size(), 1u);

    ContrastRegionWorker three(3);
    EXPECT_EQ(three.size(), 3u);
    EXPECT_TRUE(three.is_running());
}

TEST(ContrastRegionWorkerTest, SubmitDeliversResponseToCallback) {
    core::DiagnosticEmitter diagnostics;
    ContrastRegionWorker worker(2, &diagnostics);

    std::promise<ContrastRegionResponse> promise;
    auto future = promise.get_future();
    worker.submit(white_request(8), [&promise](ContrastRegionResponse response) {
        promise.set_value(std::move(response));
    });

    ContrastRegionResponse response = future.get();
    EXPECT_EQ(response.id, 8u);
    EXPECT_FALSE(response.paths.empty());

    worker.wait_idle();
    auto events = diagnostics.events_for(8);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].severity, core::Severity::Info);
    EXPECT_EQ(events[0].module, "worker");
    EXPECT_EQ(events[0].stage, "contrast_region");
    EXPECT_EQ(events[0].message,
              "traced " + std::to_string(response.paths.size()) + " paths");
}

TEST(ContrastRegionWorkerTest, WaitIdleCoversAllQueuedRequests) {
    ContrastRegionWorker worker(2);
    std::atomic<int> done{0};
    for (uint32_t i = 1; i <= 6; ++i) {
        worker.submit(white_request(i, 8), [&done](ContrastRegionResponse) {
            ++done;
        });
    }
    worker.wait_idle();
    EXPECT_EQ(done.load(), 6);
}

TEST(ContrastRegionWorkerTest, DiagnosticsStayBoundedAcrossRequests) {
    core::DiagnosticEmitter diagnostics;
    diagnostics.set_max_events(2);
    ContrastRegionWorker worker(2, &diagnostics);

    for (uint32_t i = 1; i <= 5; ++i) {
        worker.submit(white_request(i, 8), nullptr);
    }
    worker.wait_idle();
    EXPECT_EQ(diagnostics.size(), 2u);
}

TEST(ContrastRegionWorkerTest, CallbackFailureBecomesDiagnostic) {
    core::DiagnosticEmitter diagnostics;
    ContrastRegionWorker worker(1, &diagnostics);

    worker.submit(white_request(11, 8), [](ContrastRegionResponse) {
        throw std::runtime_error("listener gone");
    });
    worker.wait_idle();

    auto errors = diagnostics.events_by_severity(core::Severity::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].stage, "callback");
    EXPECT_EQ(errors[0].message, "listener gone");
    EXPECT_EQ(errors[0].correlation_id, 11u);
}

TEST(ContrastRegionWorkerTest, SubmitAfterShutdownThrows) {
    ContrastRegionWorker worker(1);
    worker.shutdown();
    EXPECT_FALSE(worker.is_running());
    EXPECT_THROW(worker.submit(white_request(1), nullptr), std::runtime_error);
    worker.shutdown();
}

// ------------------------------------------------------------------
// 3. Serving a channel
// ------------------------------------------------------------------

TEST(ContrastRegionWorkerTest, ServesRequestsOverChannel) {
    auto channels = ipc::MessageChannel::create_pair();
    ipc::MessageChannel& client_end = channels.first;
    ipc::MessageChannel& server_end = channels.second;

    ContrastRegionWorker worker(1);
    std::thread server([&worker, &server_end]() { worker.serve(server_end); });

    ContrastRegionClient client(client_end);
    EXPECT_EQ(client.latest_id(), 0u);
    uint32_t id = client.request(from_hex("#ffffff"), 210, ColorAreaAxes{}, small_grid());
    auto response = client.wait();

    client_end.close();
    server.join();

    EXPECT_EQ(id, 1u);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->id, 1u);
    EXPECT_FALSE(response->error.has_value());
    EXPECT_FALSE(response->paths.empty());
}

TEST(ContrastRegionWorkerTest, ClientKeepsOnlyLatestResponse) {
    auto channels = ipc::MessageChannel::create_pair();
    ipc::MessageChannel& client_end = channels.first;
    ipc::MessageChannel& server_end = channels.second;

    ContrastRegionWorker worker(1);
    std::thread server([&worker, &server_end]() { worker.serve(server_end); });

    ContrastRegionClient client(client_end);
    uint32_t first = client.request(from_hex("#ffffff"), 210, ColorAreaAxes{}, small_grid());
    uint32_t second = client.request(from_hex("#111827"), 320, ColorAreaAxes{}, small_grid());
    auto response = client.wait();

    client_end.close();
    server.join();

    EXPECT_EQ(first, 1u);
    EXPECT_EQ(second, 2u);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->id, 2u);
    EXPECT_EQ(client.discarded(), 1u);
    EXPECT_FALSE(client.poll().has_value());
}

TEST(ContrastRegionWorkerTest, MalformedRequestGetsErrorResponse) {
    auto channels = ipc::MessageChannel::create_pair();
    ipc::MessageChannel& client_end = channels.first;
    ipc::MessageChannel& server_end = channels.second;

    core::DiagnosticEmitter diagnostics;
    ContrastRegionWorker worker(1, &diagnostics);
    std::thread server([&worker, &server_end]() { worker.serve(server_end); });

    ipc::Message unknown;
    unknown.type = 42;
    unknown.request_id = 8;
    ipc::Message truncated;
    truncated.type = kContrastRegionRequest;
    truncated.request_id = 9;
    truncated.payload = {1, 2};

    client_end.send(unknown);
    client_end.send(truncated);
    auto reply = client_end.receive();

    client_end.close();
    server.join();

    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->request_id, 9u);
    ContrastRegionResponse response = decode_response(*reply);
    EXPECT_TRUE(response.paths.empty());
    ASSERT_TRUE(response.error.has_value());

    auto warnings = diagnostics.events_by_severity(core::Severity::Warning);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].message, "ignored message type 42");

    auto errors = diagnostics.events_for(9);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].severity, core::Severity::Error);
    EXPECT_EQ(errors[0].stage, "decode");
}

TEST(ContrastRegionWorkerTest, ClientOnClosedChannel) {
    auto channels = ipc::MessageChannel::create_pair();
    ContrastRegionClient client(channels.first);
    EXPECT_FALSE(client.poll().has_value());
    EXPECT_FALSE(client.wait().has_value());

    channels.second.close();
    EXPECT_EQ(client.request(from_hex("#ffffff"), 0, ColorAreaAxes{}), 0u);
    EXPECT_EQ(client.latest_id(), 0u);
}
