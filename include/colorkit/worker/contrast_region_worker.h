#pragma once
#include <colorkit/core/config.h>
#include <colorkit/core/diagnostics.h>
#include <colorkit/ipc/message_channel.h>
#include <colorkit/worker/contrast_region_protocol.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace colorkit::worker {

// Traces contrast regions off the caller's thread. Requests queue up and a
// fixed set of threads drains them in submission order.
class ContrastRegionWorker {
public:
    using Callback = std::function<void(ContrastRegionResponse)>;

    explicit ContrastRegionWorker(
        size_t num_threads = core::config::kDefaultWorkerThreads,
        core::DiagnosticEmitter* diagnostics = nullptr);
    ~ContrastRegionWorker();

    ContrastRegionWorker(const ContrastRegionWorker&) = delete;
    ContrastRegionWorker& operator=(const ContrastRegionWorker&) = delete;

    // Synchronous computation. Never throws: failures come back in `error`.
    static ContrastRegionResponse compute(const ContrastRegionRequest& request);

    // Queues a request; callback runs on a pool thread with the response.
    // Throws std::runtime_error after shutdown().
    void submit(ContrastRegionRequest request, Callback callback);

    // Answers request messages arriving on `channel` until it is closed and
    // drained, then waits for the replies still in flight.
    void serve(ipc::MessageChannel& channel);

    // Blocks until the queue is empty and no request is running.
    void wait_idle();

    // Finishes queued requests, then joins the threads.
    void shutdown();

    size_t size() const;
    bool is_running() const;

private:
    struct Job {
        ContrastRegionRequest request;
        Callback callback;
    };

    void worker_loop();
    void run(Job& job);

    core::DiagnosticEmitter* diagnostics_;
    std::vector<std::jthread> workers_;
    std::deque<Job> jobs_;
    size_t active_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::atomic<bool> shutdown_{false};
};

// Sends requests with increasing ids and keeps only the answer to the most
// recent one. Older answers are dropped on arrival.
class ContrastRegionClient {
public:
    explicit ContrastRegionClient(ipc::MessageChannel& channel);

    // Returns the id assigned to the request, or 0 if the channel is closed.
    uint32_t request(const Color& reference, double hue, const ColorAreaAxes& axes,
                     const ContrastRegionOptions& options = {});

    // Non-blocking; nullopt when the latest response has not arrived.
    std::optional<ContrastRegionResponse> poll();

    // Blocks until the latest response arrives or the channel closes.
    std::optional<ContrastRegionResponse> wait();

    uint32_t latest_id() const { return latest_id_; }
    size_t discarded() const { return discarded_; }

private:
    std::optional<ContrastRegionResponse> accept(const ipc::Message& msg);

    ipc::MessageChannel& channel_;
    uint32_t next_id_ = 1;
    uint32_t latest_id_ = 0;
    size_t discarded_ = 0;
};

} // namespace colorkit::worker
