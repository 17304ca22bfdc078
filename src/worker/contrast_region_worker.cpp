#include <colorkit/worker/contrast_region_worker.h>

#include <chrono>
#include <stdexcept>
#include <string>

namespace colorkit::worker {

namespace {

constexpr const char* kModule = "worker";
constexpr const char* kStage = "contrast_region";

} // namespace

// ---------------------------------------------------------------------------
// ContrastRegionWorker
// ---------------------------------------------------------------------------

ContrastRegionWorker::ContrastRegionWorker(size_t num_threads,
                                           core::DiagnosticEmitter* diagnostics)
    : diagnostics_(diagnostics) {
    if (num_threads == 0) num_threads = 1;
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

ContrastRegionWorker::~ContrastRegionWorker() {
    shutdown();
}

ContrastRegionResponse ContrastRegionWorker::compute(const ContrastRegionRequest& request) {
    ContrastRegionResponse response;
    response.id = request.id;

    const auto start = std::chrono::steady_clock::now();
    try {
        response.paths = color_area_contrast_region_paths(
            request.reference, request.hue, request.axes, request.options);
    } catch (const std::exception& e) {
        response.paths.clear();
        response.error = e.what();
    }
    const auto end = std::chrono::steady_clock::now();
    response.compute_time_ms =
        std::chrono::duration<double, std::milli>(end - start).count();
    return response;
}

void ContrastRegionWorker::submit(ContrastRegionRequest request, Callback callback) {
    {
        std::lock_guard lock(mutex_);
        if (shutdown_) {
            throw std::runtime_error("ContrastRegionWorker is shut down");
        }
        jobs_.push_back({std::move(request), std::move(callback)});
    }
    cv_.notify_one();
}

void ContrastRegionWorker::run(Job& job) {
    ContrastRegionResponse response = compute(job.request);

    if (diagnostics_) {
        if (response.error) {
            diagnostics_->emit(core::Severity::Error, kModule, kStage,
                               *response.error, response.id);
        } else {
            diagnostics_->emit(core::Severity::Info, kModule, kStage,
                               "traced " + std::to_string(response.paths.size()) +
                                   " paths",
                               response.id);
        }
    }

    if (!job.callback) return;
    try {
        job.callback(std::move(response));
    } catch (const std::exception& e) {
        if (diagnostics_) {
            diagnostics_->emit(core::Severity::Error, kModule, "callback",
                               e.what(), job.request.id);
        }
    }
}

void ContrastRegionWorker::worker_loop() {
    while (true) {
        Job job;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this]() {
                return shutdown_.load() || !jobs_.empty();
            });

            if (jobs_.empty()) {
                // shutdown_ is true and no more jobs
                return;
            }

            job = std::move(jobs_.front());
            jobs_.pop_front();
            ++active_;
        }

        run(job);

        {
            std::lock_guard lock(mutex_);
            --active_;
        }
        idle_cv_.notify_all();
    }
}

void ContrastRegionWorker::serve(ipc::MessageChannel& channel) {
    while (auto msg = channel.receive()) {
        if (msg->type != kContrastRegionRequest) {
            if (diagnostics_) {
                diagnostics_->emit(core::Severity::Warning, kModule, "serve",
                                   "ignored message type " + std::to_string(msg->type),
                                   msg->request_id);
            }
            continue;
        }

        ContrastRegionRequest request;
        try {
            request = decode_request(*msg);
        } catch (const std::exception& e) {
            ContrastRegionResponse response;
            response.id = msg->request_id;
            response.error = e.what();
            if (diagnostics_) {
                diagnostics_->emit(core::Severity::Error, kModule, "decode",
                                   e.what(), msg->request_id);
            }
            channel.send(encode_response(response));
            continue;
        }

        submit(std::move(request), [&channel](ContrastRegionResponse response) {
            channel.send(encode_response(response));
        });
    }
    wait_idle();
}

void ContrastRegionWorker::wait_idle() {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this]() {
        return jobs_.empty() && active_ == 0;
    });
}

void ContrastRegionWorker::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (shutdown_) {
            return;
        }
        shutdown_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t ContrastRegionWorker::size() const {
    return workers_.size();
}

bool ContrastRegionWorker::is_running() const {
    return !shutdown_.load();
}

// ---------------------------------------------------------------------------
// ContrastRegionClient
// ---------------------------------------------------------------------------

ContrastRegionClient::ContrastRegionClient(ipc::MessageChannel& channel)
    : channel_(channel) {}

uint32_t ContrastRegionClient::request(const Color& reference, double hue,
                                       const ColorAreaAxes& axes,
                                       const ContrastRegionOptions& options) {
    ContrastRegionRequest req;
    req.id = next_id_;
    req.reference = reference;
    req.hue = hue;
    req.axes = axes;
    req.options = options;

    if (!channel_.send(encode_request(req))) {
        return 0;
    }
    latest_id_ = next_id_++;
    return latest_id_;
}

std::optional<ContrastRegionResponse> ContrastRegionClient::accept(const ipc::Message& msg) {
    if (msg.type != kContrastRegionResponse || msg.request_id != latest_id_) {
        ++discarded_;
        return std::nullopt;
    }
    return decode_response(msg);
}

std::optional<ContrastRegionResponse> ContrastRegionClient::poll() {
    while (auto msg = channel_.try_receive()) {
        if (auto response = accept(*msg)) {
            return response;
        }
    }
    return std::nullopt;
}

std::optional<ContrastRegionResponse> ContrastRegionClient::wait() {
    if (latest_id_ == 0) return std::nullopt;
    while (auto msg = channel_.receive()) {
        if (auto response = accept(*msg)) {
            return response;
        }
    }
    return std::nullopt;
}

} // namespace colorkit::worker
