#pragma once
#include <colorkit/core/config.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace colorkit::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t correlation_id = 0;
};

const char* severity_name(Severity severity);

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Collects structured events. Safe to emit from several threads; observers
// run on the emitting thread while the emitter lock is not held. Only the
// newest max_events() events are retained; observers see every event.
class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message,
              std::uint64_t correlation_id = 0);

    void set_min_severity(Severity min);
    Severity min_severity() const;

    // Drops the oldest retained events beyond `max`.
    void set_max_events(std::size_t max);
    std::size_t max_events() const;

    void add_observer(DiagnosticObserver observer);

    std::vector<DiagnosticEvent> events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;
    std::vector<DiagnosticEvent> events_for(std::uint64_t correlation_id) const;

    void clear();
    std::size_t size() const;

private:
    // Caller holds mutex_.
    void trim_events();

    mutable std::mutex mutex_;
    std::deque<DiagnosticEvent> events_;
    std::size_t max_events_ = config::kDefaultMaxDiagnosticEvents;
    std::vector<DiagnosticObserver> observers_;
    Severity min_severity_ = Severity::Info;
};

}  // namespace colorkit::core
