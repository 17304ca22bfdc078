#include <colorkit/core/diagnostics.h>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace colorkit::core;

// ------------------------------------------------------------------
// 1. Events
// ------------------------------------------------------------------

TEST(DiagnosticsTest, SeverityNames) {
    EXPECT_STREQ(severity_name(Severity::Info), "info");
    EXPECT_STREQ(severity_name(Severity::Warning), "warning");
    EXPECT_STREQ(severity_name(Severity::Error), "error");
}

TEST(DiagnosticsTest, EmitRecordsAllFields) {
    DiagnosticEmitter emitter;
    emitter.emit(Severity::Error, "worker", "decode", "Deserializer underflow", 42);

    ASSERT_EQ(emitter.size(), 1u);
    const auto e = emitter.events()[0];
    EXPECT_EQ(e.severity, Severity::Error);
    EXPECT_EQ(e.module, "worker");
    EXPECT_EQ(e.stage, "decode");
    EXPECT_EQ(e.message, "Deserializer underflow");
    EXPECT_EQ(e.correlation_id, 42u);
    EXPECT_NE(e.timestamp, std::chrono::steady_clock::time_point{});
}

TEST(DiagnosticsTest, FormatIncludesContext) {
    DiagnosticEvent event;
    event.severity = Severity::Warning;
    event.module = "worker";
    event.stage = "serve";
    event.message = "ignored message type 42";
    event.correlation_id = 7;
    EXPECT_EQ(format_diagnostic(event),
              "[warning] worker/serve (cid:7): ignored message type 42");

    event.correlation_id = 0;
    event.stage.clear();
    EXPECT_EQ(format_diagnostic(event), "[warning] worker: ignored message type 42");
}

// ------------------------------------------------------------------
// 2. Filtering
// ------------------------------------------------------------------

TEST(DiagnosticsTest, MinSeverityDropsQuieterEvents) {
    DiagnosticEmitter emitter;
    emitter.set_min_severity(Severity::Warning);
    EXPECT_EQ(emitter.min_severity(), Severity::Warning);

    emitter.emit(Severity::Info, "worker", "contrast_region", "traced 1 paths");
    emitter.emit(Severity::Warning, "worker", "serve", "ignored");
    emitter.emit(Severity::Error, "worker", "decode", "bad payload");
    EXPECT_EQ(emitter.size(), 2u);
}

TEST(DiagnosticsTest, QueriesByModuleSeverityAndCorrelation) {
    DiagnosticEmitter emitter;
    emitter.emit(Severity::Info, "worker", "contrast_region", "a", 1);
    emitter.emit(Severity::Error, "worker", "contrast_region", "b", 2);
    emitter.emit(Severity::Info, "css", "parse", "c", 2);

    EXPECT_EQ(emitter.events_by_module("worker").size(), 2u);
    EXPECT_EQ(emitter.events_by_severity(Severity::Info).size(), 2u);
    auto second = emitter.events_for(2);
    ASSERT_EQ(second.size(), 2u);
    EXPECT_EQ(second[0].message, "b");
    EXPECT_EQ(second[1].message, "c");

    emitter.clear();
    EXPECT_EQ(emitter.size(), 0u);
}

TEST(DiagnosticsTest, RetainsOnlyNewestEvents) {
    DiagnosticEmitter emitter;
    EXPECT_EQ(emitter.max_events(), colorkit::core::config::kDefaultMaxDiagnosticEvents);

    size_t observed = 0;
    emitter.add_observer([&observed](const DiagnosticEvent&) { ++observed; });
    emitter.set_max_events(3);
    for (int i = 0; i < 5; ++i) {
        emitter.emit(Severity::Info, "worker", "contrast_region", std::to_string(i));
    }

    EXPECT_EQ(observed, 5u);
    auto events = emitter.events();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].message, "2");
    EXPECT_EQ(events[2].message, "4");

    emitter.set_max_events(1);
    ASSERT_EQ(emitter.size(), 1u);
    EXPECT_EQ(emitter.events()[0].message, "4");
}

TEST(DiagnosticsTest, DefaultCapBoundsLongRuns) {
    DiagnosticEmitter emitter;
    const size_t total = colorkit::core::config::kDefaultMaxDiagnosticEvents + 100;
    for (size_t i = 0; i < total; ++i) {
        emitter.emit(Severity::Info, "worker", "contrast_region", "traced 1 paths", i + 1);
    }
    EXPECT_EQ(emitter.size(), colorkit::core::config::kDefaultMaxDiagnosticEvents);
    EXPECT_TRUE(emitter.events_for(1).empty());
    EXPECT_EQ(emitter.events_for(total).size(), 1u);
}

// ------------------------------------------------------------------
// 3. Observers
// ------------------------------------------------------------------

TEST(DiagnosticsTest, ObserversSeeEachEvent) {
    DiagnosticEmitter emitter;
    std::vector<std::string> seen;
    emitter.add_observer([&seen](const DiagnosticEvent& e) {
        seen.push_back(format_diagnostic(e));
    });

    emitter.emit(Severity::Info, "worker", "contrast_region", "traced 2 paths", 3);
    emitter.set_min_severity(Severity::Error);
    emitter.emit(Severity::Info, "worker", "contrast_region", "dropped", 4);

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "[info] worker/contrast_region (cid:3): traced 2 paths");
}
