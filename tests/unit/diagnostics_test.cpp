#include <livepatch/core/diagnostics.h>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using livepatch::core::DiagnosticEmitter;
using livepatch::core::DiagnosticEvent;
using livepatch::core::Severity;

// ------------------------------------------------------------------
// 1. Formatting
// ------------------------------------------------------------------

TEST(DiagnosticsTest, SeverityNames) {
    EXPECT_STREQ(livepatch::core::severity_name(Severity::Info), "info");
    EXPECT_STREQ(livepatch::core::severity_name(Severity::Warning), "warning");
    EXPECT_STREQ(livepatch::core::severity_name(Severity::Error), "error");
}

TEST(DiagnosticsTest, FormatIncludesModuleStageAndCorrelation) {
    DiagnosticEvent event;
    event.severity = Severity::Warning;
    event.module = "apply";
    event.stage = "resolve";
    event.message = "target not found";
    event.correlation_id = 3;

    EXPECT_EQ(livepatch::core::format_diagnostic(event),
              "[warning] apply/resolve (cid:3): target not found");
}

TEST(DiagnosticsTest, FormatOmitsZeroCorrelation) {
    DiagnosticEvent event;
    event.severity = Severity::Info;
    event.module = "diff";
    event.message = "done";
    EXPECT_EQ(livepatch::core::format_diagnostic(event), "[info] diff: done");
}

// ------------------------------------------------------------------
// 2. Emitter
// ------------------------------------------------------------------

TEST(DiagnosticsTest, EmitRecordsAllFields) {
    DiagnosticEmitter emitter;
    emitter.set_correlation_id(42);
    emitter.error("session", "verify", "mirror diverged");

    ASSERT_EQ(emitter.size(), 1u);
    const auto& e = emitter.events()[0];
    EXPECT_EQ(e.severity, Severity::Error);
    EXPECT_EQ(e.module, "session");
    EXPECT_EQ(e.stage, "verify");
    EXPECT_EQ(e.message, "mirror diverged");
    EXPECT_EQ(e.correlation_id, 42u);
    EXPECT_NE(e.timestamp, std::chrono::steady_clock::time_point{});
}

TEST(DiagnosticsTest, MinSeverityFiltersEvents) {
    DiagnosticEmitter emitter;
    emitter.set_min_severity(Severity::Warning);
    emitter.info("html", "tree", "ignored");
    emitter.warning("html", "tree", "kept");
    emitter.error("html", "decode", "kept too");

    EXPECT_EQ(emitter.size(), 2u);
    EXPECT_EQ(emitter.count(Severity::Info), 0u);
    EXPECT_EQ(emitter.count(Severity::Warning), 1u);
}

TEST(DiagnosticsTest, QueriesBySeverityAndModule) {
    DiagnosticEmitter emitter;
    emitter.warning("diff", "keyed", "duplicate key");
    emitter.warning("apply", "resolve", "missing");
    emitter.error("apply", "op", "bad op");

    EXPECT_EQ(emitter.events_by_severity(Severity::Warning).size(), 2u);
    EXPECT_EQ(emitter.events_by_module("apply").size(), 2u);
    EXPECT_EQ(emitter.events_by_module("html").size(), 0u);

    emitter.clear();
    EXPECT_EQ(emitter.size(), 0u);
}

TEST(DiagnosticsTest, ObserversSeeEventsEvenWhenNotRetained) {
    DiagnosticEmitter emitter;
    std::vector<std::string> seen;
    emitter.add_observer([&seen](const DiagnosticEvent& e) { seen.push_back(e.message); });
    emitter.set_retain_events(false);

    emitter.info("session", "render", "first");
    emitter.info("session", "render", "second");

    EXPECT_EQ(emitter.size(), 0u);
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[1], "second");
}
