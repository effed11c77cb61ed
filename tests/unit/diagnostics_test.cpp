#include <folio/core/diagnostics.h>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace folio::core;

// ---------------------------------------------------------------------------
// 1. Emitted events keep their fields in order
// ---------------------------------------------------------------------------
TEST(DiagnosticsTest, EmitRecordsEventsInOrder) {
    DiagnosticEmitter emitter;
    emitter.info("flow", "layout", "first");
    emitter.warn("inline", "layout", "second", 7);

    ASSERT_EQ(emitter.size(), 2u);
    EXPECT_EQ(emitter.events()[0].severity, Severity::Info);
    EXPECT_EQ(emitter.events()[0].module, "flow");
    EXPECT_EQ(emitter.events()[1].message, "second");
    EXPECT_EQ(emitter.events()[1].span, 7u);
}

// ---------------------------------------------------------------------------
// 2. Minimum severity filters out quieter events
// ---------------------------------------------------------------------------
TEST(DiagnosticsTest, MinSeverityFilters) {
    DiagnosticEmitter emitter;
    emitter.set_min_severity(Severity::Warning);
    emitter.info("flow", "layout", "dropped");
    emitter.warn("flow", "layout", "kept");
    emitter.error("page", "marginal-overflow", "kept too");

    EXPECT_EQ(emitter.min_severity(), Severity::Warning);
    ASSERT_EQ(emitter.size(), 2u);
    EXPECT_TRUE(emitter.has_errors());
}

// ---------------------------------------------------------------------------
// 3. Queries by severity and module
// ---------------------------------------------------------------------------
TEST(DiagnosticsTest, QueryBySeverityAndModule) {
    DiagnosticEmitter emitter;
    emitter.warn("flow", "layout", "a");
    emitter.warn("page", "layout", "b");
    emitter.error("flow", "unsizable-axis", "c");

    EXPECT_EQ(emitter.events_by_severity(Severity::Warning).size(), 2u);
    EXPECT_EQ(emitter.count(Severity::Error), 1u);
    EXPECT_EQ(emitter.count(Severity::Info), 0u);
    auto flow = emitter.events_by_module("flow");
    ASSERT_EQ(flow.size(), 2u);
    EXPECT_EQ(flow[1].message, "c");
    EXPECT_TRUE(emitter.events_by_module("stack").empty());
}

// ---------------------------------------------------------------------------
// 4. Observers see every accepted event
// ---------------------------------------------------------------------------
TEST(DiagnosticsTest, ObserversAreNotified) {
    DiagnosticEmitter emitter;
    std::vector<std::string> seen;
    emitter.add_observer([&](const DiagnosticEvent& e) { seen.push_back(e.message); });
    emitter.set_min_severity(Severity::Warning);
    emitter.info("x", "y", "quiet");
    emitter.warn("x", "y", "loud");

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "loud");
}

// ---------------------------------------------------------------------------
// 5. Formatting
// ---------------------------------------------------------------------------
TEST(DiagnosticsTest, FormatDiagnostic) {
    DiagnosticEvent event;
    event.severity = Severity::Error;
    event.module = "page";
    event.stage = "marginal-overflow";
    event.message = "header does not fit";
    event.span = 12;
    EXPECT_EQ(format_diagnostic(event),
              "[error] page/marginal-overflow @12: header does not fit");

    event.span = 0;
    event.stage.clear();
    EXPECT_EQ(format_diagnostic(event), "[error] page: header does not fit");
}

// ---------------------------------------------------------------------------
// 6. Clear
// ---------------------------------------------------------------------------
TEST(DiagnosticsTest, ClearRemovesEvents) {
    DiagnosticEmitter emitter;
    emitter.error("a", "b", "c");
    emitter.clear();
    EXPECT_EQ(emitter.size(), 0u);
    EXPECT_FALSE(emitter.has_errors());
}
