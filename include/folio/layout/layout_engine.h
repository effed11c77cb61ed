#pragma once

#include <folio/core/diagnostics.h>
#include <folio/layout/block_layout.h>
#include <folio/layout/context.h>
#include <folio/layout/line_breaker.h>
#include <folio/layout/page_layout.h>

#include <optional>
#include <string>
#include <vector>

namespace folio::layout {

struct LayoutOptions {
    // Measures text with real font metrics. Unset: fallback advance.
    TextMeasureFn text_measurer;
    // Line breaking strategy, not owned. Null: the built-in breaker.
    const LineBreaker* breaker = nullptr;
    core::Severity min_severity = core::Severity::Info;
};

struct LayoutResult {
    bool ok = false;
    std::string message;
    std::optional<LayoutErrorKind> error;
    std::vector<LayoutedPage> pages;
    std::vector<core::DiagnosticEvent> diagnostics;
};

// Owns the collaborators of a layout call and turns a content stream into
// pages. Layout errors are reported in the result instead of thrown.
class LayoutEngine {
public:
    explicit LayoutEngine(LayoutOptions options = {});

    LayoutEngine(const LayoutEngine&) = delete;
    LayoutEngine& operator=(const LayoutEngine&) = delete;

    LayoutResult layout_document(const std::vector<Pair>& stream,
                                 const style::StyleChain& styles = {});

    // Lay out children as a flow into explicit regions. Throws LayoutError.
    Fragment layout_flow(const std::vector<Pair>& children, const style::StyleChain& styles,
                         const Regions& regions);

    const LayoutContext& context() const { return ctx_; }
    const core::DiagnosticEmitter& diagnostics() const { return diagnostics_; }

private:
    LayoutOptions options_;
    core::DiagnosticEmitter diagnostics_;
    DefaultLineBreaker default_breaker_;
    LayoutContext ctx_;
    ContentLayouter blocks_;
};

} // namespace folio::layout
