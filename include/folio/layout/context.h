#pragma once
#include <folio/core/diagnostics.h>
#include <folio/layout/content.h>
#include <folio/layout/error.h>
#include <folio/layout/frame.h>
#include <folio/layout/regions.h>
#include <folio/style/style_chain.h>
#include <functional>
#include <string>

namespace folio::layout {

class LineBreaker;

// Callback type for measuring text width with real font metrics.
// Parameters: text, font_size
// Returns: advance width in points
using TextMeasureFn = std::function<float(const std::string& text, float font_size)>;

// Lays out one block-level child into regions. Implementations must honor
// the regions' expand flags.
class BlockLayouter {
public:
    virtual ~BlockLayouter() = default;
    virtual Fragment layout(const Content& content, const style::StyleChain& styles,
                            const Regions& regions) = 0;
};

// Collaborators shared by every layouter of one layout call. Not owned.
struct LayoutContext {
    core::DiagnosticEmitter* diagnostics = nullptr;
    BlockLayouter* blocks = nullptr;
    const LineBreaker* breaker = nullptr;
    TextMeasureFn text_measurer;

    // Measure a string using the injected measurer or the fallback advance.
    float measure_text(const std::string& text, float font_size) const;

    void warn(const std::string& module, const std::string& message, Span span = 0) const;

    // Emit an error event and throw it as a LayoutError.
    [[noreturn]] void fail(LayoutErrorKind kind, const std::string& module,
                           const std::string& message, Span span = 0) const;

    Fragment layout_block(const Content& content, const style::StyleChain& styles,
                          const Regions& regions) const;
};

} // namespace folio::layout
