#include <folio/layout/layout_engine.h>
#include <folio/layout/flow_layouter.h>

#include <string>
#include <utility>

namespace folio::layout {

LayoutEngine::LayoutEngine(LayoutOptions options)
    : options_(std::move(options)), blocks_(ctx_) {
    diagnostics_.set_min_severity(options_.min_severity);
    ctx_.diagnostics = &diagnostics_;
    ctx_.blocks = &blocks_;
    ctx_.breaker = options_.breaker ? options_.breaker : &default_breaker_;
    ctx_.text_measurer = options_.text_measurer;
}

LayoutResult LayoutEngine::layout_document(const std::vector<Pair>& stream,
                                           const style::StyleChain& styles) {
    diagnostics_.clear();
    diagnostics_.info("engine", "layout", "Laying out " + std::to_string(stream.size()) +
                                              " top-level children");

    LayoutResult result;
    try {
        result.pages = layout_pages(ctx_, stream, styles);
        result.ok = true;
        result.message = std::to_string(result.pages.size()) + " pages";
        diagnostics_.info("engine", "layout", "Laid out " + result.message);
    } catch (const LayoutError& e) {
        // The error event was emitted where the error was raised.
        result.ok = false;
        result.message = e.what();
        result.error = e.kind();
    }
    result.diagnostics = diagnostics_.events();
    return result;
}

Fragment LayoutEngine::layout_flow(const std::vector<Pair>& children,
                                   const style::StyleChain& styles, const Regions& regions) {
    return folio::layout::layout_flow(ctx_, children, styles, regions);
}

} // namespace folio::layout
