#include <folio/layout/context.h>
#include <folio/core/config.h>

namespace folio::layout {

float LayoutContext::measure_text(const std::string& text, float font_size) const {
    if (text_measurer && !text.empty()) {
        return text_measurer(text, font_size);
    }
    // Fallback: approximate
    float char_w = font_size * core::config::kFallbackCharWidthEm;
    return static_cast<float>(text.size()) * char_w;
}

void LayoutContext::warn(const std::string& module, const std::string& message, Span span) const {
    if (diagnostics) diagnostics->warn(module, "layout", message, span);
}

void LayoutContext::fail(LayoutErrorKind kind, const std::string& module,
                         const std::string& message, Span span) const {
    if (diagnostics) {
        diagnostics->error(module, layout_error_kind_name(kind), message, span);
    }
    throw LayoutError(kind, message, span);
}

Fragment LayoutContext::layout_block(const Content& content, const style::StyleChain& styles,
                                     const Regions& regions) const {
    if (!blocks) {
        fail(LayoutErrorKind::InvalidContent, "layout",
             std::string("no block layouter for ") + content_kind_name(content.kind), content.span);
    }
    return blocks->layout(content, styles, regions);
}

} // namespace folio::layout
