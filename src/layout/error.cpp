#include <folio/layout/error.h>

namespace folio::layout {

const char* layout_error_kind_name(LayoutErrorKind kind) {
    switch (kind) {
        case LayoutErrorKind::UnsizableAxis:    return "unsizable-axis";
        case LayoutErrorKind::MarginalOverflow: return "marginal-overflow";
        case LayoutErrorKind::InvalidContent:   return "invalid-content";
    }
    return "unknown";
}

} // namespace folio::layout
