#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace folio::layout {

// Identifies the source of a piece of content for error reporting. 0 means
// detached.
using Span = std::uint64_t;

enum class LayoutErrorKind {
    UnsizableAxis,     // a stack or flow resolved to an infinite main size
    MarginalOverflow,  // header, footer, background or foreground did not fit
    InvalidContent     // content that cannot appear where it was placed
};

const char* layout_error_kind_name(LayoutErrorKind kind);

class LayoutError : public std::runtime_error {
public:
    LayoutError(LayoutErrorKind kind, const std::string& message, Span span = 0)
        : std::runtime_error(message), kind_(kind), span_(span) {}

    LayoutErrorKind kind() const { return kind_; }
    Span span() const { return span_; }

private:
    LayoutErrorKind kind_;
    Span span_;
};

} // namespace folio::layout
