#pragma once
#include <folio/layout/content.h>
#include <folio/layout/context.h>
#include <folio/layout/frame.h>
#include <folio/layout/geometry.h>
#include <folio/style/style_chain.h>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace folio::layout {

// The side of a page at which it is bound.
enum class Binding { Left, Right };

// A laid out page that still needs its physical page number to be finalized.
struct LayoutedPage {
    Frame inner;
    EdgeSizes margin;
    Binding binding = Binding::Left;
    bool two_sided = false;
    std::optional<Frame> header;
    std::optional<Frame> footer;
    std::optional<Frame> background;
    std::optional<Frame> foreground;
    std::optional<std::string> fill;
    std::optional<std::string> numbering;

    Size full_size() const { return inner.size() + margin.sum_by_axis(); }

    // Margins on the page with the given one-based physical number. On
    // two-sided pages left becomes inside and right becomes outside.
    EdgeSizes margin_on(std::size_t physical_number) const;
};

// Styles of a page run: the styles shared by all non-tag children (or the
// initial styles if there are none), keeping a style only if it is outside of
// show-rule output and either was already active at the pagebreak or is
// liftable.
style::Styles determine_page_styles(const std::vector<Pair>& children,
                                    const style::StyleChain& initial);

// Lay out a run of children with uniform page styles into as many pages as
// the body needs.
std::vector<LayoutedPage> layout_page_run(const LayoutContext& ctx,
                                          const std::vector<Pair>& children,
                                          const style::StyleChain& initial);

// Split a document-level stream at its pagebreaks and lay out every run.
std::vector<LayoutedPage> layout_pages(const LayoutContext& ctx, const std::vector<Pair>& stream,
                                       const style::StyleChain& styles);

} // namespace folio::layout
