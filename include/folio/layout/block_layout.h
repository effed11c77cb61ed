#pragma once
#include <folio/layout/context.h>
#include <folio/layout/frame.h>
#include <folio/layout/regions.h>
#include <folio/style/style_chain.h>

namespace folio::layout {

// The default block layouter: dispatches on the content kind. Blocks and
// stacks get their own layout, page counters become placeholders and
// everything else is laid out as a flow of one child.
class ContentLayouter : public BlockLayouter {
public:
    explicit ContentLayouter(const LayoutContext& ctx) : ctx_(ctx) {}

    Fragment layout(const Content& content, const style::StyleChain& styles,
                    const Regions& regions) override;

private:
    const LayoutContext& ctx_;
};

// Lay out a breakable block. A fixed height is distributed over as many
// regions as it needs.
Fragment layout_multi_block(const LayoutContext& ctx, const Content& block,
                            const style::StyleChain& styles, const Regions& regions);

// Lay out an unbreakable block into a single frame.
Frame layout_single_block(const LayoutContext& ctx, const Content& block,
                          const style::StyleChain& styles, const Region& region);

// A page-number placeholder sized by the measured numbering pattern.
Frame layout_page_counter(const LayoutContext& ctx, const Content& counter,
                          const style::StyleChain& styles);

// Split a fixed height into per-region heights. Whatever does not fit goes
// into the last region.
std::vector<float> distribute_height(float height, Regions regions);

} // namespace folio::layout
