#include <folio/layout/block_layout.h>
#include <folio/core/config.h>
#include <folio/layout/flow_layouter.h>
#include <folio/layout/stack_layouter.h>
#include <folio/style/properties.h>

#include <algorithm>
#include <cmath>

namespace folio::layout {

namespace {

float font_size_of(const style::StyleChain& styles) {
    return styles.get_or<float>(style::props::kTextSize, core::config::kDefaultFontSize);
}

// Move the content past the inset and grow the frame around it.
void grow_by_inset(Frame& frame, const EdgeSizes& inset) {
    if (inset == EdgeSizes()) return;
    frame.translate(Point(inset.left, inset.top));
    frame.set_size(frame.size() + inset.sum_by_axis());
}

} // namespace

Fragment ContentLayouter::layout(const Content& content, const style::StyleChain& styles,
                                 const Regions& regions) {
    switch (content.kind) {
        case ContentKind::Block:
            if (content.breakable) {
                return layout_multi_block(ctx_, content, styles, regions);
            }
            return Fragment::frame(
                layout_single_block(ctx_, content, styles, Region(regions.base(), regions.expand)));
        case ContentKind::Stack:
            return layout_stack(ctx_, content, styles, regions);
        case ContentKind::PageCounter:
            return Fragment::frame(layout_page_counter(ctx_, content, styles));
        default: {
            // Anything else is the sole child of an anonymous flow. The pair
            // only borrows the content for the duration of the call.
            std::vector<Pair> children{Pair{ContentPtr(ContentPtr(), &content), styles}};
            return layout_flow(ctx_, children, styles, regions, false, content.span);
        }
    }
}

std::vector<float> distribute_height(float height, Regions regions) {
    std::vector<float> heights;
    float remaining = height;
    while (true) {
        float limited = std::max(0.0f, std::min(regions.size.height, remaining));
        heights.push_back(limited);
        remaining -= limited;
        if (approx_eq(remaining, 0) || !regions.may_break() ||
            (!regions.may_progress() && approx_eq(limited, 0))) {
            break;
        }
        regions.next();
    }
    if (!approx_eq(remaining, 0)) {
        heights.back() += remaining;
    }
    return heights;
}

Frame layout_single_block(const LayoutContext& ctx, const Content& block,
                          const style::StyleChain& styles, const Region& region) {
    float fs = font_size_of(styles);
    Size size(block.width ? block.width->resolve(fs, region.size.width) : region.size.width,
              block.height ? block.height->resolve(fs, region.size.height) : region.size.height);
    size = size - block.inset.sum_by_axis();

    // Only explicit sizes force the body to fill the block.
    Axes<bool> expand(block.width.has_value() && std::isfinite(size.width),
                      block.height.has_value() && std::isfinite(size.height));
    Region pod(size, expand);

    Frame frame = layout_flow(ctx, block.children, styles, pod, false, block.span).into_frame();
    frame.set_size(frame.size().select(expand, pod.size));
    grow_by_inset(frame, block.inset);
    return frame;
}

Fragment layout_multi_block(const LayoutContext& ctx, const Content& block,
                            const style::StyleChain& styles, const Regions& regions) {
    float fs = font_size_of(styles);
    Size base = regions.base();

    Regions pod = regions;
    if (block.height) {
        float resolved = block.height->resolve(fs, base.height);
        std::vector<float> heights = distribute_height(resolved, regions);
        pod.size.height = heights.front();
        pod.full = resolved;
        pod.backlog.assign(heights.begin() + 1, heights.end());
        pod.last.reset();
    }
    if (block.width) {
        pod.size.width = block.width->resolve(fs, base.width);
    }

    Size inset = block.inset.sum_by_axis();
    if (inset != Size()) {
        pod = pod.map([&](Size s) { return s - inset; });
    }
    pod.expand = Axes<bool>(block.width.has_value() && std::isfinite(pod.size.width),
                            block.height.has_value() && std::isfinite(pod.size.height));

    // A fixed height occupies every region it was distributed over.
    bool exhaust = block.height.has_value();
    Fragment fragment = layout_flow(ctx, block.children, styles, pod, exhaust, block.span);

    // Frames of one block share a width: relayout at the widest.
    if (!pod.expand.x && fragment.size() > 1) {
        float widest = 0;
        bool uneven = false;
        for (const Frame& frame : fragment) {
            if (widest > 0 && !approx_eq(widest, frame.width())) uneven = true;
            widest = std::max(widest, frame.width());
        }
        if (uneven) {
            pod.size.width = widest;
            pod.expand.x = true;
            fragment = layout_flow(ctx, block.children, styles, pod, exhaust, block.span);
        }
    }

    std::vector<Size> sizes = pod.iter(fragment.size());
    std::vector<Frame> frames = std::move(fragment).into_frames();
    for (std::size_t i = 0; i < frames.size(); ++i) {
        frames[i].set_size(frames[i].size().select(pod.expand, sizes[i]));
        grow_by_inset(frames[i], block.inset);
    }
    return Fragment(std::move(frames));
}

Frame layout_page_counter(const LayoutContext& ctx, const Content& counter,
                          const style::StyleChain& styles) {
    float fs = font_size_of(styles);
    float width = ctx.measure_text(counter.numbering, fs);
    Frame frame = Frame::soft(Size(width, fs));
    frame.push_page_number(Point(0, 0), counter.numbering, fs, width);
    return frame;
}

} // namespace folio::layout
