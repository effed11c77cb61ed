#pragma once
#include <folio/layout/context.h>
#include <folio/layout/exclusions.h>
#include <folio/layout/inline_layout.h>
#include <folio/layout/stack_layouter.h>
#include <folio/style/style_chain.h>
#include <vector>

namespace folio::layout {

// Weakness of spacing inserted by the flow itself. Weaker (higher) spacing
// yields to stronger spacing when adjacent.
inline constexpr int kUserWeakness = 1;
inline constexpr int kBlockSpacingWeakness = 4;
inline constexpr int kParSpacingWeakness = 4;
inline constexpr int kLeadingWeakness = 5;

// Block-level flow: paragraphs are broken into lines placed one by one,
// blocks and stacks into as many regions as they need, and placed content is
// positioned relative to the region.
class FlowLayouter {
public:
    FlowLayouter(const LayoutContext& ctx, Span span, style::StyleChain styles, Regions regions);

    void layout(const std::vector<Pair>& children);

    // Finish the last region. With `exhaust_backlog` every region of the
    // backlog produces a frame, even if empty.
    Fragment finish(bool exhaust_backlog = false);

private:
    struct Pending {
        float amount = 0;
        int weakness = 0;  // 0: nothing pending
    };

    struct DeferredFloat {
        Frame frame;
        FixedAlignment align_x = FixedAlignment::Start;
        bool bottom = false;
        float clearance = 0;
    };

    void layout_child(const Pair& child);
    void layout_spacing(const Content& spacing, const style::StyleChain& styles);
    void layout_weak(float amount, int weakness);
    void layout_par(const Content& par, const style::StyleChain& styles);
    void layout_inline_run(const std::vector<Pair>& run);
    void place_lines(std::vector<Frame> lines, float leading, const style::Costs& costs,
                     Axes<FixedAlignment> align);
    void layout_line(Frame line, float need, Axes<FixedAlignment> align);
    void layout_multi(const Content& block, const style::StyleChain& styles);
    void layout_single(const Content& block, const style::StyleChain& styles);
    void layout_placed(const Content& placed, const style::StyleChain& styles);
    void layout_float(DeferredFloat placed, bool force);
    void layout_wrap_float(const Content& placed, const style::StyleChain& styles, Frame frame);

    LaidOutPar measure_par(const Content& par, const style::StyleChain& styles, const Region& region,
                           float par_y, bool& wrapped);

    // Queue a frame, committing pending weak spacing before it.
    void place_frame(Frame frame, Axes<FixedAlignment> align);
    // Break to the next region because content does not fit.
    void advance();
    void finish_region();

    float font_size(const style::StyleChain& styles) const;
    Region child_region() const;
    // Remaining height after pending spacing.
    float available() const;
    // Offset from the region top where the next frame would go.
    float current_y() const;
    bool next_region_fits(float need) const;
    bool region_is_fresh() const;

    const LayoutContext& ctx_;
    Span span_;
    style::StyleChain styles_;
    StackLayouter stack_;
    Pending pending_;
    ParSituation situation_ = ParSituation::First;
    std::vector<WrapFloat> wrap_floats_;
    std::vector<DeferredFloat> deferred_floats_;
};

Fragment layout_flow(const LayoutContext& ctx, const std::vector<Pair>& children,
                     const style::StyleChain& styles, const Regions& regions,
                     bool exhaust_backlog = false, Span span = 0);

} // namespace folio::layout
