#pragma once
#include <folio/layout/context.h>
#include <folio/layout/frame.h>
#include <folio/layout/geometry.h>
#include <folio/layout/regions.h>
#include <folio/style/style_chain.h>
#include <cstddef>
#include <vector>

namespace folio::layout {

// One queued entry of a stack region, consumed when the region is finished.
struct StackItem {
    enum class Kind { Absolute, Fractional, Frame };

    Kind kind = Kind::Absolute;
    float amount = 0;
    Fr fr;
    Frame frame;
    Axes<FixedAlignment> align;

    static StackItem absolute(float amount);
    static StackItem fractional(Fr fr);
    static StackItem framed(Frame frame, Axes<FixedAlignment> align);
};

// Lays out spacing and blocks along one axis into a sequence of regions.
// Fractional spacing is resolved per region when the region is finished, once
// the space used by everything else is known.
class StackLayouter {
public:
    StackLayouter(const LayoutContext& ctx, Span span, Dir dir, style::StyleChain styles,
                  Regions regions);

    // Absolute spacing resolves against the base size and is clipped to the
    // remaining space; fractional spacing is queued.
    void layout_spacing(const Spacing& spacing);
    void layout_absolute(float amount);
    void layout_fractional(Fr fr);

    // Lay out a block child. Every frame but the last finishes a region.
    void layout_block(const Content& block, const style::StyleChain& styles);

    // Queue a finished frame in the current region.
    void push_frame(Frame frame, Axes<FixedAlignment> align);

    // Place a frame relative to the region at finish time, at an alignment
    // plus offset, without taking any space.
    void place_overlay(Frame frame, Axes<FixedAlignment> align, Point offset);

    // Reserve space at the start or end of the main axis of the current
    // region. Queued items are shifted past the start reservation.
    void reserve_start(float amount);
    void reserve_end(float amount);

    void finish_region();
    Fragment finish();

    const Regions& regions() const { return regions_; }
    Dir dir() const { return dir_; }
    Axis axis() const { return axis_; }
    float used_main() const { return used_main_; }
    float reserved_start() const { return reserved_start_; }
    float reserved_end() const { return reserved_end_; }
    bool has_frames() const;
    std::size_t finished_count() const { return finished_.size(); }

private:
    struct Overlay {
        Frame frame;
        Axes<FixedAlignment> align;
        Point offset;
    };

    float font_size() const;

    const LayoutContext& ctx_;
    Span span_;
    Dir dir_;
    Axis axis_;
    style::StyleChain styles_;
    Regions regions_;
    // Expansion requested by the caller; the regions handed to children do
    // not expand along the stack axis.
    Axes<bool> expand_;
    // Size of the current region before anything was laid out in it.
    Size initial_;
    float used_main_ = 0;
    float used_cross_ = 0;
    float reserved_start_ = 0;
    float reserved_end_ = 0;
    Fr fr_;
    std::vector<StackItem> items_;
    std::vector<Overlay> overlays_;
    std::vector<Frame> finished_;
};

// Alignment of a block child, resolved against its text direction.
Axes<FixedAlignment> block_alignment(const style::StyleChain& styles);

// Lay out a stack element: its children separated by the element's spacing,
// which is dropped next to explicit spacing children.
Fragment layout_stack(const LayoutContext& ctx, const Content& stack,
                      const style::StyleChain& styles, const Regions& regions);

} // namespace folio::layout
