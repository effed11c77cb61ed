#include <folio/layout/stack_layouter.h>
#include <folio/core/config.h>
#include <folio/style/properties.h>

#include <algorithm>
#include <optional>

namespace folio::layout {

StackItem StackItem::absolute(float amount) {
    StackItem item;
    item.kind = Kind::Absolute;
    item.amount = amount;
    return item;
}

StackItem StackItem::fractional(Fr fr) {
    StackItem item;
    item.kind = Kind::Fractional;
    item.fr = fr;
    return item;
}

StackItem StackItem::framed(Frame frame, Axes<FixedAlignment> align) {
    StackItem item;
    item.kind = Kind::Frame;
    item.frame = std::move(frame);
    item.align = align;
    return item;
}

StackLayouter::StackLayouter(const LayoutContext& ctx, Span span, Dir dir,
                             style::StyleChain styles, Regions regions)
    : ctx_(ctx),
      span_(span),
      dir_(dir),
      axis_(dir_axis(dir)),
      styles_(std::move(styles)),
      regions_(std::move(regions)) {
    expand_ = regions_.expand;
    // Children never expand along the stack axis.
    regions_.expand.set(axis_, false);
    initial_ = regions_.size;
}

float StackLayouter::font_size() const {
    return styles_.get_or<float>(style::props::kTextSize, core::config::kDefaultFontSize);
}

Axes<FixedAlignment> block_alignment(const style::StyleChain& styles) {
    Dir text_dir = styles.get_or<Dir>(style::props::kTextDir, Dir::LTR);
    return styles.get_or<Alignment>(style::props::kAlignment, Alignment()).resolve(text_dir);
}

void StackLayouter::layout_spacing(const Spacing& spacing) {
    if (spacing.is_fractional()) {
        layout_fractional(spacing.fr);
        return;
    }
    layout_absolute(spacing.rel.resolve(font_size(), regions_.base().get(axis_)));
}

void StackLayouter::layout_absolute(float amount) {
    float& remaining = regions_.size.get_mut(axis_);
    float limited = std::min(amount, remaining);
    // All regions share one width, so only vertical stacks consume it.
    if (axis_ == Axis::Y) {
        remaining -= limited;
    }
    used_main_ += limited;
    items_.push_back(StackItem::absolute(amount));
}

void StackLayouter::layout_fractional(Fr fr) {
    fr_ += fr;
    items_.push_back(StackItem::fractional(fr));
}

void StackLayouter::layout_block(const Content& block, const style::StyleChain& styles) {
    if (regions_.is_full()) {
        finish_region();
    }

    auto align = block_alignment(styles);
    Fragment fragment = ctx_.layout_block(block, styles, regions_);
    std::size_t len = fragment.size();
    std::vector<Frame> frames = std::move(fragment).into_frames();
    for (std::size_t i = 0; i < len; ++i) {
        push_frame(std::move(frames[i]), align);
        if (i + 1 < len) {
            finish_region();
        }
    }
}

void StackLayouter::push_frame(Frame frame, Axes<FixedAlignment> align) {
    float main = frame.size().get(axis_);
    float cross = frame.size().get(other_axis(axis_));
    if (axis_ == Axis::Y) {
        regions_.size.height -= main;
    }
    used_main_ += main;
    used_cross_ = std::max(used_cross_, cross);
    items_.push_back(StackItem::framed(std::move(frame), align));
}

void StackLayouter::place_overlay(Frame frame, Axes<FixedAlignment> align, Point offset) {
    overlays_.push_back(Overlay{std::move(frame), align, offset});
}

void StackLayouter::reserve_start(float amount) {
    if (axis_ == Axis::Y) regions_.size.height -= amount;
    used_main_ += amount;
    reserved_start_ += amount;
}

void StackLayouter::reserve_end(float amount) {
    if (axis_ == Axis::Y) regions_.size.height -= amount;
    used_main_ += amount;
    reserved_end_ += amount;
}

bool StackLayouter::has_frames() const {
    return std::any_of(items_.begin(), items_.end(),
                       [](const StackItem& item) { return item.kind == StackItem::Kind::Frame; });
}

void StackLayouter::finish_region() {
    // Shrink to the used size unless the region expands.
    Size used = axis_ == Axis::Y ? Size(used_cross_, used_main_) : Size(used_main_, used_cross_);
    Size size = used.select(expand_, initial_).min(initial_);

    // Fractional spacing takes up the whole region.
    float full = initial_.get(axis_);
    float remaining = full - used_main_;
    if (fr_.value > 0 && std::isfinite(full)) {
        used_main_ = full;
        size.set(axis_, full);
    }

    if (!size.is_finite()) {
        ctx_.fail(LayoutErrorKind::UnsizableAxis, "stack",
                  "cannot size stack: region is infinite along the stack axis", span_);
    }

    Frame output = Frame::hard(size);
    Axis other = other_axis(axis_);
    bool positive = dir_is_positive(dir_);
    float cursor = reserved_start_;
    FixedAlignment ruler = dir_start(dir_);

    for (auto& item : items_) {
        switch (item.kind) {
            case StackItem::Kind::Absolute:
                cursor += item.amount;
                break;
            case StackItem::Kind::Fractional:
                cursor += item.fr.share(fr_, remaining);
                break;
            case StackItem::Kind::Frame: {
                FixedAlignment align_main = item.align.get(axis_);
                ruler = positive ? align_max(ruler, align_main) : align_min(ruler, align_main);

                float parent = size.get(axis_);
                float child = item.frame.size().get(axis_);
                float main = align_position(ruler, parent - used_main_) +
                             (positive ? cursor : used_main_ - child - cursor);
                float cross = align_position(item.align.get(other),
                                             size.get(other) - item.frame.size().get(other));

                Point pos = axis_ == Axis::Y ? Point(cross, main) : Point(main, cross);
                cursor += child;
                output.push_frame(pos, std::move(item.frame));
                break;
            }
        }
    }

    for (auto& overlay : overlays_) {
        float x = align_position(overlay.align.x, size.width - overlay.frame.width());
        float y = align_position(overlay.align.y, size.height - overlay.frame.height());
        output.push_frame(Point(x, y) + overlay.offset, std::move(overlay.frame));
    }

    regions_.next();
    initial_ = regions_.size;
    used_main_ = 0;
    used_cross_ = 0;
    reserved_start_ = 0;
    reserved_end_ = 0;
    fr_ = Fr();
    items_.clear();
    overlays_.clear();
    finished_.push_back(std::move(output));
}

Fragment StackLayouter::finish() {
    finish_region();
    return Fragment(std::move(finished_));
}

Fragment layout_stack(const LayoutContext& ctx, const Content& stack,
                      const style::StyleChain& styles, const Regions& regions) {
    StackLayouter layouter(ctx, stack.span, stack.dir, styles, regions);

    // Spacing to insert before the next block.
    std::optional<Spacing> deferred;
    for (const auto& child : stack.children) {
        const Content& content = *child.content;
        switch (content.kind) {
            case ContentKind::HSpacing:
            case ContentKind::VSpacing:
                layouter.layout_spacing(content.amount);
                deferred.reset();
                break;
            case ContentKind::Tag:
                break;
            default:
                if (deferred) layouter.layout_spacing(*deferred);
                layouter.layout_block(content, child.styles);
                deferred = stack.stack_spacing;
                break;
        }
    }

    return layouter.finish();
}

} // namespace folio::layout
