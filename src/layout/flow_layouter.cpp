#include <folio/layout/flow_layouter.h>
#include <folio/core/config.h>
#include <folio/style/properties.h>

#include <algorithm>
#include <cassert>
#include <sstream>

namespace folio::layout {

namespace props = style::props;

namespace {

bool is_inline_level(ContentKind kind) {
    return kind == ContentKind::Text || kind == ContentKind::HSpacing ||
           kind == ContentKind::Linebreak;
}

} // namespace

FlowLayouter::FlowLayouter(const LayoutContext& ctx, Span span, style::StyleChain styles,
                           Regions regions)
    : ctx_(ctx),
      span_(span),
      styles_(styles),
      stack_(ctx, span, Dir::TTB, std::move(styles), std::move(regions)) {}

float FlowLayouter::font_size(const style::StyleChain& styles) const {
    return styles.get_or<float>(props::kTextSize, core::config::kDefaultFontSize);
}

Region FlowLayouter::child_region() const {
    const Regions& regions = stack_.regions();
    return Region(regions.base(), Axes<bool>(regions.expand.x, false));
}

float FlowLayouter::available() const {
    return stack_.regions().size.height - pending_.amount;
}

float FlowLayouter::current_y() const {
    return stack_.regions().full - available();
}

bool FlowLayouter::next_region_fits(float need) const {
    std::vector<Size> sizes = stack_.regions().iter(2);
    return sizes.size() > 1 && fits(sizes[1].height, need);
}

bool FlowLayouter::region_is_fresh() const {
    return !stack_.has_frames() && stack_.reserved_start() == 0 && stack_.reserved_end() == 0;
}

void FlowLayouter::layout(const std::vector<Pair>& children) {
    std::size_t i = 0;
    while (i < children.size()) {
        if (is_inline_level(children[i].content->kind)) {
            std::size_t j = i;
            while (j < children.size() && (is_inline_level(children[j].content->kind) ||
                                           children[j].content->is(ContentKind::Tag))) {
                ++j;
            }
            layout_inline_run(std::vector<Pair>(children.begin() + static_cast<std::ptrdiff_t>(i),
                                                children.begin() + static_cast<std::ptrdiff_t>(j)));
            i = j;
            continue;
        }
        layout_child(children[i]);
        ++i;
    }
}

void FlowLayouter::layout_child(const Pair& child) {
    const Content& content = *child.content;
    switch (content.kind) {
        case ContentKind::Tag:
            break;
        case ContentKind::VSpacing:
            layout_spacing(content, child.styles);
            break;
        case ContentKind::Paragraph:
            layout_par(content, child.styles);
            break;
        case ContentKind::Block:
            if (content.breakable) {
                layout_multi(content, child.styles);
            } else {
                layout_single(content, child.styles);
            }
            break;
        case ContentKind::Stack:
            layout_multi(content, child.styles);
            break;
        case ContentKind::PageCounter:
            layout_single(content, child.styles);
            break;
        case ContentKind::Place:
            layout_placed(content, child.styles);
            break;
        case ContentKind::Pagebreak:
            ctx_.fail(LayoutErrorKind::InvalidContent, "flow",
                      "pagebreaks are not allowed inside of containers", content.span);
        default:
            // Inline-level content is grouped into runs by layout().
            layout_inline_run({child});
            break;
    }
}

// ---------------------------------------------------------------------------
// Spacing
// ---------------------------------------------------------------------------

void FlowLayouter::layout_spacing(const Content& spacing, const style::StyleChain& styles) {
    if (spacing.amount.is_fractional()) {
        // Fractional spacing swallows trailing weak spacing.
        if (spacing.weak && !stack_.has_frames()) return;
        pending_ = Pending{};
        stack_.layout_fractional(spacing.amount.fr);
        return;
    }

    float amount = spacing.amount.rel.resolve(font_size(styles), stack_.regions().base().height);
    if (spacing.weak) {
        layout_weak(amount, kUserWeakness);
    } else {
        stack_.layout_absolute(amount);
    }
}

void FlowLayouter::layout_weak(float amount, int weakness) {
    // Weak spacing vanishes at the start of a region.
    if (!stack_.has_frames()) return;
    if (pending_.weakness == 0 || weakness < pending_.weakness ||
        (weakness == pending_.weakness && amount > pending_.amount)) {
        pending_ = Pending{amount, weakness};
    }
}

// ---------------------------------------------------------------------------
// Paragraphs and lines
// ---------------------------------------------------------------------------

LaidOutPar FlowLayouter::measure_par(const Content& par, const style::StyleChain& styles,
                                     const Region& region, float par_y, bool& wrapped) {
    wrapped = false;
    LaidOutPar measured = layout_lines(ctx_, par.children, styles, region, situation_, nullptr);
    if (wrap_floats_.empty()) return measured;

    // The exclusions depend on the paragraph height, which depends on the
    // exclusions: re-measure until the line breaks settle.
    ParExclusions exclusions =
        ParExclusions::from_wrap_floats(par_y, measured.total_height(), wrap_floats_);
    if (exclusions.is_empty()) return measured;

    wrapped = true;
    std::vector<std::vector<std::size_t>> seen{measured.breaks};
    for (int i = 0; i < core::config::kMaxWrapIterations; ++i) {
        LaidOutPar refined = layout_lines(ctx_, par.children, styles, region, situation_, &exclusions);
        if (refined.breaks == seen.back()) return refined;
        if (std::find(seen.begin(), seen.end(), refined.breaks) != seen.end()) {
            ctx_.warn("flow", "wrap layout oscillating; using current approximation", par.span);
            return refined;
        }
        seen.push_back(refined.breaks);

        ParExclusions updated =
            ParExclusions::from_wrap_floats(par_y, refined.total_height(), wrap_floats_);
        if (updated.is_empty()) {
            wrapped = false;
            return layout_lines(ctx_, par.children, styles, region, situation_, nullptr);
        }
        exclusions = std::move(updated);
    }
    return layout_lines(ctx_, par.children, styles, region, situation_, &exclusions);
}

void FlowLayouter::layout_par(const Content& par, const style::StyleChain& styles) {
    float spacing = styles.get_or<Rel>(props::kParSpacing, Rel::ems(core::config::kDefaultParSpacingEm))
                        .resolve(font_size(styles), stack_.regions().base().height);
    layout_weak(spacing, kParSpacingWeakness);

    bool wrapped = false;
    LaidOutPar measured = measure_par(par, styles, child_region(), current_y(), wrapped);
    if (wrapped && measured.overfull) {
        ctx_.warn("flow",
                  "text overflows wrap-float gap; consider reducing float size or clearance",
                  par.span);
    }

    auto costs = styles.get_or<style::Costs>(props::kTextCosts, style::Costs());
    place_lines(std::move(measured.lines), measured.leading, costs, block_alignment(styles));

    layout_weak(spacing, kParSpacingWeakness);
    situation_ = ParSituation::Consecutive;
}

void FlowLayouter::layout_inline_run(const std::vector<Pair>& run) {
    std::vector<style::StyleChain> chains;
    for (const auto& pair : run) {
        if (!pair.content->is(ContentKind::Tag)) chains.push_back(pair.styles);
    }
    style::StyleChain shared = style::StyleChain::trunk(chains).value_or(styles_);

    LaidOutPar laid_out = layout_lines(ctx_, run, shared, child_region(), std::nullopt, nullptr);
    auto costs = shared.get_or<style::Costs>(props::kTextCosts, style::Costs());
    place_lines(std::move(laid_out.lines), laid_out.leading, costs, block_alignment(shared));
}

void FlowLayouter::place_lines(std::vector<Frame> lines, float leading, const style::Costs& costs,
                               Axes<FixedAlignment> align) {
    std::size_t len = lines.size();
    if (len == 0) return;

    // Keep the first two and the last two lines together when widows and
    // orphans are prevented. With exactly three lines, all of them.
    bool prevent_orphans = costs.orphan > 0 && len >= 2 && !lines[1].is_empty();
    bool prevent_widows = costs.widow > 0 && len >= 2 && !lines[len - 2].is_empty();
    bool prevent_all = len == 3 && prevent_orphans && prevent_widows;

    float front_1 = lines[0].height();
    float front_2 = lines[1 % len].height();
    float back_2 = lines[len >= 2 ? len - 2 : 0].height();
    float back_1 = lines[len - 1].height();

    for (std::size_t i = 0; i < len; ++i) {
        float need = lines[i].height();
        if (prevent_all && i == 0) {
            need = front_1 + leading + front_2 + leading + back_1;
        } else if (prevent_orphans && i == 0) {
            need = front_1 + leading + front_2;
        } else if (prevent_widows && i >= 2 && i + 2 == len) {
            need = back_2 + leading + back_1;
        }

        if (i > 0) layout_weak(leading, kLeadingWeakness);
        layout_line(std::move(lines[i]), need, align);
    }
}

void FlowLayouter::layout_line(Frame line, float need, Axes<FixedAlignment> align) {
    const Regions& regions = stack_.regions();
    if (!fits(available(), line.height()) && regions.may_progress()) {
        advance();
    } else if (!fits(available(), need) && next_region_fits(need) && regions.may_progress()) {
        advance();
    }
    place_frame(std::move(line), align);
}

// ---------------------------------------------------------------------------
// Blocks
// ---------------------------------------------------------------------------

void FlowLayouter::layout_multi(const Content& block, const style::StyleChain& styles) {
    float spacing = styles.get_or<Rel>(props::kParSpacing, Rel::ems(core::config::kDefaultParSpacingEm))
                        .resolve(font_size(styles), stack_.regions().base().height);
    layout_weak(spacing, kBlockSpacingWeakness);

    if (stack_.regions().is_full()) {
        advance();
    }

    // Lay out into what is left after the pending spacing.
    Regions regions = stack_.regions();
    regions.size.height = available();
    auto align = block_alignment(styles);
    Fragment fragment = ctx_.layout_block(block, styles, regions);
    std::size_t len = fragment.size();
    std::vector<Frame> frames = std::move(fragment).into_frames();
    for (std::size_t i = 0; i < len; ++i) {
        place_frame(std::move(frames[i]), align);
        if (i + 1 < len) {
            finish_region();
        }
    }

    layout_weak(spacing, kBlockSpacingWeakness);
    situation_ = ParSituation::Other;
}

void FlowLayouter::layout_single(const Content& block, const style::StyleChain& styles) {
    float spacing = styles.get_or<Rel>(props::kParSpacing, Rel::ems(core::config::kDefaultParSpacingEm))
                        .resolve(font_size(styles), stack_.regions().base().height);
    layout_weak(spacing, kBlockSpacingWeakness);

    Fragment fragment = ctx_.layout_block(block, styles, child_region());
    if (!fragment.empty()) {
        Frame frame = fragment[0];
        if (!fits(available(), frame.height()) && stack_.regions().may_progress()) {
            advance();
        }
        place_frame(std::move(frame), block_alignment(styles));
    }

    layout_weak(spacing, kBlockSpacingWeakness);
    situation_ = ParSituation::Other;
}

// ---------------------------------------------------------------------------
// Placed content
// ---------------------------------------------------------------------------

void FlowLayouter::layout_placed(const Content& placed, const style::StyleChain& styles) {
    Dir text_dir = styles.get_or<Dir>(props::kTextDir, Dir::LTR);
    FixedAlignment align_x = placed.place_align.fix_x(text_dir);

    Region region(stack_.regions().base(), Axes<bool>(false, false));
    Frame frame = layout_flow(ctx_, placed.children, styles, region, false, placed.span).frames().front();

    if (!placed.floating) {
        // Without a vertical alignment the content stays where it appears in
        // the flow.
        if (placed.place_align.y) {
            stack_.place_overlay(std::move(frame), Axes<FixedAlignment>(align_x, placed.place_align.fix_y()),
                                 Point());
        } else {
            stack_.place_overlay(std::move(frame), Axes<FixedAlignment>(align_x, FixedAlignment::Start),
                                 Point(0, current_y()));
        }
        return;
    }

    if (placed.place_align.y == VAlign::Horizon) {
        ctx_.fail(LayoutErrorKind::InvalidContent, "flow",
                  "vertical floating placement must be auto, top, or bottom", placed.span);
    }

    if (placed.wrap) {
        float max_width = stack_.regions().base().width * core::config::kMaxWrapWidthRatio;
        if (frame.width() <= max_width) {
            layout_wrap_float(placed, styles, std::move(frame));
            return;
        }
        std::ostringstream msg;
        msg << "wrap-float too wide (" << frame.width() << "pt > " << max_width
            << "pt limit); treating as regular float";
        ctx_.warn("flow", msg.str(), placed.span);
    }

    DeferredFloat entry;
    entry.align_x = align_x;
    entry.clearance = placed.clearance;
    if (placed.place_align.y) {
        entry.bottom = *placed.place_align.y == VAlign::Bottom;
    } else {
        // Automatic placement picks the closer edge.
        entry.bottom = current_y() > stack_.regions().full / 2;
    }
    entry.frame = std::move(frame);
    layout_float(std::move(entry), false);
}

void FlowLayouter::layout_float(DeferredFloat placed, bool force) {
    float need = placed.frame.height() + placed.clearance;
    if (!force && !fits(available(), need) && stack_.regions().may_progress()) {
        deferred_floats_.push_back(std::move(placed));
        return;
    }

    if (placed.bottom) {
        float offset = stack_.reserved_end();
        stack_.reserve_end(need);
        stack_.place_overlay(std::move(placed.frame),
                             Axes<FixedAlignment>(placed.align_x, FixedAlignment::End),
                             Point(0, -offset));
    } else {
        float offset = stack_.reserved_start();
        stack_.reserve_start(need);
        stack_.place_overlay(std::move(placed.frame),
                             Axes<FixedAlignment>(placed.align_x, FixedAlignment::Start),
                             Point(0, offset));
    }
}

void FlowLayouter::layout_wrap_float(const Content& placed, const style::StyleChain& styles,
                                     Frame frame) {
    Dir text_dir = styles.get_or<Dir>(props::kTextDir, Dir::LTR);
    FixedAlignment align_x = placed.place_align.fix_x(text_dir);
    float base_width = stack_.regions().base().width;
    float gap = base_width - frame.width() - std::max(placed.clearance, 0.0f);
    float min_gap = base_width * core::config::kMinWrapGapRatio;
    if (gap < min_gap) {
        std::ostringstream msg;
        msg << "wrap-float leaves too little room for text (" << gap << "pt gap < " << min_gap
            << "pt minimum)";
        ctx_.warn("flow", msg.str(), placed.span);
    }

    // Stack below floats already wrapping on the same side.
    float existing_bottom = 0;
    for (const auto& wf : wrap_floats_) {
        bool same_side = align_x == FixedAlignment::Center ||
                         (align_x == FixedAlignment::Start && wf.left_margin > 0) ||
                         (align_x == FixedAlignment::End && wf.right_margin > 0);
        if (same_side) existing_bottom = std::max(existing_bottom, wf.y + wf.height);
    }

    float full = stack_.regions().full;
    float height = frame.height();
    float y = std::max(current_y(), existing_bottom);
    if (placed.place_align.y == VAlign::Bottom) {
        y = full - height;
    }

    if (y + height > full && stack_.regions().may_progress()) {
        advance();
        layout_wrap_float(placed, styles, std::move(frame));
        return;
    }

    wrap_floats_.push_back(WrapFloat::from_placed(frame.size(), y, align_x, placed.clearance));
    stack_.place_overlay(std::move(frame), Axes<FixedAlignment>(align_x, FixedAlignment::Start),
                         Point(0, y));
}

// ---------------------------------------------------------------------------
// Regions
// ---------------------------------------------------------------------------

void FlowLayouter::place_frame(Frame frame, Axes<FixedAlignment> align) {
    if (pending_.weakness > 0) {
        stack_.layout_absolute(pending_.amount);
        pending_ = Pending{};
    }
    stack_.push_frame(std::move(frame), align);
}

void FlowLayouter::advance() {
    assert(stack_.regions().may_progress());
    finish_region();
}

void FlowLayouter::finish_region() {
    // Trailing weak spacing is dropped.
    pending_ = Pending{};
    stack_.finish_region();
    wrap_floats_.clear();

    // Floats that did not fit go to the top of the new region.
    std::vector<DeferredFloat> deferred = std::move(deferred_floats_);
    deferred_floats_.clear();
    for (auto& placed : deferred) {
        layout_float(std::move(placed), region_is_fresh());
    }
}

Fragment FlowLayouter::finish(bool exhaust_backlog) {
    if (!deferred_floats_.empty()) {
        if (stack_.regions().may_progress()) {
            finish_region();
        }
        std::vector<DeferredFloat> deferred = std::move(deferred_floats_);
        deferred_floats_.clear();
        for (auto& placed : deferred) {
            layout_float(std::move(placed), true);
        }
    }

    if (exhaust_backlog) {
        while (!stack_.regions().backlog.empty()) {
            finish_region();
        }
    }

    pending_ = Pending{};
    return stack_.finish();
}

Fragment layout_flow(const LayoutContext& ctx, const std::vector<Pair>& children,
                     const style::StyleChain& styles, const Regions& regions, bool exhaust_backlog,
                     Span span) {
    FlowLayouter layouter(ctx, span, styles, regions);
    layouter.layout(children);
    return layouter.finish(exhaust_backlog);
}

} // namespace folio::layout
