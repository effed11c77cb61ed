#include <folio/layout/page_layout.h>
#include <folio/core/config.h>
#include <folio/layout/flow_layouter.h>
#include <folio/style/properties.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <sstream>
#include <utility>

namespace folio::layout {

namespace {

float font_size_of(const style::StyleChain& styles) {
    return styles.get_or<float>(style::props::kTextSize, core::config::kDefaultFontSize);
}

// Header, footer, background or foreground content.
struct Marginal {
    ContentPtr content;
    // Horizontal alignment overriding the one in the styles.
    std::optional<HAlign> align_x;
};

// An explicit marginal from the styles: unset means the slot is free for the
// page number, an explicit `none` keeps it empty.
std::optional<Marginal> explicit_marginal(const style::StyleChain& styles, const char* property) {
    if (styles.is_none(property)) return Marginal{};
    if (auto content = styles.get<style::ContentRef>(property)) return Marginal{*content, {}};
    return std::nullopt;
}

bool parity_matches(Parity parity, std::size_t number) {
    return parity == Parity::Even ? number % 2 == 0 : number % 2 == 1;
}

// Lay out a marginal into a fixed area. The content is measured at its
// natural height first so that overflowing content is reported instead of
// being clipped.
std::optional<Frame> layout_marginal(const LayoutContext& ctx, const style::StyleChain& styles,
                                     const Marginal& marginal, Size area, Alignment align,
                                     const char* name) {
    if (!marginal.content) return std::nullopt;

    Alignment current = styles.get_or<Alignment>(style::props::kAlignment, Alignment());
    Alignment combined(marginal.align_x ? marginal.align_x : (align.x ? align.x : current.x),
                       align.y);
    style::StyleChain aligned = styles.chain(style::set_rule(style::props::kAlignment, combined));

    std::vector<Pair> children{Pair{marginal.content, aligned}};
    Region region(Size(area.width, kInfinity), Axes<bool>(std::isfinite(area.width), false));
    Frame frame =
        layout_flow(ctx, children, aligned, region, false, marginal.content->span).into_frame();

    if (!fits(area.height, frame.height()) ||
        (std::isfinite(area.width) && !fits(area.width, frame.width()))) {
        std::ostringstream message;
        message << name << " does not fit into its area (needs " << frame.width() << "x"
                << frame.height() << "pt, has " << area.width << "x" << area.height << "pt)";
        ctx.fail(LayoutErrorKind::MarginalOverflow, "page", message.str(), marginal.content->span);
    }

    Dir text_dir = styles.get_or<Dir>(style::props::kTextDir, Dir::LTR);
    Size target(std::isfinite(area.width) ? area.width : frame.width(), area.height);
    frame.resize(target, combined.resolve(text_dir));
    return frame;
}

struct PageItem {
    enum class Kind { Run, Parity };

    Kind kind = Kind::Run;
    std::vector<Pair> children;
    style::StyleChain initial;
    Parity parity = Parity::Odd;
};

// Slice the stream into page runs and parity instructions.
std::vector<PageItem> collect_page_items(const std::vector<Pair>& stream,
                                         style::StyleChain initial) {
    std::vector<PageItem> items;
    // An empty page is added at the end while this is set.
    bool staged_empty_page = true;

    auto is_pagebreak = [](const Pair& pair) { return pair.content->is(ContentKind::Pagebreak); };

    std::size_t i = 0;
    while (i < stream.size()) {
        const Pair& pair = stream[i];
        if (is_pagebreak(pair)) {
            const Content& pagebreak = *pair.content;
            bool strong = !pagebreak.weak;
            if (strong && staged_empty_page) {
                items.push_back(PageItem{PageItem::Kind::Run, {}, initial});
            }
            if (pagebreak.to) {
                items.push_back(PageItem{PageItem::Kind::Parity, {}, pair.styles, *pagebreak.to});
            }
            // A boundary pagebreak closes the scope of a page set rule; its
            // styles are the ones from before the rule.
            if (!pagebreak.boundary) {
                initial = pair.styles;
            }
            staged_empty_page = staged_empty_page || strong;
            ++i;
            continue;
        }

        auto begin = stream.begin() + static_cast<std::ptrdiff_t>(i);
        auto end = std::find_if(begin, stream.end(), is_pagebreak);
        i = static_cast<std::size_t>(end - stream.begin());

        // Tags alone do not make a page, unless they replace a staged empty
        // page at the very end.
        bool only_tags = std::all_of(begin, end, [](const Pair& p) {
            return p.content->is(ContentKind::Tag);
        });
        bool only_boundaries_left = std::all_of(end, stream.end(), [&](const Pair& p) {
            return is_pagebreak(p) && p.content->boundary;
        });
        if (only_tags && !(staged_empty_page && only_boundaries_left)) {
            continue;
        }

        items.push_back(PageItem{PageItem::Kind::Run, std::vector<Pair>(begin, end), initial});
        staged_empty_page = false;
    }

    if (staged_empty_page) {
        items.push_back(PageItem{PageItem::Kind::Run, {}, initial});
    }
    return items;
}

} // namespace

EdgeSizes LayoutedPage::margin_on(std::size_t physical_number) const {
    EdgeSizes resolved = margin;
    bool swap = binding == Binding::Left ? physical_number % 2 == 0 : physical_number % 2 == 1;
    if (two_sided && swap) {
        std::swap(resolved.left, resolved.right);
    }
    return resolved;
}

style::Styles determine_page_styles(const std::vector<Pair>& children,
                                    const style::StyleChain& initial) {
    std::vector<style::StyleChain> chains;
    for (const auto& child : children) {
        if (!child.content->is(ContentKind::Tag)) {
            chains.push_back(child.styles);
        }
    }
    style::StyleChain base = style::StyleChain::trunk(chains).value_or(initial);

    // Styles already active at the pagebreak.
    std::size_t trunk_len = style::StyleChain::common_prefix(initial, base);

    style::Styles kept;
    const style::Styles& entries = base.entries();
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const style::Style& entry = *entries[i];
        if (entry.outside && (i < trunk_len || entry.liftable)) {
            kept.push_back(entries[i]);
        }
    }
    return kept;
}

std::vector<LayoutedPage> layout_page_run(const LayoutContext& ctx,
                                          const std::vector<Pair>& children,
                                          const style::StyleChain& initial) {
    namespace props = style::props;
    style::StyleChain styles(determine_page_styles(children, initial));
    float fs = font_size_of(styles);

    // An infinite length makes the page fit its content along that axis.
    float width = styles.get_or<float>(props::kPageWidth, core::config::kPaperWidth);
    float height = styles.get_or<float>(props::kPageHeight, core::config::kPaperHeight);
    Size size(width, height);
    if (styles.get_or<bool>(props::kPageFlipped, false)) {
        std::swap(size.width, size.height);
    }

    float min = std::min(width, height);
    if (!std::isfinite(min)) {
        min = core::config::kPaperWidth;
    }

    Rel fallback = Rel::pt(core::config::kDefaultMarginRatio * min);
    EdgeSizes margin;
    margin.left = styles.get_or<Rel>(props::kPageMarginLeft, fallback).resolve(fs, size.width);
    margin.right = styles.get_or<Rel>(props::kPageMarginRight, fallback).resolve(fs, size.width);
    margin.top = styles.get_or<Rel>(props::kPageMarginTop, fallback).resolve(fs, size.height);
    margin.bottom = styles.get_or<Rel>(props::kPageMarginBottom, fallback).resolve(fs, size.height);
    bool two_sided = styles.get_or<bool>(props::kPageTwoSided, false);

    Size area = size - margin.sum_by_axis();
    Regions regions = Regions::repeat(area, area.finite_axes());

    float header_ascent =
        styles.get_or<Rel>(props::kPageHeaderAscent, Rel{0, 0, core::config::kDefaultHeaderAscent})
            .resolve(fs, margin.top);
    float footer_descent =
        styles.get_or<Rel>(props::kPageFooterDescent, Rel{0, 0, core::config::kDefaultFooterDescent})
            .resolve(fs, margin.bottom);

    std::optional<std::string> fill = styles.get<std::string>(props::kPageFill);
    std::optional<std::string> numbering = styles.get<std::string>(props::kPageNumbering);
    Alignment number_align = styles.get_or<Alignment>(
        props::kPageNumberAlign, Alignment(HAlign::Center, VAlign::Bottom));

    Binding binding = styles.get_or<Dir>(props::kTextDir, Dir::LTR) == Dir::LTR ? Binding::Left
                                                                                : Binding::Right;
    if (auto explicit_binding = styles.get<std::string>(props::kPageBinding)) {
        if (*explicit_binding == "left") {
            binding = Binding::Left;
        } else if (*explicit_binding == "right") {
            binding = Binding::Right;
        } else {
            ctx.warn("page", "unknown page binding \"" + *explicit_binding + "\", using default");
        }
    }

    // The vertical number alignment selects header or footer; only the
    // horizontal part aligns the number itself.
    Marginal numbering_marginal;
    if (numbering) {
        numbering_marginal = Marginal{make_page_counter(*numbering), number_align.x};
    }
    bool number_on_top = number_align.y == VAlign::Top;
    Marginal header = explicit_marginal(styles, props::kPageHeader)
                          .value_or(number_on_top ? numbering_marginal : Marginal{});
    Marginal footer = explicit_marginal(styles, props::kPageFooter)
                          .value_or(number_on_top ? Marginal{} : numbering_marginal);
    Marginal background = explicit_marginal(styles, props::kPageBackground).value_or(Marginal{});
    Marginal foreground = explicit_marginal(styles, props::kPageForeground).value_or(Marginal{});

    Fragment fragment = layout_flow(ctx, children, styles, regions);

    Alignment mid(HAlign::Center, VAlign::Horizon);
    std::vector<LayoutedPage> layouted;
    layouted.reserve(fragment.size());
    for (Frame& inner : std::move(fragment).into_frames()) {
        Size header_size(inner.width(), margin.top - header_ascent);
        Size footer_size(inner.width(), margin.bottom - footer_descent);
        Size full_size = inner.size() + margin.sum_by_axis();

        LayoutedPage page;
        page.header = layout_marginal(ctx, styles, header, header_size,
                                      Alignment(std::nullopt, VAlign::Bottom), "header");
        page.footer = layout_marginal(ctx, styles, footer, footer_size,
                                      Alignment(std::nullopt, VAlign::Top), "footer");
        page.background = layout_marginal(ctx, styles, background, full_size, mid, "background");
        page.foreground = layout_marginal(ctx, styles, foreground, full_size, mid, "foreground");
        page.inner = std::move(inner);
        page.margin = margin;
        page.binding = binding;
        page.two_sided = two_sided;
        page.fill = fill;
        page.numbering = numbering;
        layouted.push_back(std::move(page));
    }
    return layouted;
}

std::vector<LayoutedPage> layout_pages(const LayoutContext& ctx, const std::vector<Pair>& stream,
                                       const style::StyleChain& styles) {
    std::vector<LayoutedPage> pages;
    for (const auto& item : collect_page_items(stream, styles)) {
        if (item.kind == PageItem::Kind::Run) {
            auto run = layout_page_run(ctx, item.children, item.initial);
            std::move(run.begin(), run.end(), std::back_inserter(pages));
            continue;
        }
        // A blank page brings the next page number to the requested parity.
        if (parity_matches(item.parity, pages.size())) {
            auto blank = layout_page_run(ctx, {}, item.initial);
            pages.push_back(std::move(blank.front()));
        }
    }
    return pages;
}

} // namespace folio::layout
