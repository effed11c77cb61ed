#include <folio/layout/layout_engine.h>
#include <folio/layout/page_layout.h>
#include <folio/style/properties.h>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace folio::layout;
namespace style = folio::style;
namespace props = folio::style::props;

namespace {

// A 200x300 page with 20pt margins, text at 10pt without leading.
style::StyleChain make_page_styles(std::vector<style::StylePtr> extra = {}) {
    style::StyleChain chain = style::StyleChain()
                                  .chain(style::set_rule(props::kTextSize, 10.0f))
                                  .chain(style::set_rule(props::kParLeading, Rel::pt(0)))
                                  .chain(style::set_rule(props::kPageWidth, 200.0f))
                                  .chain(style::set_rule(props::kPageHeight, 300.0f))
                                  .chain(style::set_rule(props::kPageMarginLeft, Rel::pt(20)))
                                  .chain(style::set_rule(props::kPageMarginTop, Rel::pt(20)))
                                  .chain(style::set_rule(props::kPageMarginRight, Rel::pt(20)))
                                  .chain(style::set_rule(props::kPageMarginBottom, Rel::pt(20)));
    return chain.chain(extra);
}

// `count` words of four letters; five of them fill a 160pt line.
Pair make_paragraph(int count, const style::StyleChain& styles) {
    std::string text;
    for (int i = 0; i < count; ++i) {
        if (i > 0) text += ' ';
        text += "abcd";
    }
    return styled(make_par({styled(make_text(text), styles)}), styles);
}

Pair make_box(float width, float height, const style::StyleChain& styles) {
    auto block = make_block({});
    block->width = Rel::pt(width);
    block->height = Rel::pt(height);
    block->breakable = false;
    return styled(block, styles);
}

style::ContentRef make_marginal_box(float width, float height) {
    auto block = make_block({});
    block->width = Rel::pt(width);
    block->height = Rel::pt(height);
    block->breakable = false;
    return block;
}

std::vector<LayoutedPage> run(LayoutEngine& engine, const std::vector<Pair>& children,
                              const style::StyleChain& initial) {
    return layout_page_run(engine.context(), children, initial);
}

} // namespace

// ---------------------------------------------------------------------------
// 1. Page styles keep what can be lifted to the page level
// ---------------------------------------------------------------------------
TEST(PageLayoutTest, DeterminePageStyles) {
    auto width = style::set_rule(props::kPageWidth, 200.0f);
    auto size = style::constructor_style(props::kTextSize, 12.0f);
    style::StyleChain initial = style::StyleChain().chain(width).chain(size);

    auto height = style::set_rule(props::kPageHeight, 100.0f);
    auto local = style::constructor_style(props::kTextSize, 14.0f);
    auto shown = style::show_rule_style(props::kPageFill, std::string("red"));
    style::StyleChain inner = initial.chain(height).chain(local).chain(shown);

    style::Styles kept = determine_page_styles({styled(make_text("a"), inner)}, initial);
    EXPECT_EQ(kept, (style::Styles{width, size, height}));

    // Tags do not contribute their styles.
    style::Styles tags_only = determine_page_styles({styled(make_tag(), inner)}, initial);
    EXPECT_EQ(tags_only, (style::Styles{width, size}));
}

// ---------------------------------------------------------------------------
// 2. The body breaks into as many pages as it needs
// ---------------------------------------------------------------------------
TEST(PageLayoutTest, BodyBreaksIntoPages) {
    LayoutEngine engine;
    auto styles = make_page_styles();
    auto pages = run(engine, {make_paragraph(150, styles)}, styles);

    ASSERT_EQ(pages.size(), 2u);
    for (const auto& page : pages) {
        EXPECT_EQ(page.inner.size(), Size(160, 260));
        EXPECT_EQ(page.full_size(), Size(200, 300));
        EXPECT_FALSE(page.header.has_value());
        EXPECT_FALSE(page.footer.has_value());
    }
    EXPECT_EQ(pages[0].inner.items().size(), 26u);
    EXPECT_EQ(pages[1].inner.items().size(), 4u);
}

// ---------------------------------------------------------------------------
// 3. Default, relative and flipped page geometry
// ---------------------------------------------------------------------------
TEST(PageLayoutTest, PageGeometry) {
    LayoutEngine engine;
    auto sized = style::StyleChain()
                     .chain(style::set_rule(props::kPageWidth, 210.0f))
                     .chain(style::set_rule(props::kPageHeight, 297.0f));

    auto pages = run(engine, {}, sized);
    ASSERT_EQ(pages.size(), 1u);
    EXPECT_NEAR(pages[0].margin.left, 25, 1e-3);
    EXPECT_NEAR(pages[0].margin.bottom, 25, 1e-3);
    EXPECT_NEAR(pages[0].full_size().height, 297, 1e-3);

    auto flipped = run(engine, {}, sized.chain(style::set_rule(props::kPageFlipped, true)));
    EXPECT_NEAR(flipped[0].full_size().width, 297, 1e-3);
    EXPECT_NEAR(flipped[0].full_size().height, 210, 1e-3);
    EXPECT_NEAR(flipped[0].margin.top, 25, 1e-3);

    auto relative = run(engine, {}, sized.chain(style::set_rule(props::kPageMarginLeft, Rel::percent(10))));
    EXPECT_NEAR(relative[0].margin.left, 21, 1e-3);

    auto defaults = run(engine, {}, style::StyleChain());
    EXPECT_NEAR(defaults[0].full_size().width, folio::core::config::kPaperWidth, 1e-2);
    EXPECT_NEAR(defaults[0].full_size().height, folio::core::config::kPaperHeight, 1e-2);
}

// ---------------------------------------------------------------------------
// 4. Pages with an infinite height fit their content
// ---------------------------------------------------------------------------
TEST(PageLayoutTest, AutoHeightFitsContent) {
    LayoutEngine engine;
    auto styles = make_page_styles({style::set_rule(props::kPageHeight, kInfinity)});
    auto pages = run(engine, {make_box(50, 50, styles)}, styles);

    ASSERT_EQ(pages.size(), 1u);
    EXPECT_EQ(pages[0].inner.size(), Size(160, 50));
    EXPECT_EQ(pages[0].full_size(), Size(200, 90));
}

// ---------------------------------------------------------------------------
// 5. Page numbers go into the footer or the header
// ---------------------------------------------------------------------------
TEST(PageLayoutTest, NumberingMarginals) {
    LayoutEngine engine;
    auto numbered = make_page_styles({style::set_rule(props::kPageNumbering, std::string("1"))});
    auto pages = run(engine, {}, numbered);

    ASSERT_EQ(pages.size(), 1u);
    EXPECT_FALSE(pages[0].header.has_value());
    ASSERT_TRUE(pages[0].footer.has_value());
    const Frame& footer = *pages[0].footer;
    EXPECT_FLOAT_EQ(footer.width(), 160);
    EXPECT_NEAR(footer.height(), 14, 1e-4);
    EXPECT_EQ(footer.count_page_numbers(), 1u);
    EXPECT_FLOAT_EQ(footer.items()[0].pos.x, 77);
    ASSERT_TRUE(pages[0].numbering.has_value());
    EXPECT_EQ(*pages[0].numbering, "1");

    auto top = numbered.chain(
        style::set_rule(props::kPageNumberAlign, Alignment(HAlign::Right, VAlign::Top)));
    auto top_pages = run(engine, {}, top);
    ASSERT_TRUE(top_pages[0].header.has_value());
    EXPECT_FALSE(top_pages[0].footer.has_value());
    EXPECT_EQ(top_pages[0].header->count_page_numbers(), 1u);
    // Bottom-aligned in the header area.
    EXPECT_FLOAT_EQ(top_pages[0].header->items()[0].pos.x, 154);
    EXPECT_NEAR(top_pages[0].header->items()[0].pos.y, 4, 1e-4);
}

// ---------------------------------------------------------------------------
// 6. Explicit marginals replace the page number
// ---------------------------------------------------------------------------
TEST(PageLayoutTest, ExplicitMarginals) {
    LayoutEngine engine;
    auto styles = make_page_styles(
        {style::set_rule(props::kPageNumbering, std::string("1")),
         style::set_rule(props::kPageFooter, std::monostate()),
         style::set_rule(props::kPageHeader, make_marginal_box(40, 10)),
         style::set_rule(props::kPageBackground, make_marginal_box(10, 10))});
    auto pages = run(engine, {}, styles);

    ASSERT_EQ(pages.size(), 1u);
    EXPECT_FALSE(pages[0].footer.has_value());
    ASSERT_TRUE(pages[0].header.has_value());
    EXPECT_EQ(pages[0].header->count_page_numbers(), 0u);
    ASSERT_TRUE(pages[0].background.has_value());
    EXPECT_EQ(pages[0].background->size(), Size(200, 300));
    EXPECT_FALSE(pages[0].foreground.has_value());
}

// ---------------------------------------------------------------------------
// 7. Marginals that do not fit are an error
// ---------------------------------------------------------------------------
TEST(PageLayoutTest, MarginalOverflow) {
    LayoutEngine engine;
    auto styles = make_page_styles({style::set_rule(props::kPageHeader, make_marginal_box(10, 30))});
    try {
        run(engine, {}, styles);
        FAIL() << "expected a layout error";
    } catch (const LayoutError& e) {
        EXPECT_EQ(e.kind(), LayoutErrorKind::MarginalOverflow);
        EXPECT_NE(std::string(e.what()).find("header does not fit"), std::string::npos);
    }
}

// ---------------------------------------------------------------------------
// 8. Two-sided margins swap with the binding
// ---------------------------------------------------------------------------
TEST(PageLayoutTest, TwoSidedMargins) {
    LayoutedPage page;
    page.margin = EdgeSizes{0, 30, 0, 10};
    EXPECT_FLOAT_EQ(page.margin_on(2).left, 10);

    page.two_sided = true;
    EXPECT_FLOAT_EQ(page.margin_on(1).left, 10);
    EXPECT_FLOAT_EQ(page.margin_on(2).left, 30);

    page.binding = Binding::Right;
    EXPECT_FLOAT_EQ(page.margin_on(1).left, 30);
    EXPECT_FLOAT_EQ(page.margin_on(2).left, 10);
}

// ---------------------------------------------------------------------------
// 9. Binding follows the text direction unless set
// ---------------------------------------------------------------------------
TEST(PageLayoutTest, Binding) {
    LayoutEngine engine;
    auto rtl = make_page_styles({style::set_rule(props::kTextDir, Dir::RTL)});
    EXPECT_EQ(run(engine, {}, rtl)[0].binding, Binding::Right);

    auto left = rtl.chain(style::set_rule(props::kPageBinding, std::string("left")));
    EXPECT_EQ(run(engine, {}, left)[0].binding, Binding::Left);

    auto unknown = make_page_styles({style::set_rule(props::kPageBinding, std::string("inside"))});
    EXPECT_EQ(run(engine, {}, unknown)[0].binding, Binding::Left);
    EXPECT_EQ(engine.diagnostics().events_by_severity(folio::core::Severity::Warning).size(), 1u);
}

// ---------------------------------------------------------------------------
// 10. Pagebreaks split the stream into pages
// ---------------------------------------------------------------------------
TEST(PageLayoutTest, PagebreaksSplitStream) {
    LayoutEngine engine;
    auto styles = make_page_styles();
    auto pages_of = [&](const std::vector<Pair>& stream) {
        return layout_pages(engine.context(), stream, styles);
    };

    EXPECT_EQ(pages_of({}).size(), 1u);
    EXPECT_EQ(pages_of({make_paragraph(1, styles), styled(make_pagebreak(), styles),
                        make_paragraph(1, styles)})
                  .size(),
              2u);
    // Weak breaks do not create empty pages.
    EXPECT_EQ(pages_of({styled(make_pagebreak(true), styles), make_paragraph(1, styles),
                        styled(make_pagebreak(true), styles)})
                  .size(),
              1u);
    // A strong break at the end leaves an empty page.
    EXPECT_EQ(pages_of({make_paragraph(1, styles), styled(make_pagebreak(), styles)}).size(), 2u);
    // Trailing tags end up on that empty page instead of a page of their own.
    EXPECT_EQ(pages_of({make_paragraph(1, styles), styled(make_pagebreak(), styles),
                        styled(make_tag(), styles)})
                  .size(),
              2u);
}

// ---------------------------------------------------------------------------
// 11. Parity breaks insert blank pages
// ---------------------------------------------------------------------------
TEST(PageLayoutTest, ParityBlankPages) {
    LayoutEngine engine;
    auto styles = make_page_styles();
    auto to_odd = make_pagebreak();
    to_odd->to = Parity::Odd;

    auto pages = layout_pages(engine.context(),
                              {make_paragraph(1, styles), styled(to_odd, styles), make_paragraph(1, styles)},
                              styles);
    ASSERT_EQ(pages.size(), 3u);
    EXPECT_TRUE(pages[1].inner.is_empty());
    EXPECT_FALSE(pages[2].inner.is_empty());

    auto to_even = make_pagebreak();
    to_even->to = Parity::Even;
    auto even = layout_pages(engine.context(),
                             {make_paragraph(1, styles), styled(to_even, styles), make_paragraph(1, styles)},
                             styles);
    EXPECT_EQ(even.size(), 2u);
}

// ---------------------------------------------------------------------------
// 12. Each run takes its page styles from its own children
// ---------------------------------------------------------------------------
TEST(PageLayoutTest, RunsUseTheirOwnStyles) {
    LayoutEngine engine;
    auto styles = make_page_styles();
    auto wide = styles.chain(style::set_rule(props::kPageWidth, 300.0f));
    auto boundary = make_pagebreak(true);
    boundary->boundary = true;

    auto pages = layout_pages(engine.context(),
                              {make_paragraph(1, styles), styled(make_pagebreak(true), wide),
                               make_paragraph(1, wide), styled(boundary, wide)},
                              styles);
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_FLOAT_EQ(pages[0].full_size().width, 200);
    EXPECT_FLOAT_EQ(pages[1].full_size().width, 300);
}
