#include <folio/layout/block_layout.h>
#include <folio/layout/layout_engine.h>
#include <folio/style/properties.h>

#include <gtest/gtest.h>

#include <vector>

using namespace folio::layout;
namespace style = folio::style;
namespace props = folio::style::props;

namespace {

style::StyleChain make_styles() {
    return style::StyleChain()
        .chain(style::set_rule(props::kTextSize, 10.0f))
        .chain(style::set_rule(props::kParLeading, Rel::pt(0)));
}

std::shared_ptr<Content> make_sized(float width, float height, bool breakable = false) {
    auto block = make_block({});
    block->width = Rel::pt(width);
    block->height = Rel::pt(height);
    block->breakable = breakable;
    return block;
}

const Axes<bool> kExpand(true, true);
const Axes<bool> kShrink(false, false);

} // namespace

// ---------------------------------------------------------------------------
// 1. Distributing a fixed height over regions
// ---------------------------------------------------------------------------
TEST(BlockLayoutTest, DistributeHeight) {
    Regions repeated = Regions::repeat(Size(100, 50), kExpand);
    EXPECT_EQ(distribute_height(120, repeated), (std::vector<float>{50, 50, 20}));
    EXPECT_EQ(distribute_height(30, repeated), (std::vector<float>{30}));

    // Without further regions the excess stays in the only one.
    EXPECT_EQ(distribute_height(70, Region(Size(100, 30), kExpand)), (std::vector<float>{70}));
}

// ---------------------------------------------------------------------------
// 2. Unbreakable blocks with explicit size and inset
// ---------------------------------------------------------------------------
TEST(BlockLayoutTest, SingleBlockWithInset) {
    LayoutEngine engine;
    auto styles = make_styles();
    auto block = make_sized(50, 40);
    block->inset = EdgeSizes{5, 5, 5, 5};
    block->children = {styled(make_sized(10, 10), styles)};

    Fragment fragment = engine.context().layout_block(*block, styles, Region(Size(100, 100), kShrink));
    ASSERT_EQ(fragment.size(), 1u);
    const Frame& frame = fragment[0];
    EXPECT_EQ(frame.size(), Size(50, 40));
    ASSERT_EQ(frame.items().size(), 1u);
    EXPECT_EQ(frame.items()[0].pos, Point(5, 5));
}

// ---------------------------------------------------------------------------
// 3. Blocks without explicit size shrink to their content
// ---------------------------------------------------------------------------
TEST(BlockLayoutTest, AutoSizedBlockShrinks) {
    LayoutEngine engine;
    auto styles = make_styles();
    auto block = make_block({styled(make_sized(30, 10), styles)});
    block->breakable = false;

    Frame frame = layout_single_block(engine.context(), *block, styles, Region(Size(100, 100), kShrink));
    EXPECT_EQ(frame.size(), Size(30, 10));

    auto relative = make_block({});
    relative->width = Rel::percent(50);
    relative->height = Rel::ems(2);
    Frame sized = layout_single_block(engine.context(), *relative, styles, Region(Size(200, 100), kShrink));
    EXPECT_EQ(sized.size(), Size(100, 20));
}

// ---------------------------------------------------------------------------
// 4. A fixed height spans every region it is distributed over
// ---------------------------------------------------------------------------
TEST(BlockLayoutTest, BreakableFixedHeight) {
    LayoutEngine engine;
    Regions regions = Regions::repeat(Size(100, 50), kExpand);
    regions.size.height = 30;

    auto block = make_block({});
    block->width = Rel::percent(100);
    block->height = Rel::pt(70);

    Fragment fragment = layout_multi_block(engine.context(), *block, make_styles(), regions);
    ASSERT_EQ(fragment.size(), 2u);
    EXPECT_EQ(fragment[0].size(), Size(100, 30));
    EXPECT_EQ(fragment[1].size(), Size(100, 40));
}

// ---------------------------------------------------------------------------
// 5. Frames of a breakable block share the widest width
// ---------------------------------------------------------------------------
TEST(BlockLayoutTest, UnevenFramesAreRelaidOut) {
    LayoutEngine engine;
    auto styles = make_styles();
    auto block = make_block({styled(make_sized(30, 20), styles), styled(make_sized(60, 20), styles)});

    Fragment fragment = engine.context().layout_block(*block, styles,
                                                      Regions::repeat(Size(100, 25), kShrink));
    ASSERT_EQ(fragment.size(), 2u);
    EXPECT_EQ(fragment[0].size(), Size(60, 20));
    EXPECT_EQ(fragment[1].size(), Size(60, 20));
}

// ---------------------------------------------------------------------------
// 6. Page counters are placeholders sized by their pattern
// ---------------------------------------------------------------------------
TEST(BlockLayoutTest, PageCounterPlaceholder) {
    LayoutEngine engine;
    Frame frame = layout_page_counter(engine.context(), *make_page_counter("1"), make_styles());
    EXPECT_EQ(frame.size(), Size(6, 10));
    EXPECT_FALSE(frame.is_hard());
    EXPECT_EQ(frame.count_page_numbers(), 1u);
    EXPECT_EQ(frame.items()[0].text, "1");
}

// ---------------------------------------------------------------------------
// 7. Stacks and other content dispatch to their layouts
// ---------------------------------------------------------------------------
TEST(BlockLayoutTest, DispatchByKind) {
    LayoutEngine engine;
    auto styles = make_styles();

    auto stack = make_stack(Dir::TTB, {styled(make_sized(30, 10), styles), styled(make_sized(20, 10), styles)},
                            Spacing::absolute(5));
    Fragment stacked = engine.context().layout_block(*stack, styles, Region(Size(100, 100), kShrink));
    ASSERT_EQ(stacked.size(), 1u);
    EXPECT_EQ(stacked[0].size(), Size(30, 25));
    EXPECT_FLOAT_EQ(stacked[0].items()[1].pos.y, 15);

    auto par = make_par({styled(make_text("abcd"), styles)});
    Fragment flowed = engine.context().layout_block(*par, styles, Region(Size(100, 100), kShrink));
    ASSERT_EQ(flowed.size(), 1u);
    ASSERT_EQ(flowed[0].items().size(), 1u);
    EXPECT_FLOAT_EQ(flowed[0].height(), 10);
}
