#include <folio/layout/regions.h>

#include <gtest/gtest.h>

#include <cmath>

using namespace folio::layout;

// ---------------------------------------------------------------------------
// 1. repeat() yields the same size forever
// ---------------------------------------------------------------------------
TEST(RegionsTest, RepeatYieldsSameSize) {
    Regions regions = Regions::repeat(Size(100, 200), Axes<bool>(true, true));
    EXPECT_EQ(regions.size, Size(100, 200));
    EXPECT_FLOAT_EQ(regions.full, 200);
    EXPECT_TRUE(regions.may_break());

    auto sizes = regions.iter(4);
    ASSERT_EQ(sizes.size(), 4u);
    for (const auto& size : sizes) {
        EXPECT_EQ(size, Size(100, 200));
    }
}

// ---------------------------------------------------------------------------
// 2. may_progress() is false after the first next() of a repeat
// ---------------------------------------------------------------------------
TEST(RegionsTest, RepeatStopsProgressingAfterNext) {
    Regions regions = Regions::repeat(Size(100, 200), Axes<bool>(true, true));
    regions.size.height = 50;
    EXPECT_TRUE(regions.may_progress());
    regions.next();
    EXPECT_FLOAT_EQ(regions.size.height, 200);
    EXPECT_FALSE(regions.may_progress());
    EXPECT_TRUE(regions.may_break());
}

// ---------------------------------------------------------------------------
// 3. Backlog heights come before the repeated last height
// ---------------------------------------------------------------------------
TEST(RegionsTest, BacklogThenLast) {
    Regions regions;
    regions.size = Size(80, 10);
    regions.full = 10;
    regions.backlog = {20, 30};
    regions.last = 40;

    regions.next();
    EXPECT_FLOAT_EQ(regions.size.height, 20);
    EXPECT_FLOAT_EQ(regions.full, 20);
    regions.next();
    EXPECT_FLOAT_EQ(regions.size.height, 30);
    EXPECT_TRUE(regions.may_progress());
    regions.next();
    EXPECT_FLOAT_EQ(regions.size.height, 40);
    EXPECT_FALSE(regions.may_progress());
    regions.next();
    EXPECT_FLOAT_EQ(regions.size.height, 40);
    EXPECT_FLOAT_EQ(regions.size.width, 80);
}

// ---------------------------------------------------------------------------
// 4. A single region cannot break and next() changes nothing
// ---------------------------------------------------------------------------
TEST(RegionsTest, SingleRegionDoesNotBreak) {
    Regions regions = Region(Size(50, 60), Axes<bool>(false, true));
    EXPECT_FALSE(regions.may_break());
    EXPECT_FALSE(regions.may_progress());
    regions.size.height = 0;
    EXPECT_FALSE(regions.is_full());
    regions.next();
    EXPECT_FLOAT_EQ(regions.size.height, 0);
    EXPECT_EQ(regions.iter(3).size(), 1u);
}

// ---------------------------------------------------------------------------
// 5. is_full() needs an exhausted region and a way forward
// ---------------------------------------------------------------------------
TEST(RegionsTest, IsFull) {
    Regions regions = Regions::repeat(Size(100, 200), Axes<bool>(true, true));
    EXPECT_FALSE(regions.is_full());
    regions.size.height = 0;
    EXPECT_TRUE(regions.is_full());
}

// ---------------------------------------------------------------------------
// 6. base() and map()
// ---------------------------------------------------------------------------
TEST(RegionsTest, BaseAndMap) {
    Regions regions;
    regions.size = Size(100, 30);
    regions.full = 90;
    regions.backlog = {70};
    regions.last = 50;
    EXPECT_EQ(regions.base(), Size(100, 90));

    Regions shrunk = regions.map([](Size s) { return s - Size(10, 20); });
    EXPECT_EQ(shrunk.size, Size(90, 10));
    EXPECT_FLOAT_EQ(shrunk.full, 70);
    ASSERT_EQ(shrunk.backlog.size(), 1u);
    EXPECT_FLOAT_EQ(shrunk.backlog[0], 50);
    EXPECT_FLOAT_EQ(*shrunk.last, 30);
}

// ---------------------------------------------------------------------------
// 7. Infinite regions
// ---------------------------------------------------------------------------
TEST(RegionsTest, InfiniteHeight) {
    Regions regions = Regions::repeat(Size(100, kInfinity), Axes<bool>(true, false));
    EXPECT_TRUE(std::isinf(regions.base().height));
    EXPECT_FALSE(regions.is_full());
    EXPECT_EQ(describe_regions(regions), "Regions [100xinf, ..]");
}
