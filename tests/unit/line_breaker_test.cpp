#include <folio/layout/inline_layout.h>
#include <folio/layout/line_breaker.h>

#include <gtest/gtest.h>

#include <vector>

using namespace folio::layout;

namespace {

// Words of the given widths separated by spaces of width 1, at font size 10.
Preparation make_prep(const std::vector<float>& widths, bool justify = false) {
    Preparation p;
    p.config.font_size = 10;
    p.config.justify = justify;
    for (std::size_t i = 0; i < widths.size(); ++i) {
        InlineItem word;
        word.kind = InlineItemKind::Word;
        word.text = "w";
        word.width = widths[i];
        word.font_size = 10;
        p.items.push_back(word);
        if (i + 1 < widths.size()) {
            InlineItem space;
            space.kind = InlineItemKind::Space;
            space.text = " ";
            space.width = 1;
            space.font_size = 10;
            space.break_after = true;
            p.items.push_back(space);
        }
    }
    return p;
}

AvailableWidthFn constant(float width) {
    return [width](float) { return width; };
}

std::vector<std::size_t> ends_of(const std::vector<Line>& lines) {
    std::vector<std::size_t> ends;
    for (const auto& line : lines) ends.push_back(line.end);
    return ends;
}

} // namespace

// ---------------------------------------------------------------------------
// 1. Simple breaking fills lines greedily
// ---------------------------------------------------------------------------
TEST(LineBreakerTest, SimpleIsGreedy) {
    DefaultLineBreaker breaker;
    Preparation p = make_prep({10, 10, 10, 10, 10});
    auto lines = breaker.break_lines(p, Linebreaks::Simple, constant(35));

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].start, 0u);
    EXPECT_EQ(lines[0].end, 6u);
    EXPECT_FALSE(lines[0].mandatory);
    EXPECT_EQ(lines[1].end, 9u);
    EXPECT_TRUE(lines[1].mandatory);
    EXPECT_FLOAT_EQ(lines[1].y, 10);
    EXPECT_FLOAT_EQ(natural_width(p, lines[0].start, lines[0].end), 32);
}

// ---------------------------------------------------------------------------
// 2. Forced breaks end lines in both modes
// ---------------------------------------------------------------------------
TEST(LineBreakerTest, ForcedBreak) {
    Preparation p = make_prep({10, 10});
    InlineItem linebreak;
    linebreak.kind = InlineItemKind::Linebreak;
    linebreak.font_size = 10;
    p.items[1] = linebreak;

    DefaultLineBreaker breaker;
    for (Linebreaks mode : {Linebreaks::Simple, Linebreaks::Optimized}) {
        auto lines = breaker.break_lines(p, mode, constant(100));
        ASSERT_EQ(lines.size(), 2u);
        EXPECT_EQ(lines[0].end, 2u);
        EXPECT_TRUE(lines[0].mandatory);
        EXPECT_EQ(lines[1].end, 3u);
    }
}

// ---------------------------------------------------------------------------
// 3. A word wider than the line gets a line of its own
// ---------------------------------------------------------------------------
TEST(LineBreakerTest, OverfullWord) {
    DefaultLineBreaker breaker;
    Preparation p = make_prep({50, 5});
    auto lines = breaker.break_lines(p, Linebreaks::Simple, constant(20));

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].end, 2u);
    EXPECT_EQ(lines[1].end, 3u);
}

// ---------------------------------------------------------------------------
// 4. Optimized breaking avoids a runt last line
// ---------------------------------------------------------------------------
TEST(LineBreakerTest, OptimizedAvoidsRunt) {
    DefaultLineBreaker breaker;
    Preparation p = make_prep({10, 10, 10, 10});

    auto simple = breaker.break_lines(p, Linebreaks::Simple, constant(32));
    EXPECT_EQ(ends_of(simple), (std::vector<std::size_t>{6, 7}));

    auto optimized = breaker.break_lines(p, Linebreaks::Optimized, constant(32));
    EXPECT_EQ(ends_of(optimized), (std::vector<std::size_t>{4, 7}));
    EXPECT_FLOAT_EQ(optimized[1].y, 10);
}

// ---------------------------------------------------------------------------
// 5. Available width varies with the vertical position
// ---------------------------------------------------------------------------
TEST(LineBreakerTest, WidthDependsOnPosition) {
    DefaultLineBreaker breaker;
    Preparation p = make_prep({10, 10, 10, 10});
    AvailableWidthFn narrow_top = [](float y) { return y < 10 ? 20.0f : 100.0f; };
    auto lines = breaker.break_lines(p, Linebreaks::Simple, narrow_top);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].end, 2u);
    EXPECT_EQ(lines[1].end, 7u);
}

// ---------------------------------------------------------------------------
// 6. A line takes the narrower width of its top and bottom edge
// ---------------------------------------------------------------------------
TEST(LineBreakerTest, AvailableForLine) {
    AvailableWidthFn step = [](float y) { return y < 15 ? 100.0f : 40.0f; };
    EXPECT_FLOAT_EQ(available_for_line(step, 0, 10), 100);
    EXPECT_FLOAT_EQ(available_for_line(step, 10, 10), 40);
    EXPECT_FLOAT_EQ(available_for_line(step, 5, 10), 100);
}

// ---------------------------------------------------------------------------
// 7. Nothing to break
// ---------------------------------------------------------------------------
TEST(LineBreakerTest, EmptyPreparation) {
    DefaultLineBreaker breaker;
    Preparation p;
    EXPECT_TRUE(breaker.break_lines(p, Linebreaks::Optimized, constant(10)).empty());
}
