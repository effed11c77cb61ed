#pragma once
#include <folio/core/config.h>
#include <folio/layout/content.h>
#include <folio/layout/context.h>
#include <folio/layout/exclusions.h>
#include <folio/layout/frame.h>
#include <folio/layout/geometry.h>
#include <folio/layout/regions.h>
#include <folio/style/style_chain.h>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace folio::layout {

// Where a paragraph sits relative to its neighbours in the flow.
enum class ParSituation {
    First,        // the first paragraph of its flow
    Consecutive,  // directly preceded by another paragraph
    Other         // preceded by some other block
};

enum class Linebreaks { Simple, Optimized };

// Per-paragraph settings resolved from the style chain.
struct Config {
    bool justify = false;
    Linebreaks linebreaks = Linebreaks::Simple;
    float first_line_indent = 0;
    float hanging_indent = 0;
    std::optional<std::string> numbering_marker;
    FixedAlignment align = FixedAlignment::Start;
    float font_size = core::config::kDefaultFontSize;
    Dir dir = Dir::LTR;
    // Set only when uniform across all children.
    std::optional<bool> hyphenate;
    std::optional<std::string> lang;
    bool fallback = true;
    bool cjk_latin_spacing = true;
    style::Costs costs;
};

// Derive the configuration of a paragraph made of `children` with the
// paragraph-level styles `shared`. A paragraph without a situation is an
// inline run outside of a paragraph.
Config configuration(const style::StyleChain& shared, const std::vector<Pair>& children,
                     std::optional<ParSituation> situation);

// A piece of the merged paragraph text.
struct Segment {
    enum class Kind { Text, Spacing, Linebreak, Frame };

    Kind kind = Kind::Text;
    // Byte range in the collected text (Text only).
    std::size_t start = 0;
    std::size_t end = 0;
    float font_size = 0;
    // Resolved absolute spacing, or a fraction.
    float amount = 0;
    std::optional<Fr> fr;
    Frame frame;
    Span span = 0;
};

struct Collection {
    std::string text;
    std::vector<Segment> segments;
};

// Merge the children into one text buffer and a segment map. Whitespace
// collapses across children; indents become leading spacing segments.
Collection collect(const LayoutContext& ctx, const std::vector<Pair>& children,
                   const Config& config, float region_width);

enum class InlineItemKind { Word, Space, Absolute, Fractional, Linebreak, Frame };

// A measured, atomic unit for line breaking.
struct InlineItem {
    InlineItemKind kind = InlineItemKind::Word;
    std::string text;
    float width = 0;
    Fr fr;
    float font_size = 0;
    Frame frame;
    // Bidi embedding level, odd for right-to-left runs.
    std::uint8_t level = 0;
    // Whether a line may end after this item.
    bool break_after = false;
    Span span = 0;
};

struct Preparation {
    Config config;
    std::vector<InlineItem> items;
    float leading = 0;
    std::uint8_t base_level = 0;
};

// Measure the collected text and resolve its direction runs.
Preparation prepare(const LayoutContext& ctx, const Collection& collection, const Config& config,
                    const style::StyleChain& shared);

// A chosen line: the item range [start, end).
struct Line {
    std::size_t start = 0;
    std::size_t end = 0;
    // Ended by a forced break or the end of the paragraph.
    bool mandatory = false;
    // Vertical offset of the line top within the paragraph.
    float y = 0;
};

// End of the line's items with trailing spaces and breaks removed.
std::size_t trimmed_end(const Preparation& p, std::size_t start, std::size_t end);
// Natural width of a line without its trailing spaces.
float natural_width(const Preparation& p, std::size_t start, std::size_t end);
// Height of a line: its largest font size or inline frame.
float line_height(const Preparation& p, std::size_t start, std::size_t end);

// Turn the lines into frames. Lines are laid out in `width` and offset past
// any exclusion active at their vertical position.
std::vector<Frame> finalize(const Preparation& p, const std::vector<Line>& lines, const Region& region,
                            const ParExclusions* exclusions);

// The result of laying out a paragraph's lines.
struct LaidOutPar {
    std::vector<Frame> lines;
    // Item index ending each line, to compare break decisions.
    std::vector<std::size_t> breaks;
    float leading = 0;
    // Some line is wider than the width available to it.
    bool overfull = false;

    float total_height() const;
};

// Run collect, prepare, break and finalize for a list of inline children.
LaidOutPar layout_lines(const LayoutContext& ctx, const std::vector<Pair>& children,
                        const style::StyleChain& shared, const Region& region,
                        std::optional<ParSituation> situation, const ParExclusions* exclusions);

// Lay out a paragraph into one frame per line.
Fragment layout_par(const LayoutContext& ctx, const Content& par, const style::StyleChain& styles,
                    const Region& region, ParSituation situation,
                    const ParExclusions* exclusions = nullptr);

// Lay out inline content outside of a paragraph into a single frame.
Frame layout_inline(const LayoutContext& ctx, const std::vector<Pair>& children,
                    const style::StyleChain& styles, const Region& region);

} // namespace folio::layout
