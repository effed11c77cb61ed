#include <folio/layout/inline_layout.h>
#include <folio/layout/line_breaker.h>
#include <folio/style/properties.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace folio::layout {

namespace props = style::props;

namespace {

// ---------------------------------------------------------------------------
// Character classes
// ---------------------------------------------------------------------------

char32_t decode_utf8(const std::string& text, std::size_t& pos) {
    auto byte = [&](std::size_t i) { return static_cast<unsigned char>(text[i]); };
    unsigned char lead = byte(pos);
    std::size_t len = 1;
    char32_t cp = lead;
    if (lead >= 0xF0 && lead < 0xF8) {
        len = 4;
        cp = lead & 0x07;
    } else if (lead >= 0xE0) {
        len = 3;
        cp = lead & 0x0F;
    } else if (lead >= 0xC0) {
        len = 2;
        cp = lead & 0x1F;
    }
    if (pos + len > text.size()) {
        // Truncated sequence: consume one byte as is.
        ++pos;
        return lead;
    }
    for (std::size_t i = 1; i < len; ++i) {
        cp = (cp << 6) | (byte(pos + i) & 0x3F);
    }
    pos += len;
    return cp;
}

bool is_cjk(char32_t cp) {
    return (cp >= 0x2E80 && cp <= 0x9FFF) || (cp >= 0xF900 && cp <= 0xFAFF) ||
           (cp >= 0xFF00 && cp <= 0xFFEF) || (cp >= 0x20000 && cp <= 0x2FFFF);
}

bool is_rtl(char32_t cp) {
    return (cp >= 0x0590 && cp <= 0x08FF) || (cp >= 0xFB1D && cp <= 0xFDFF) ||
           (cp >= 0xFE70 && cp <= 0xFEFF) || (cp >= 0x10800 && cp <= 0x10FFF) ||
           (cp >= 0x1E800 && cp <= 0x1EFFF);
}

bool is_latin(char32_t cp) {
    if (cp < 0x80) return std::isalnum(static_cast<int>(cp)) != 0;
    return cp >= 0xC0 && cp <= 0x24F;
}

char32_t first_code_point(const std::string& text) {
    std::size_t pos = 0;
    return text.empty() ? 0 : decode_utf8(text, pos);
}

char32_t last_code_point(const std::string& text) {
    if (text.empty()) return 0;
    std::size_t pos = text.size() - 1;
    while (pos > 0 && (static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80) --pos;
    return decode_utf8(text, pos);
}

// Embedding level of a word: from its first strong character, or the base
// level for words without one.
std::uint8_t word_level(const std::string& word, std::uint8_t base_level) {
    std::size_t pos = 0;
    while (pos < word.size()) {
        char32_t cp = decode_utf8(word, pos);
        if (is_rtl(cp)) {
            return base_level % 2 == 1 ? base_level : static_cast<std::uint8_t>(base_level + 1);
        }
        if (is_latin(cp) || is_cjk(cp)) {
            return base_level % 2 == 0 ? base_level : static_cast<std::uint8_t>(base_level + 1);
        }
    }
    return base_level;
}

// ---------------------------------------------------------------------------
// Collection
// ---------------------------------------------------------------------------

// Collapse runs of whitespace into a single space. `in_space` carries over
// between children so that spaces collapse across their boundaries.
std::string collapse_whitespace(const std::string& text, bool& in_space) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!in_space) {
                result.push_back(' ');
                in_space = true;
            }
        } else {
            result.push_back(c);
            in_space = false;
        }
    }
    return result;
}

void trim_trailing_space(Collection& collection) {
    if (collection.segments.empty()) return;
    Segment& last = collection.segments.back();
    if (last.kind != Segment::Kind::Text || last.end == last.start) return;
    if (collection.text[last.end - 1] != ' ') return;
    collection.text.erase(last.end - 1, 1);
    --last.end;
    if (last.end == last.start) collection.segments.pop_back();
}

// ---------------------------------------------------------------------------
// Preparation
// ---------------------------------------------------------------------------

void push_word(Preparation& p, const LayoutContext& ctx, std::string word, float font_size,
               Span span) {
    if (word.empty()) return;
    InlineItem item;
    item.kind = InlineItemKind::Word;
    item.width = ctx.measure_text(word, font_size);
    item.text = std::move(word);
    item.font_size = font_size;
    item.level = word_level(item.text, p.base_level);
    item.span = span;
    p.items.push_back(std::move(item));
}

void split_words(Preparation& p, const LayoutContext& ctx, const std::string& text, float font_size,
                 Span span) {
    std::string word;
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t begin = pos;
        char32_t cp = decode_utf8(text, pos);
        if (cp == U' ') {
            push_word(p, ctx, std::move(word), font_size, span);
            word.clear();
            InlineItem space;
            space.kind = InlineItemKind::Space;
            space.text = " ";
            space.width = ctx.measure_text(" ", font_size);
            space.font_size = font_size;
            space.level = p.base_level;
            space.break_after = true;
            space.span = span;
            p.items.push_back(std::move(space));
        } else if (is_cjk(cp)) {
            // Lines may break before and after every ideograph.
            push_word(p, ctx, std::move(word), font_size, span);
            word.clear();
            if (!p.items.empty() && p.items.back().kind == InlineItemKind::Word) {
                p.items.back().break_after = true;
            }
            push_word(p, ctx, text.substr(begin, pos - begin), font_size, span);
            p.items.back().break_after = true;
        } else {
            word.append(text, begin, pos - begin);
        }
    }
    push_word(p, ctx, std::move(word), font_size, span);
}

// Neutral spaces between two runs of the same level take that level.
void resolve_neutral_levels(Preparation& p) {
    for (std::size_t i = 0; i < p.items.size(); ++i) {
        if (p.items[i].kind != InlineItemKind::Space) continue;
        std::size_t prev = i;
        while (prev > 0 && p.items[prev - 1].kind == InlineItemKind::Space) --prev;
        std::size_t next = i + 1;
        while (next < p.items.size() && p.items[next].kind == InlineItemKind::Space) ++next;
        if (prev == 0 || next >= p.items.size()) continue;
        const InlineItem& before = p.items[prev - 1];
        const InlineItem& after = p.items[next];
        if (before.kind == InlineItemKind::Word && after.kind == InlineItemKind::Word &&
            before.level == after.level) {
            p.items[i].level = before.level;
        }
    }
}

void insert_cjk_latin_spacing(Preparation& p) {
    std::vector<InlineItem> items;
    items.reserve(p.items.size());
    for (std::size_t i = 0; i < p.items.size(); ++i) {
        items.push_back(p.items[i]);
        if (i + 1 >= p.items.size()) break;
        const InlineItem& cur = p.items[i];
        const InlineItem& next = p.items[i + 1];
        if (cur.kind != InlineItemKind::Word || next.kind != InlineItemKind::Word) continue;
        char32_t a = last_code_point(cur.text);
        char32_t b = first_code_point(next.text);
        if (!((is_cjk(a) && is_latin(b)) || (is_latin(a) && is_cjk(b)))) continue;

        InlineItem gap;
        gap.kind = InlineItemKind::Absolute;
        gap.width = core::config::kCjkLatinSpacingEm * cur.font_size;
        gap.font_size = cur.font_size;
        gap.level = p.base_level;
        gap.break_after = cur.break_after;
        gap.span = cur.span;
        items.back().break_after = false;
        items.push_back(std::move(gap));
    }
    p.items = std::move(items);
}

// Visual order of the items [start, stop) by reversing runs of increasing
// embedding level.
std::vector<std::size_t> visual_order(const Preparation& p, std::size_t start, std::size_t stop) {
    std::vector<std::size_t> order;
    std::uint8_t highest = 0;
    std::uint8_t lowest_odd = 0xFF;
    for (std::size_t i = start; i < stop; ++i) {
        order.push_back(i);
        std::uint8_t level = p.items[i].level;
        highest = std::max(highest, level);
        if (level % 2 == 1) lowest_odd = std::min(lowest_odd, level);
    }
    if (lowest_odd == 0xFF) return order;

    for (int level = highest; level >= lowest_odd; --level) {
        std::size_t i = 0;
        while (i < order.size()) {
            if (p.items[order[i]].level < level) {
                ++i;
                continue;
            }
            std::size_t j = i;
            while (j < order.size() && p.items[order[j]].level >= level) ++j;
            std::reverse(order.begin() + static_cast<std::ptrdiff_t>(i),
                         order.begin() + static_cast<std::ptrdiff_t>(j));
            i = j;
        }
    }
    return order;
}

const LineBreaker& default_breaker() {
    static const DefaultLineBreaker breaker;
    return breaker;
}

} // namespace

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

Config configuration(const style::StyleChain& shared, const std::vector<Pair>& children,
                     std::optional<ParSituation> situation) {
    Config config;
    config.justify = shared.get_or<bool>(props::kParJustify, false);
    if (auto linebreaks = shared.get<std::string>(props::kParLinebreaks)) {
        config.linebreaks = *linebreaks == "optimized" ? Linebreaks::Optimized : Linebreaks::Simple;
    } else {
        config.linebreaks = config.justify ? Linebreaks::Optimized : Linebreaks::Simple;
    }

    config.font_size = shared.get_or<float>(props::kTextSize, core::config::kDefaultFontSize);
    config.dir = shared.get_or<Dir>(props::kTextDir, Dir::LTR);
    config.align = shared.get_or<Alignment>(props::kAlignment, Alignment()).fix_x(config.dir);

    // First-line indent only applies to start-aligned paragraphs following
    // another paragraph, or to all paragraphs when requested, but never in
    // the body of a tight list item.
    Rel indent = shared.get_or<Rel>(props::kParFirstLineIndent, Rel());
    bool indent_all = shared.get_or<bool>(props::kParFirstLineIndentAll, false);
    bool tight_body = shared.get_or<bool>(props::kListTightBody, false);
    bool situated = situation && (*situation == ParSituation::Consecutive || indent_all);
    if (!indent.is_zero() && situated && config.align == dir_start(config.dir) && !tight_body) {
        config.first_line_indent = indent.resolve(config.font_size, 0);
    }

    if (situation) {
        config.hanging_indent =
            shared.get_or<Rel>(props::kParHangingIndent, Rel()).resolve(config.font_size, 0);
    }

    if (auto marker = shared.get<std::string>(props::kParLineNumbering)) {
        config.numbering_marker = *marker;
    }

    // Hyphenation and language are only known when every text child agrees.
    std::optional<bool> hyphenate = shared.get<bool>(props::kTextHyphenate);
    std::string lang = shared.get_or<std::string>(props::kTextLang, core::config::kDefaultLang);
    bool seen = false;
    bool uniform_hyphenate = true;
    bool uniform_lang = true;
    for (const auto& child : children) {
        if (!child.content->is(ContentKind::Text)) continue;
        auto child_hyphenate = child.styles.get<bool>(props::kTextHyphenate);
        auto child_lang =
            child.styles.get_or<std::string>(props::kTextLang, core::config::kDefaultLang);
        if (!seen) {
            hyphenate = child_hyphenate;
            lang = child_lang;
            seen = true;
            continue;
        }
        if (child_hyphenate != hyphenate) uniform_hyphenate = false;
        if (child_lang != lang) uniform_lang = false;
    }
    if (uniform_hyphenate) config.hyphenate = hyphenate.value_or(config.justify);
    if (uniform_lang) config.lang = lang;

    config.fallback = shared.get_or<bool>(props::kTextFallback, true);
    config.cjk_latin_spacing = shared.get_or<bool>(props::kTextCjkLatinSpacing, true);
    config.costs = shared.get_or<style::Costs>(props::kTextCosts, style::Costs());
    return config;
}

// ---------------------------------------------------------------------------
// Collect
// ---------------------------------------------------------------------------

Collection collect(const LayoutContext& ctx, const std::vector<Pair>& children,
                   const Config& config, float region_width) {
    Collection collection;
    auto push_spacing = [&](float amount) {
        Segment segment;
        segment.kind = Segment::Kind::Spacing;
        segment.amount = amount;
        collection.segments.push_back(std::move(segment));
    };

    if (config.first_line_indent != 0) push_spacing(config.first_line_indent);
    if (config.hanging_indent != 0) push_spacing(-config.hanging_indent);

    bool in_space = true;
    for (const auto& child : children) {
        const Content& content = *child.content;
        float font_size = child.styles.get_or<float>(props::kTextSize, config.font_size);
        switch (content.kind) {
            case ContentKind::Text: {
                std::string text = collapse_whitespace(content.text, in_space);
                if (text.empty()) break;
                Segment segment;
                segment.kind = Segment::Kind::Text;
                segment.start = collection.text.size();
                collection.text += text;
                segment.end = collection.text.size();
                segment.font_size = font_size;
                segment.span = content.span;
                collection.segments.push_back(std::move(segment));
                break;
            }
            case ContentKind::Linebreak: {
                trim_trailing_space(collection);
                Segment segment;
                segment.kind = Segment::Kind::Linebreak;
                segment.font_size = font_size;
                segment.span = content.span;
                collection.segments.push_back(std::move(segment));
                in_space = true;
                break;
            }
            case ContentKind::HSpacing: {
                Segment segment;
                segment.kind = Segment::Kind::Spacing;
                if (content.amount.is_fractional()) {
                    segment.fr = content.amount.fr;
                } else {
                    segment.amount = content.amount.rel.resolve(font_size, region_width);
                }
                segment.font_size = font_size;
                segment.span = content.span;
                collection.segments.push_back(std::move(segment));
                break;
            }
            case ContentKind::Block:
            case ContentKind::Stack:
            case ContentKind::PageCounter: {
                Region region(Size(region_width, kInfinity), Axes<bool>(false, false));
                Fragment fragment = ctx.layout_block(content, child.styles, region);
                if (fragment.empty()) break;
                Segment segment;
                segment.kind = Segment::Kind::Frame;
                segment.frame = fragment[0];
                segment.font_size = font_size;
                segment.span = content.span;
                collection.segments.push_back(std::move(segment));
                in_space = false;
                break;
            }
            case ContentKind::Tag:
                break;
            default:
                ctx.fail(LayoutErrorKind::InvalidContent, "inline",
                         std::string(content_kind_name(content.kind)) +
                             " cannot appear inside a paragraph",
                         content.span);
        }
    }
    trim_trailing_space(collection);
    return collection;
}

// ---------------------------------------------------------------------------
// Prepare
// ---------------------------------------------------------------------------

Preparation prepare(const LayoutContext& ctx, const Collection& collection, const Config& config,
                    const style::StyleChain& shared) {
    Preparation p;
    p.config = config;
    p.base_level = config.dir == Dir::RTL ? 1 : 0;
    p.leading = shared.get_or<Rel>(props::kParLeading, Rel::ems(core::config::kDefaultLeadingEm))
                    .resolve(config.font_size, 0);

    for (const auto& segment : collection.segments) {
        switch (segment.kind) {
            case Segment::Kind::Text:
                split_words(p, ctx, collection.text.substr(segment.start, segment.end - segment.start),
                            segment.font_size, segment.span);
                break;
            case Segment::Kind::Spacing: {
                InlineItem item;
                if (segment.fr) {
                    item.kind = InlineItemKind::Fractional;
                    item.fr = *segment.fr;
                } else {
                    item.kind = InlineItemKind::Absolute;
                    item.width = segment.amount;
                }
                item.level = p.base_level;
                item.span = segment.span;
                p.items.push_back(std::move(item));
                break;
            }
            case Segment::Kind::Linebreak: {
                InlineItem item;
                item.kind = InlineItemKind::Linebreak;
                item.font_size = segment.font_size;
                item.level = p.base_level;
                item.span = segment.span;
                p.items.push_back(std::move(item));
                break;
            }
            case Segment::Kind::Frame: {
                InlineItem item;
                item.kind = InlineItemKind::Frame;
                item.frame = segment.frame;
                item.width = segment.frame.width();
                item.font_size = segment.font_size;
                item.level = p.base_level;
                item.span = segment.span;
                p.items.push_back(std::move(item));
                break;
            }
        }
    }

    resolve_neutral_levels(p);
    if (config.cjk_latin_spacing) insert_cjk_latin_spacing(p);
    return p;
}

// ---------------------------------------------------------------------------
// Line metrics
// ---------------------------------------------------------------------------

std::size_t trimmed_end(const Preparation& p, std::size_t start, std::size_t end) {
    while (end > start && (p.items[end - 1].kind == InlineItemKind::Space ||
                           p.items[end - 1].kind == InlineItemKind::Linebreak)) {
        --end;
    }
    return end;
}

float natural_width(const Preparation& p, std::size_t start, std::size_t end) {
    float width = 0;
    std::size_t stop = trimmed_end(p, start, end);
    for (std::size_t i = start; i < stop; ++i) {
        width += p.items[i].width;
    }
    return width;
}

float line_height(const Preparation& p, std::size_t start, std::size_t end) {
    float height = 0;
    for (std::size_t i = start; i < end; ++i) {
        const InlineItem& item = p.items[i];
        switch (item.kind) {
            case InlineItemKind::Word:
            case InlineItemKind::Space:
            case InlineItemKind::Linebreak:
                height = std::max(height, item.font_size);
                break;
            case InlineItemKind::Frame:
                height = std::max(height, item.frame.height());
                break;
            default:
                break;
        }
    }
    return height > 0 ? height : p.config.font_size;
}

// ---------------------------------------------------------------------------
// Finalize
// ---------------------------------------------------------------------------

std::vector<Frame> finalize(const Preparation& p, const std::vector<Line>& lines, const Region& region,
                            const ParExclusions* exclusions) {
    const Config& config = p.config;
    float hanging = config.hanging_indent;
    bool has_exclusions = exclusions && !exclusions->is_empty();

    // Fill the region when expanding, justifying or wrapping around floats;
    // otherwise shrink to the widest line.
    float width = 0;
    if (std::isfinite(region.size.width) &&
        (region.expand.x || config.justify || has_exclusions)) {
        width = region.size.width;
    } else {
        for (const auto& line : lines) {
            width = std::max(width, natural_width(p, line.start, line.end) + hanging);
        }
    }

    std::vector<Frame> frames;
    frames.reserve(lines.size());
    for (const auto& line : lines) {
        std::size_t stop = trimmed_end(p, line.start, line.end);
        float height = line_height(p, line.start, line.end);

        float available = width;
        float left = 0;
        if (has_exclusions) {
            float bottom = line.y + std::max(height - kLengthEpsilon, 0.0f);
            available = std::min(exclusions->available_width(width, line.y),
                                 exclusions->available_width(width, bottom));
            left = std::max(exclusions->left_offset(line.y), exclusions->left_offset(bottom));
        }

        float remaining = available - natural_width(p, line.start, line.end) - hanging;
        // Lines are built left to right, so in LTR the hanging indent shifts
        // every line while the first line's negative spacing undoes it.
        float offset = left + (config.dir != Dir::RTL ? hanging : 0);

        Fr fr;
        float stretch = 0;
        for (std::size_t i = line.start; i < stop; ++i) {
            const InlineItem& item = p.items[i];
            if (item.kind == InlineItemKind::Fractional) fr += item.fr;
            if (item.kind == InlineItemKind::Space) {
                stretch += item.width * core::config::kMaxJustifyStretch;
            }
        }

        float fr_space = 0;
        float ratio = 0;
        if (fr.value > 0) {
            fr_space = std::max(remaining, 0.0f);
            remaining = 0;
        } else if (config.justify && !line.mandatory && stretch > 0 && remaining > 0) {
            ratio = std::min(remaining / stretch, 1.0f);
            remaining -= stretch * ratio;
        }

        Frame frame = Frame::soft(Size(width, height));
        if (config.numbering_marker) {
            frame.push_line_marker(Point(0, 0), *config.numbering_marker);
        }

        float x = offset + align_position(config.align, remaining);
        for (std::size_t idx : visual_order(p, line.start, stop)) {
            const InlineItem& item = p.items[idx];
            switch (item.kind) {
                case InlineItemKind::Word:
                    frame.push_text(Point(x, height - item.font_size), item.text, item.font_size,
                                    item.width);
                    x += item.width;
                    break;
                case InlineItemKind::Space:
                    x += item.width + item.width * core::config::kMaxJustifyStretch * ratio;
                    break;
                case InlineItemKind::Absolute:
                    x += item.width;
                    break;
                case InlineItemKind::Fractional:
                    x += item.fr.share(fr, fr_space);
                    break;
                case InlineItemKind::Frame:
                    frame.push_frame(Point(x, height - item.frame.height()), item.frame);
                    x += item.width;
                    break;
                case InlineItemKind::Linebreak:
                    break;
            }
        }
        frames.push_back(std::move(frame));
    }
    return frames;
}

// ---------------------------------------------------------------------------
// Entry points
// ---------------------------------------------------------------------------

float LaidOutPar::total_height() const {
    float height = 0;
    for (const auto& line : lines) height += line.height();
    if (lines.size() > 1) height += leading * static_cast<float>(lines.size() - 1);
    return height;
}

LaidOutPar layout_lines(const LayoutContext& ctx, const std::vector<Pair>& children,
                        const style::StyleChain& shared, const Region& region,
                        std::optional<ParSituation> situation, const ParExclusions* exclusions) {
    Config config = configuration(shared, children, situation);
    Collection collection = collect(ctx, children, config, region.size.width);
    Preparation p = prepare(ctx, collection, config, shared);

    float width = region.size.width;
    float hanging = config.hanging_indent;
    AvailableWidthFn available = [&](float y) {
        float base = exclusions ? exclusions->available_width(width, y) : width;
        return base - hanging;
    };

    const LineBreaker& breaker = ctx.breaker ? *ctx.breaker : default_breaker();
    std::vector<Line> lines = breaker.break_lines(p, config.linebreaks, available);

    LaidOutPar result;
    result.leading = p.leading;
    for (const auto& line : lines) {
        result.breaks.push_back(line.end);
        float height = line_height(p, line.start, line.end);
        if (!fits(available_for_line(available, line.y, height),
                  natural_width(p, line.start, line.end))) {
            result.overfull = true;
        }
    }
    result.lines = finalize(p, lines, region, exclusions);
    return result;
}

Fragment layout_par(const LayoutContext& ctx, const Content& par, const style::StyleChain& styles,
                    const Region& region, ParSituation situation, const ParExclusions* exclusions) {
    LaidOutPar laid_out = layout_lines(ctx, par.children, styles, region, situation, exclusions);
    return Fragment(std::move(laid_out.lines));
}

Frame layout_inline(const LayoutContext& ctx, const std::vector<Pair>& children,
                    const style::StyleChain& styles, const Region& region) {
    LaidOutPar laid_out = layout_lines(ctx, children, styles, region, std::nullopt, nullptr);
    float width = 0;
    for (const auto& line : laid_out.lines) width = std::max(width, line.width());

    Frame output = Frame::soft(Size(width, laid_out.total_height()));
    float y = 0;
    for (auto& line : laid_out.lines) {
        float height = line.height();
        output.push_frame(Point(0, y), std::move(line));
        y += height + laid_out.leading;
    }
    return output;
}

} // namespace folio::layout
