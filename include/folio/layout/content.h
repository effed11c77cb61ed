#pragma once
#include <folio/layout/error.h>
#include <folio/layout/geometry.h>
#include <folio/style/style_chain.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace folio::layout {

enum class ContentKind {
    Text,         // inline text run
    Linebreak,    // forced line break inside a paragraph
    HSpacing,     // horizontal spacing inside a paragraph
    VSpacing,     // vertical spacing in a flow
    Paragraph,    // inline children forming one paragraph
    Block,        // sized container with a flow body
    Stack,        // children stacked along a direction
    Place,        // overlay or float
    Pagebreak,
    PageCounter,  // page number display, resolved after pagination
    Tag           // introspection marker without visual extent
};

const char* content_kind_name(ContentKind kind);

struct Content;
using ContentPtr = std::shared_ptr<const Content>;

// A piece of content together with the styles active for it. The stream
// consumed by the layout core is a list of pairs.
struct Pair {
    ContentPtr content;
    style::StyleChain styles;
};

enum class Parity { Odd, Even };

struct Content {
    ContentKind kind = ContentKind::Text;
    Span span = 0;

    // Text
    std::string text;

    // HSpacing / VSpacing; `weak` spacing collapses with neighbours and
    // vanishes at region starts
    Spacing amount;
    bool weak = false;

    // Paragraph, Block, Stack and Place children
    std::vector<Pair> children;

    // Block
    std::optional<Rel> width;
    std::optional<Rel> height;
    bool breakable = true;
    EdgeSizes inset;

    // Stack
    Dir dir = Dir::TTB;
    std::optional<Spacing> stack_spacing;

    // Place
    Alignment place_align;
    bool floating = false;
    bool wrap = false;
    float clearance = 0;

    // Pagebreak: `weak` breaks do not create empty pages, `boundary` breaks
    // close the scope of a page set rule
    bool boundary = false;
    std::optional<Parity> to;

    // PageCounter
    std::string numbering;

    bool is(ContentKind k) const { return kind == k; }
};

// Builders used by the realization layer and tests.
std::shared_ptr<Content> make_text(std::string text);
std::shared_ptr<Content> make_linebreak();
std::shared_ptr<Content> make_h(Spacing amount);
std::shared_ptr<Content> make_v(Spacing amount, bool weak = false);
std::shared_ptr<Content> make_par(std::vector<Pair> children);
std::shared_ptr<Content> make_block(std::vector<Pair> body);
std::shared_ptr<Content> make_stack(Dir dir, std::vector<Pair> children,
                                    std::optional<Spacing> spacing = std::nullopt);
std::shared_ptr<Content> make_place(Alignment align, std::vector<Pair> body, bool floating = false);
std::shared_ptr<Content> make_pagebreak(bool weak = false);
std::shared_ptr<Content> make_page_counter(std::string numbering);
std::shared_ptr<Content> make_tag();

inline Pair styled(ContentPtr content, style::StyleChain styles = {}) {
    return Pair{std::move(content), std::move(styles)};
}

} // namespace folio::layout
