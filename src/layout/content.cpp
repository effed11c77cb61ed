#include <folio/layout/content.h>

namespace folio::layout {

const char* content_kind_name(ContentKind kind) {
    switch (kind) {
        case ContentKind::Text:        return "text";
        case ContentKind::Linebreak:   return "linebreak";
        case ContentKind::HSpacing:    return "h";
        case ContentKind::VSpacing:    return "v";
        case ContentKind::Paragraph:   return "par";
        case ContentKind::Block:       return "block";
        case ContentKind::Stack:       return "stack";
        case ContentKind::Place:       return "place";
        case ContentKind::Pagebreak:   return "pagebreak";
        case ContentKind::PageCounter: return "page-counter";
        case ContentKind::Tag:         return "tag";
    }
    return "unknown";
}

namespace {

std::shared_ptr<Content> make(ContentKind kind) {
    auto content = std::make_shared<Content>();
    content->kind = kind;
    return content;
}

} // namespace

std::shared_ptr<Content> make_text(std::string text) {
    auto content = make(ContentKind::Text);
    content->text = std::move(text);
    return content;
}

std::shared_ptr<Content> make_linebreak() {
    return make(ContentKind::Linebreak);
}

std::shared_ptr<Content> make_h(Spacing amount) {
    auto content = make(ContentKind::HSpacing);
    content->amount = amount;
    return content;
}

std::shared_ptr<Content> make_v(Spacing amount, bool weak) {
    auto content = make(ContentKind::VSpacing);
    content->amount = amount;
    content->weak = weak;
    return content;
}

std::shared_ptr<Content> make_par(std::vector<Pair> children) {
    auto content = make(ContentKind::Paragraph);
    content->children = std::move(children);
    return content;
}

std::shared_ptr<Content> make_block(std::vector<Pair> body) {
    auto content = make(ContentKind::Block);
    content->children = std::move(body);
    return content;
}

std::shared_ptr<Content> make_stack(Dir dir, std::vector<Pair> children,
                                    std::optional<Spacing> spacing) {
    auto content = make(ContentKind::Stack);
    content->dir = dir;
    content->children = std::move(children);
    content->stack_spacing = spacing;
    return content;
}

std::shared_ptr<Content> make_place(Alignment align, std::vector<Pair> body, bool floating) {
    auto content = make(ContentKind::Place);
    content->place_align = align;
    content->children = std::move(body);
    content->floating = floating;
    return content;
}

std::shared_ptr<Content> make_pagebreak(bool weak) {
    auto content = make(ContentKind::Pagebreak);
    content->weak = weak;
    return content;
}

std::shared_ptr<Content> make_page_counter(std::string numbering) {
    auto content = make(ContentKind::PageCounter);
    content->numbering = std::move(numbering);
    return content;
}

std::shared_ptr<Content> make_tag() {
    return make(ContentKind::Tag);
}

} // namespace folio::layout
