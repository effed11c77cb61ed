#include <folio/layout/frame.h>

#include <sstream>
#include <stdexcept>

namespace folio::layout {

void Frame::push_frame(Point pos, Frame frame) {
    FrameItem item;
    item.kind = FrameItemKind::Group;
    item.pos = pos;
    item.group = std::make_shared<const Frame>(std::move(frame));
    items_.push_back(std::move(item));
}

void Frame::push_text(Point pos, std::string text, float font_size, float width) {
    FrameItem item;
    item.kind = FrameItemKind::Text;
    item.pos = pos;
    item.text = std::move(text);
    item.font_size = font_size;
    item.width = width;
    items_.push_back(std::move(item));
}

void Frame::push_line_marker(Point pos, std::string pattern) {
    FrameItem item;
    item.kind = FrameItemKind::LineMarker;
    item.pos = pos;
    item.text = std::move(pattern);
    items_.push_back(std::move(item));
}

void Frame::push_page_number(Point pos, std::string numbering, float font_size, float width) {
    FrameItem item;
    item.kind = FrameItemKind::PageNumber;
    item.pos = pos;
    item.text = std::move(numbering);
    item.font_size = font_size;
    item.width = width;
    items_.push_back(std::move(item));
}

void Frame::translate(Point delta) {
    if (delta.x == 0 && delta.y == 0) return;
    for (auto& item : items_) {
        item.pos = item.pos + delta;
    }
}

void Frame::resize(Size target, Axes<FixedAlignment> align) {
    if (target == size_) return;
    float dx = align_position(align.x, target.width - size_.width);
    float dy = align_position(align.y, target.height - size_.height);
    size_ = target;
    translate(Point(dx, dy));
}

std::size_t Frame::count_page_numbers() const {
    std::size_t count = 0;
    for (const auto& item : items_) {
        if (item.kind == FrameItemKind::PageNumber) {
            ++count;
        } else if (item.kind == FrameItemKind::Group && item.group) {
            count += item.group->count_page_numbers();
        }
    }
    return count;
}

Fragment Fragment::frame(Frame frame) {
    std::vector<Frame> frames;
    frames.push_back(std::move(frame));
    return Fragment(std::move(frames));
}

Frame Fragment::into_frame() && {
    if (frames_.size() != 1) {
        throw std::logic_error("expected a fragment with exactly one frame, got " +
                               std::to_string(frames_.size()));
    }
    return std::move(frames_.front());
}

namespace {

void serialize_into(std::ostringstream& out, const Frame& frame) {
    out << "{w:" << frame.width() << " h:" << frame.height();
    for (const auto& item : frame.items()) {
        out << " @" << item.pos.x << "," << item.pos.y;
        switch (item.kind) {
            case FrameItemKind::Group:
                out << " ";
                serialize_into(out, *item.group);
                break;
            case FrameItemKind::Text:
                out << " text:\"" << item.text << "\"";
                break;
            case FrameItemKind::LineMarker:
                out << " marker:" << item.text;
                break;
            case FrameItemKind::PageNumber:
                out << " page-number:" << item.text;
                break;
        }
    }
    out << "}";
}

} // namespace

std::string serialize_frame(const Frame& frame) {
    std::ostringstream out;
    serialize_into(out, frame);
    return out.str();
}

} // namespace folio::layout
