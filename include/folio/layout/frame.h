#pragma once
#include <folio/layout/geometry.h>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace folio::layout {

class Frame;

enum class FrameItemKind {
    Group,       // a nested frame
    Text,        // a measured run of text
    LineMarker,  // line-numbering anchor at the start of a paragraph line
    PageNumber   // page counter placeholder, resolved once page numbers are known
};

struct FrameItem {
    FrameItemKind kind = FrameItemKind::Text;
    Point pos;
    std::shared_ptr<const Frame> group;
    std::string text;       // text run, marker pattern or numbering pattern
    float font_size = 0;
    float width = 0;
};

// A finished, positioned piece of layout output.
class Frame {
public:
    Frame() = default;
    explicit Frame(Size size, bool hard = true) : size_(size), hard_(hard) {}

    static Frame hard(Size size) { return Frame(size, true); }
    static Frame soft(Size size) { return Frame(size, false); }

    Size size() const { return size_; }
    float width() const { return size_.width; }
    float height() const { return size_.height; }
    void set_size(Size size) { size_ = size; }
    bool is_hard() const { return hard_; }

    bool is_empty() const { return items_.empty(); }
    const std::vector<FrameItem>& items() const { return items_; }

    void push_frame(Point pos, Frame frame);
    void push_text(Point pos, std::string text, float font_size, float width);
    void push_line_marker(Point pos, std::string pattern);
    void push_page_number(Point pos, std::string numbering, float font_size, float width);

    // Move all items by `delta`.
    void translate(Point delta);

    // Resize the frame, shifting the content so it keeps the given alignment
    // inside the new size.
    void resize(Size target, Axes<FixedAlignment> align);

    // Number of page-number placeholders in this frame and nested groups.
    std::size_t count_page_numbers() const;

private:
    Size size_;
    bool hard_ = true;
    std::vector<FrameItem> items_;
};

// The frames produced by one layout call, one per consumed region.
class Fragment {
public:
    Fragment() = default;
    explicit Fragment(std::vector<Frame> frames) : frames_(std::move(frames)) {}

    static Fragment frame(Frame frame);

    std::size_t size() const { return frames_.size(); }
    bool empty() const { return frames_.empty(); }
    const Frame& operator[](std::size_t i) const { return frames_[i]; }
    const std::vector<Frame>& frames() const { return frames_; }
    std::vector<Frame> into_frames() && { return std::move(frames_); }
    // The only frame of a single-region fragment.
    Frame into_frame() &&;

    std::vector<Frame>::const_iterator begin() const { return frames_.begin(); }
    std::vector<Frame>::const_iterator end() const { return frames_.end(); }

private:
    std::vector<Frame> frames_;
};

// Deterministic textual dump of a frame tree, for tests and debugging.
std::string serialize_frame(const Frame& frame);

} // namespace folio::layout
