#include <folio/layout/geometry.h>

namespace folio::layout {

FixedAlignment Alignment::fix_x(Dir text_dir) const {
    bool ltr = text_dir != Dir::RTL;
    switch (x.value_or(HAlign::Start)) {
        case HAlign::Left: return FixedAlignment::Start;
        case HAlign::Right: return FixedAlignment::End;
        case HAlign::Center: return FixedAlignment::Center;
        case HAlign::Start: return ltr ? FixedAlignment::Start : FixedAlignment::End;
        case HAlign::End: return ltr ? FixedAlignment::End : FixedAlignment::Start;
    }
    return FixedAlignment::Start;
}

FixedAlignment Alignment::fix_y() const {
    switch (y.value_or(VAlign::Top)) {
        case VAlign::Top: return FixedAlignment::Start;
        case VAlign::Horizon: return FixedAlignment::Center;
        case VAlign::Bottom: return FixedAlignment::End;
    }
    return FixedAlignment::Start;
}

} // namespace folio::layout
