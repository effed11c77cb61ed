#pragma once
#include <folio/layout/inline_layout.h>
#include <functional>
#include <vector>

namespace folio::layout {

// Width available to a line whose top sits at `y` within the paragraph.
using AvailableWidthFn = std::function<float(float y)>;

// Strategy choosing line boundaries for a prepared paragraph.
class LineBreaker {
public:
    virtual ~LineBreaker() = default;
    virtual std::vector<Line> break_lines(const Preparation& p, Linebreaks mode,
                                          const AvailableWidthFn& available) const = 0;
};

// First-fit breaking for `Simple`, total-fit (Knuth-Plass style) breaking
// for `Optimized`.
class DefaultLineBreaker : public LineBreaker {
public:
    std::vector<Line> break_lines(const Preparation& p, Linebreaks mode,
                                  const AvailableWidthFn& available) const override;

private:
    std::vector<Line> break_simple(const Preparation& p, const AvailableWidthFn& available) const;
    std::vector<Line> break_optimized(const Preparation& p, const AvailableWidthFn& available) const;
};

// Width available to a line of `height` at `y`: the narrower of the widths
// at its top and bottom edge.
float available_for_line(const AvailableWidthFn& available, float y, float height);

} // namespace folio::layout
