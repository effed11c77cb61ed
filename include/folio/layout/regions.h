#pragma once
#include <folio/layout/geometry.h>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace folio::layout {

// A single region to lay out into.
struct Region {
    Size size;
    // Whether content must expand to fill the region instead of shrinking to
    // fit, per axis.
    Axes<bool> expand;

    Region() = default;
    Region(Size s, Axes<bool> e) : size(s), expand(e) {}
};

// A sequence of regions to lay out into. All regions share the same width,
// `size.width`; only the heights vary.
struct Regions {
    // Remaining size of the first region.
    Size size;
    Axes<bool> expand;
    // Full height of the first region, for relative sizing.
    float full = 0;
    // Heights of the followup regions.
    std::vector<float> backlog;
    // Height of the final region, repeated once the backlog is drained.
    std::optional<float> last;

    Regions() = default;
    Regions(const Region& region)  // NOLINT(google-explicit-constructor)
        : size(region.size), expand(region.expand), full(region.size.height) {}

    // An unbounded sequence of identical regions.
    static Regions repeat(Size size, Axes<bool> expand);

    // The size before anything was consumed, used for relative sizing.
    Size base() const { return {size.width, full}; }

    // New regions with all sizes passed through `f`. The width returned for
    // followup regions is ignored since all regions share one width.
    template <typename F>
    Regions map(F f) const {
        Regions mapped;
        mapped.size = f(size);
        mapped.expand = expand;
        mapped.full = f(Size(size.width, full)).height;
        mapped.backlog.reserve(backlog.size());
        for (float height : backlog) {
            mapped.backlog.push_back(f(Size(size.width, height)).height);
        }
        if (last) mapped.last = f(Size(size.width, *last)).height;
        return mapped;
    }

    // Whether the first region is used up and a break is called for.
    bool is_full() const { return fits(0, size.height) && may_progress(); }
    // Whether a region break is permitted at all.
    bool may_break() const { return !backlog.empty() || last.has_value(); }
    // Whether calling next() changes anything about the available space.
    bool may_progress() const {
        return !backlog.empty() || (last.has_value() && size.height != *last);
    }

    // Advance to the next region if there is one, otherwise do nothing.
    void next();

    // Sizes of the first `count` regions as next() would produce them.
    std::vector<Size> iter(std::size_t count) const;
};

std::string describe_regions(const Regions& regions);

} // namespace folio::layout
