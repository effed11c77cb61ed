#pragma once
#include <folio/layout/geometry.h>
#include <cstdint>
#include <optional>
#include <vector>

namespace folio::layout {

// A rectangular exclusion in paragraph-relative coordinates (y = 0 at the
// paragraph top). Values are integer raw units so that sorted lookups never
// depend on floating-point rounding. The vertical range is [y_start, y_end).
struct ExclusionZone {
    std::int64_t y_start = 0;
    std::int64_t y_end = 0;
    std::int64_t left = 0;
    std::int64_t right = 0;

    static ExclusionZone from_points(float y_start, float y_end, float left, float right);

    bool operator==(const ExclusionZone& o) const = default;
};

std::int64_t to_raw_units(float points);
float from_raw_units(std::int64_t raw);

// A placed float that text should wrap around, in region coordinates.
struct WrapFloat {
    float y = 0;
    float height = 0;
    // Width excluded from the left (float width plus clearance, or zero).
    float left_margin = 0;
    // Width excluded from the right (float width plus clearance, or zero).
    float right_margin = 0;

    // Start-aligned floats exclude from the left, end-aligned from the right
    // and centered floats half from each side.
    static WrapFloat from_placed(Size float_size, float y, FixedAlignment align_x, float clearance);
};

// Width exclusions for wrapping a paragraph's lines around floats.
class ParExclusions {
public:
    ParExclusions() = default;
    explicit ParExclusions(std::vector<ExclusionZone> zones);

    // Keeps floats overlapping [par_y, par_y + par_height) and converts them
    // to paragraph-relative zones clamped to that extent, sorted by start.
    static ParExclusions from_wrap_floats(float par_y, float par_height,
                                          const std::vector<WrapFloat>& floats);

    bool is_empty() const { return zones_.empty(); }
    const std::vector<ExclusionZone>& zones() const { return zones_; }

    // Base width minus the widest active left and right exclusions at `y`,
    // floored at zero.
    float available_width(float base_width, float y) const;
    float left_offset(float y) const;
    bool has_exclusion_at(float y) const;
    // Smallest zone start or end greater than `y`, if any.
    std::optional<float> next_boundary(float y) const;

private:
    std::vector<ExclusionZone> zones_;
};

} // namespace folio::layout
