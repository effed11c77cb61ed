#include <folio/layout/exclusions.h>
#include <folio/core/config.h>

#include <algorithm>
#include <cmath>

namespace folio::layout {

std::int64_t to_raw_units(float points) {
    return static_cast<std::int64_t>(std::llround(points * core::config::kExclusionUnitsPerPt));
}

float from_raw_units(std::int64_t raw) {
    return static_cast<float>(static_cast<double>(raw) / core::config::kExclusionUnitsPerPt);
}

ExclusionZone ExclusionZone::from_points(float y_start, float y_end, float left, float right) {
    return {to_raw_units(y_start), to_raw_units(y_end), to_raw_units(left), to_raw_units(right)};
}

WrapFloat WrapFloat::from_placed(Size float_size, float y, FixedAlignment align_x, float clearance) {
    float width = float_size.width + std::max(clearance, 0.0f);
    WrapFloat wf;
    wf.y = y;
    wf.height = float_size.height;
    switch (align_x) {
        case FixedAlignment::Start:
            wf.left_margin = width;
            break;
        case FixedAlignment::End:
            wf.right_margin = width;
            break;
        case FixedAlignment::Center:
            wf.left_margin = width / 2;
            wf.right_margin = width / 2;
            break;
    }
    return wf;
}

ParExclusions::ParExclusions(std::vector<ExclusionZone> zones) : zones_(std::move(zones)) {
    std::stable_sort(zones_.begin(), zones_.end(),
                     [](const ExclusionZone& a, const ExclusionZone& b) { return a.y_start < b.y_start; });
}

ParExclusions ParExclusions::from_wrap_floats(float par_y, float par_height,
                                              const std::vector<WrapFloat>& floats) {
    std::vector<ExclusionZone> zones;
    zones.reserve(floats.size());

    // Work in raw units for the overlap test and the clamping so that each
    // value is rounded exactly once.
    std::int64_t par_top = to_raw_units(par_y);
    std::int64_t par_bottom = to_raw_units(par_y + par_height);

    for (const auto& wf : floats) {
        std::int64_t wf_top = to_raw_units(wf.y);
        std::int64_t wf_bottom = to_raw_units(wf.y + wf.height);
        if (wf_bottom <= par_top || wf_top >= par_bottom) continue;

        ExclusionZone zone;
        zone.y_start = std::max<std::int64_t>(wf_top - par_top, 0);
        zone.y_end = std::min(wf_bottom - par_top, par_bottom - par_top);
        zone.left = to_raw_units(wf.left_margin);
        zone.right = to_raw_units(wf.right_margin);
        zones.push_back(zone);
    }

    return ParExclusions(std::move(zones));
}

float ParExclusions::available_width(float base_width, float y) const {
    std::int64_t y_raw = to_raw_units(y);
    std::int64_t left = 0;
    std::int64_t right = 0;
    for (const auto& zone : zones_) {
        // Zones are sorted, nothing after this one can be active.
        if (y_raw < zone.y_start) break;
        if (y_raw < zone.y_end) {
            left = std::max(left, zone.left);
            right = std::max(right, zone.right);
        }
    }
    float excluded = from_raw_units(left) + from_raw_units(right);
    return std::max(base_width - excluded, 0.0f);
}

float ParExclusions::left_offset(float y) const {
    std::int64_t y_raw = to_raw_units(y);
    std::int64_t left = 0;
    for (const auto& zone : zones_) {
        if (y_raw < zone.y_start) break;
        if (y_raw < zone.y_end) left = std::max(left, zone.left);
    }
    return from_raw_units(left);
}

bool ParExclusions::has_exclusion_at(float y) const {
    std::int64_t y_raw = to_raw_units(y);
    for (const auto& zone : zones_) {
        if (y_raw < zone.y_start) break;
        if (y_raw < zone.y_end) return true;
    }
    return false;
}

std::optional<float> ParExclusions::next_boundary(float y) const {
    std::int64_t y_raw = to_raw_units(y);
    std::optional<std::int64_t> best;
    for (const auto& zone : zones_) {
        for (std::int64_t boundary : {zone.y_start, zone.y_end}) {
            if (boundary > y_raw && (!best || boundary < *best)) best = boundary;
        }
    }
    if (!best) return std::nullopt;
    return from_raw_units(*best);
}

} // namespace folio::layout
