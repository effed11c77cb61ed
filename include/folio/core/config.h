#ifndef FOLIO_CORE_CONFIG_H
#define FOLIO_CORE_CONFIG_H

#include <cstdint>

namespace folio::core::config {

// Paper used when a page run sets no explicit size (ISO A4, in points).
inline constexpr float kPaperWidth = 595.28f;
inline constexpr float kPaperHeight = 841.89f;

// Default page margin relative to the shorter finite page dimension.
inline constexpr float kDefaultMarginRatio = 2.5f / 21.0f;

// Header ascent and footer descent, relative to the top/bottom margin.
inline constexpr float kDefaultHeaderAscent = 0.3f;
inline constexpr float kDefaultFooterDescent = 0.3f;

inline constexpr float kDefaultFontSize = 11.0f;
inline constexpr float kDefaultLeadingEm = 0.65f;
inline constexpr float kDefaultParSpacingEm = 1.2f;

// Language assumed when no text language is set.
inline constexpr const char kDefaultLang[] = "en";

// Advance per character when no text measurer is installed.
inline constexpr float kFallbackCharWidthEm = 0.6f;

// Extra space inserted between CJK and Latin characters.
inline constexpr float kCjkLatinSpacingEm = 0.25f;

// A justified space may grow by at most this fraction of its natural width.
inline constexpr float kMaxJustifyStretch = 1.0f;

// Exclusion zones are stored in integer units of 1/1000 pt.
inline constexpr double kExclusionUnitsPerPt = 1000.0;

// Wrap floats wider than this fraction of the column are placed as regular
// floats; a gap narrower than the minimum fraction triggers a warning.
inline constexpr float kMaxWrapWidthRatio = 2.0f / 3.0f;
inline constexpr float kMinWrapGapRatio = 1.0f / 6.0f;

// Passes of paragraph re-measurement against wrap-float exclusions.
inline constexpr int kMaxWrapIterations = 3;

// Default widow/orphan/runt costs, as a fraction of the standard penalty.
inline constexpr float kDefaultCostRatio = 1.0f;

}  // namespace folio::core::config

#endif  // FOLIO_CORE_CONFIG_H
