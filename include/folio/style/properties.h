#pragma once

// Style property keys read by the layout core. Values are set by the
// realization engine that produces the content stream.
namespace folio::style::props {

// text: size (float pt), dir (Dir), lang (string), hyphenate (bool, absent =
// auto), fallback (bool), cjk_latin_spacing (bool), costs (Costs), fill (string)
inline constexpr const char kTextSize[] = "text.size";
inline constexpr const char kTextDir[] = "text.dir";
inline constexpr const char kTextLang[] = "text.lang";
inline constexpr const char kTextHyphenate[] = "text.hyphenate";
inline constexpr const char kTextFallback[] = "text.fallback";
inline constexpr const char kTextCjkLatinSpacing[] = "text.cjk-latin-spacing";
inline constexpr const char kTextCosts[] = "text.costs";
inline constexpr const char kTextFill[] = "text.fill";

// par: justify (bool), linebreaks ("simple" | "optimized"), first line indent
// (Rel) and whether it applies to all paragraphs (bool), hanging indent (Rel),
// leading (Rel), spacing (Rel), line numbering pattern (string)
inline constexpr const char kParJustify[] = "par.justify";
inline constexpr const char kParLinebreaks[] = "par.linebreaks";
inline constexpr const char kParFirstLineIndent[] = "par.first-line-indent";
inline constexpr const char kParFirstLineIndentAll[] = "par.first-line-indent.all";
inline constexpr const char kParHangingIndent[] = "par.hanging-indent";
inline constexpr const char kParLeading[] = "par.leading";
inline constexpr const char kParSpacing[] = "par.spacing";
inline constexpr const char kParLineNumbering[] = "par.line-numbering";

inline constexpr const char kAlignment[] = "align.alignment";

// Set on the body of a tight list item.
inline constexpr const char kListTightBody[] = "list.tight-body";

// page: width/height (float pt, absent = paper, infinity = fit content),
// flipped (bool), per-side margins (Rel), two-sided (bool), binding
// ("left" | "right"), fill (string), numbering (string), number alignment
// (Alignment), marginals (Content), header ascent / footer descent (Rel)
inline constexpr const char kPageWidth[] = "page.width";
inline constexpr const char kPageHeight[] = "page.height";
inline constexpr const char kPageFlipped[] = "page.flipped";
inline constexpr const char kPageMarginLeft[] = "page.margin.left";
inline constexpr const char kPageMarginTop[] = "page.margin.top";
inline constexpr const char kPageMarginRight[] = "page.margin.right";
inline constexpr const char kPageMarginBottom[] = "page.margin.bottom";
inline constexpr const char kPageTwoSided[] = "page.margin.two-sided";
inline constexpr const char kPageBinding[] = "page.binding";
inline constexpr const char kPageFill[] = "page.fill";
inline constexpr const char kPageNumbering[] = "page.numbering";
inline constexpr const char kPageNumberAlign[] = "page.number-align";
inline constexpr const char kPageHeader[] = "page.header";
inline constexpr const char kPageFooter[] = "page.footer";
inline constexpr const char kPageBackground[] = "page.background";
inline constexpr const char kPageForeground[] = "page.foreground";
inline constexpr const char kPageHeaderAscent[] = "page.header-ascent";
inline constexpr const char kPageFooterDescent[] = "page.footer-descent";

} // namespace folio::style::props
