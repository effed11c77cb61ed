#include <folio/layout/line_breaker.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>

namespace folio::layout {

namespace {

// Cost of a line that is wider than its available width.
constexpr double kOverfullCost = 1e8;
// Largest adjustment ratio considered; sparser lines cost the same.
constexpr double kMaxRatio = 10.0;
// Cost of a last line holding a single word, scaled by the runt cost ratio.
constexpr double kRuntCost = 500.0;

constexpr std::size_t kNoBreak = std::numeric_limits<std::size_t>::max();

bool ends_with_linebreak(const Preparation& p, std::size_t end) {
    return end > 0 && p.items[end - 1].kind == InlineItemKind::Linebreak;
}

std::size_t count_words(const Preparation& p, std::size_t start, std::size_t end) {
    std::size_t words = 0;
    for (std::size_t i = start; i < end; ++i) {
        if (p.items[i].kind == InlineItemKind::Word) ++words;
    }
    return words;
}

double line_cost(const Preparation& p, std::size_t start, std::size_t end, float natural,
                 float available, bool last) {
    if (!fits(available, natural)) return kOverfullCost;

    double gap = available - natural;
    double ratio = 0;
    if (last) {
        ratio = 0;
    } else if (p.config.justify) {
        double stretch = 0;
        std::size_t stop = trimmed_end(p, start, end);
        for (std::size_t i = start; i < stop; ++i) {
            if (p.items[i].kind == InlineItemKind::Space) {
                stretch += p.items[i].width * core::config::kMaxJustifyStretch;
            }
        }
        if (stretch > 0) {
            ratio = std::min(gap / stretch, kMaxRatio);
        } else if (gap > kLengthEpsilon) {
            ratio = kMaxRatio;
        }
    } else if (available > 0 && std::isfinite(available)) {
        ratio = gap / available;
    }

    double badness = 1.0 + 100.0 * std::pow(std::abs(ratio), 3.0);
    return badness * badness;
}

} // namespace

float available_for_line(const AvailableWidthFn& available, float y, float height) {
    float bottom = y + std::max(height - kLengthEpsilon, 0.0f);
    return std::min(available(y), available(bottom));
}

std::vector<Line> DefaultLineBreaker::break_lines(const Preparation& p, Linebreaks mode,
                                                  const AvailableWidthFn& available) const {
    if (p.items.empty()) return {};
    if (mode == Linebreaks::Optimized) {
        return break_optimized(p, available);
    }
    return break_simple(p, available);
}

std::vector<Line> DefaultLineBreaker::break_simple(const Preparation& p,
                                                   const AvailableWidthFn& available) const {
    std::vector<Line> lines;
    std::size_t n = p.items.size();
    std::size_t start = 0;
    float y = 0;

    while (start < n) {
        float avail = available_for_line(available, y, p.config.font_size);
        Line line;
        line.start = start;
        line.end = n;
        line.mandatory = true;
        line.y = y;

        float width = 0;
        std::optional<std::size_t> last_break;
        bool overflow = false;
        for (std::size_t i = start; i < n; ++i) {
            const InlineItem& item = p.items[i];
            if (item.kind == InlineItemKind::Linebreak) {
                line.end = i + 1;
                break;
            }
            width += item.width;
            float natural = item.kind == InlineItemKind::Space ? width - item.width : width;
            if (!fits(avail, natural)) {
                if (last_break) {
                    line.end = *last_break + 1;
                    line.mandatory = false;
                    break;
                }
                // A single unbreakable run wider than the line: end it at
                // the first opportunity.
                overflow = true;
            }
            if (item.break_after && i + 1 < n) {
                if (overflow) {
                    line.end = i + 1;
                    line.mandatory = false;
                    break;
                }
                last_break = i;
            }
        }

        lines.push_back(line);
        y += line_height(p, line.start, line.end) + p.leading;
        start = line.end;
    }
    return lines;
}

std::vector<Line> DefaultLineBreaker::break_optimized(const Preparation& p,
                                                      const AvailableWidthFn& available) const {
    std::size_t n = p.items.size();

    // Candidate line ends, as exclusive item indices.
    std::vector<std::size_t> ends;
    for (std::size_t i = 0; i + 1 < n; ++i) {
        if (p.items[i].break_after || p.items[i].kind == InlineItemKind::Linebreak) {
            ends.push_back(i + 1);
        }
    }
    ends.push_back(n);

    struct Entry {
        double cost = 0;
        std::size_t prev = kNoBreak;
        float y = 0;
        bool reachable = false;
    };
    std::vector<Entry> best(n + 1);
    best[0].reachable = true;

    std::vector<std::size_t> starts;
    starts.push_back(0);
    starts.insert(starts.end(), ends.begin(), ends.end() - 1);

    for (std::size_t start : starts) {
        const Entry& from = best[start];
        if (!from.reachable) continue;
        float avail = available_for_line(available, from.y, p.config.font_size);

        auto first = std::upper_bound(ends.begin(), ends.end(), start);
        for (auto it = first; it != ends.end(); ++it) {
            std::size_t end = *it;
            bool forced = ends_with_linebreak(p, end);
            bool last = end == n || forced;
            float natural = natural_width(p, start, end);

            double total = from.cost + line_cost(p, start, end, natural, avail, last);
            if (end == n && start > 0 && count_words(p, start, end) == 1) {
                total += p.config.costs.runt * kRuntCost;
            }

            Entry& to = best[end];
            if (!to.reachable || total < to.cost) {
                to.cost = total;
                to.prev = start;
                to.y = from.y + line_height(p, start, end) + p.leading;
                to.reachable = true;
            }

            // Lines cannot run past a forced break, and longer lines only
            // get wider.
            if (forced || !fits(avail, natural)) break;
        }
    }

    std::vector<Line> lines;
    for (std::size_t end = n; end != 0 && best[end].prev != kNoBreak; end = best[end].prev) {
        std::size_t start = best[end].prev;
        Line line;
        line.start = start;
        line.end = end;
        line.mandatory = end == n || ends_with_linebreak(p, end);
        line.y = best[start].y;
        lines.push_back(line);
    }
    std::reverse(lines.begin(), lines.end());
    return lines;
}

} // namespace folio::layout
