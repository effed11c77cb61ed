#pragma once
#include <folio/core/config.h>
#include <folio/layout/geometry.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace folio::layout {
struct Content;
}

namespace folio::style {

// Penalty weights for line breaking and for widows/orphans, as ratios of the
// standard penalty. Zero disables a rule.
struct Costs {
    float hyphenation = core::config::kDefaultCostRatio;
    float runt = core::config::kDefaultCostRatio;
    float widow = core::config::kDefaultCostRatio;
    float orphan = core::config::kDefaultCostRatio;

    bool operator==(const Costs& o) const = default;
};

using ContentRef = std::shared_ptr<const layout::Content>;

// Monostate stands for an explicit `none`.
using StyleValue = std::variant<std::monostate, bool, float, std::string, layout::Rel,
                                layout::Dir, layout::Alignment, Costs, ContentRef>;

// One property override.
struct Style {
    std::string property;
    StyleValue value;
    // False when the style was produced inside show-rule output that did not
    // break free to the page level.
    bool outside = true;
    // True for set-rule styles, false for one-off constructor arguments.
    bool liftable = true;

    bool operator==(const Style& o) const;
};

using StylePtr = std::shared_ptr<const Style>;
using Styles = std::vector<StylePtr>;

// A set rule: liftable and outside.
StylePtr set_rule(std::string property, StyleValue value);
// A direct constructor argument, e.g. text(red)[..]: not liftable.
StylePtr constructor_style(std::string property, StyleValue value);
// A style produced within show-rule output.
StylePtr show_rule_style(std::string property, StyleValue value, bool liftable = true);

// An ordered list of style overrides from outermost to innermost scope.
// Chains are values; chaining returns a new chain.
class StyleChain {
public:
    StyleChain() = default;
    explicit StyleChain(Styles entries) : entries_(std::move(entries)) {}

    StyleChain chain(const Styles& inner) const;
    StyleChain chain(StylePtr inner) const;

    const Styles& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Innermost value for a property.
    const StyleValue* find(std::string_view property) const;

    template <typename T>
    std::optional<T> get(std::string_view property) const {
        const StyleValue* value = find(property);
        if (!value) return std::nullopt;
        if (const T* typed = std::get_if<T>(value)) return *typed;
        return std::nullopt;
    }

    template <typename T>
    T get_or(std::string_view property, T fallback) const {
        return get<T>(property).value_or(std::move(fallback));
    }

    // Whether the innermost value for the property is an explicit `none`.
    bool is_none(std::string_view property) const;

    // Longest common prefix of all chains, or nothing for an empty input.
    static std::optional<StyleChain> trunk(const std::vector<StyleChain>& chains);

    // Length of the common prefix of two chains.
    static std::size_t common_prefix(const StyleChain& a, const StyleChain& b);

    bool operator==(const StyleChain& other) const;

private:
    Styles entries_;
};

} // namespace folio::style
