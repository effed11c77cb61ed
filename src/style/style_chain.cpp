#include <folio/style/style_chain.h>

#include <algorithm>

namespace folio::style {

bool Style::operator==(const Style& o) const {
    return property == o.property && value == o.value && outside == o.outside &&
           liftable == o.liftable;
}

StylePtr set_rule(std::string property, StyleValue value) {
    return std::make_shared<const Style>(Style{std::move(property), std::move(value), true, true});
}

StylePtr constructor_style(std::string property, StyleValue value) {
    return std::make_shared<const Style>(Style{std::move(property), std::move(value), true, false});
}

StylePtr show_rule_style(std::string property, StyleValue value, bool liftable) {
    return std::make_shared<const Style>(
        Style{std::move(property), std::move(value), false, liftable});
}

StyleChain StyleChain::chain(const Styles& inner) const {
    Styles entries = entries_;
    entries.insert(entries.end(), inner.begin(), inner.end());
    return StyleChain(std::move(entries));
}

StyleChain StyleChain::chain(StylePtr inner) const {
    Styles entries = entries_;
    entries.push_back(std::move(inner));
    return StyleChain(std::move(entries));
}

const StyleValue* StyleChain::find(std::string_view property) const {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if ((*it)->property == property) return &(*it)->value;
    }
    return nullptr;
}

bool StyleChain::is_none(std::string_view property) const {
    const StyleValue* value = find(property);
    return value && std::holds_alternative<std::monostate>(*value);
}

namespace {

bool same_style(const StylePtr& a, const StylePtr& b) {
    return a == b || (a && b && *a == *b);
}

} // namespace

std::size_t StyleChain::common_prefix(const StyleChain& a, const StyleChain& b) {
    std::size_t len = std::min(a.entries_.size(), b.entries_.size());
    std::size_t i = 0;
    while (i < len && same_style(a.entries_[i], b.entries_[i])) ++i;
    return i;
}

std::optional<StyleChain> StyleChain::trunk(const std::vector<StyleChain>& chains) {
    if (chains.empty()) return std::nullopt;
    std::size_t len = chains.front().entries_.size();
    for (std::size_t i = 1; i < chains.size(); ++i) {
        len = std::min(len, common_prefix(chains.front(), chains[i]));
    }
    Styles entries(chains.front().entries_.begin(),
                   chains.front().entries_.begin() + static_cast<std::ptrdiff_t>(len));
    return StyleChain(std::move(entries));
}

bool StyleChain::operator==(const StyleChain& other) const {
    return entries_.size() == other.entries_.size() &&
           common_prefix(*this, other) == entries_.size();
}

} // namespace folio::style
