#include "StyleRule.hpp"

namespace veneer {

std::string SelectorPart::text() const {
    std::string out;
    if (exactType) out += '.';
    out += typeName;
    if (!objectName.empty()) {
        out += '#';
        out += objectName;
    }
    for (const auto& attr : attributes) {
        out += '[';
        out += attr;
        out += ']';
    }
    if (!subControl.empty()) {
        out += "::";
        out += subControl;
    }
    for (const auto& state : pseudoStates) {
        out += state.negated ? ":!" : ":";
        out += state.name;
    }
    return out;
}

std::string Selector::text() const {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += combinators[i - 1] == Combinator::Child ? " > " : " ";
        }
        out += parts[i].text();
    }
    return out;
}

std::optional<std::string> StyleRule::value(std::string_view property) const {
    for (auto it = declarations.rbegin(); it != declarations.rend(); ++it) {
        if (it->property == property) return it->value;
    }
    return std::nullopt;
}

std::string StyleRule::selectorText() const {
    std::string out;
    for (size_t i = 0; i < selectors.size(); ++i) {
        if (i > 0) out += ", ";
        out += selectors[i].text();
    }
    return out;
}

SelectorMap StyleSheet::selectorMap() const {
    SelectorMap map;
    for (const auto& rule : m_rules) {
        if (rule.selectors.empty()) {
            // Brace-less declarations apply to the widget that owns the sheet
            auto& props = map[std::string()];
            for (const auto& decl : rule.declarations) props[decl.property] = decl.value;
            continue;
        }
        for (const auto& selector : rule.selectors) {
            auto& props = map[selector.text()];
            for (const auto& decl : rule.declarations) props[decl.property] = decl.value;
        }
    }
    return map;
}

std::vector<const StyleRule*> StyleSheet::rulesFor(std::string_view selectorText) const {
    std::vector<const StyleRule*> out;
    for (const auto& rule : m_rules) {
        for (const auto& selector : rule.selectors) {
            if (selector.text() == selectorText) {
                out.push_back(&rule);
                break;
            }
        }
    }
    return out;
}

bool semanticallyEquivalent(const StyleSheet& a, const StyleSheet& b) {
    return a.selectorMap() == b.selectorMap();
}

} // namespace veneer
