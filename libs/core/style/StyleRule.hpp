#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace veneer {

/**
 * A pseudo-state qualifier such as `:hover` or `:!enabled`.
 */
struct PseudoState {
    std::string name;
    bool negated = false;

    bool operator==(const PseudoState&) const = default;
};

/**
 * One compound selector: `QScrollBar::handle:vertical:hover`,
 * `QPushButton#okButton[flat="true"]`, `*`, `.QWidget`.
 */
struct SelectorPart {
    std::string typeName;                 // widget class, "*" or empty
    bool exactType = false;               // leading '.' (no subclasses)
    std::string objectName;               // without the '#'
    std::vector<std::string> attributes;  // bracket contents, e.g. flat="true"
    std::string subControl;               // without the "::"
    std::vector<PseudoState> pseudoStates;

    std::string text() const;
    bool operator==(const SelectorPart&) const = default;
};

enum class Combinator {
    Descendant,  // whitespace
    Child        // '>'
};

/**
 * A complex selector: compound parts joined by combinators.
 * combinators.size() == parts.size() - 1 for any non-empty selector.
 */
struct Selector {
    std::vector<SelectorPart> parts;
    std::vector<Combinator> combinators;

    /**
     * Canonical text, e.g. "QComboBox QAbstractItemView" or "QMenu::item:selected".
     * Within each part the sub-control is written before the pseudo-states, so
     * "QComboBox:editable::drop-down" comes out as "QComboBox::drop-down:editable"
     * (Qt reads both the same way).
     */
    std::string text() const;

    /**
     * The part the declarations actually apply to.
     */
    const SelectorPart& subject() const { return parts.back(); }

    bool empty() const { return parts.empty(); }
    bool operator==(const Selector&) const = default;
};

struct Declaration {
    std::string property;  // lower-case
    std::string value;     // whitespace-collapsed literal
    int line = 0;

    // Line numbers are source bookkeeping, not part of the rule's meaning.
    bool operator==(const Declaration& other) const {
        return property == other.property && value == other.value;
    }
};

/**
 * A selector group mapped to an ordered list of property assignments.
 * A rule with no selectors is the brace-less form a single widget accepts.
 */
struct StyleRule {
    std::vector<Selector> selectors;
    std::vector<Declaration> declarations;
    int line = 0;

    /**
     * Last value assigned to a property in this rule.
     */
    std::optional<std::string> value(std::string_view property) const;

    /**
     * Selector group as written in a stylesheet: "QScrollBar::add-line, QScrollBar::sub-line".
     */
    std::string selectorText() const;

    bool operator==(const StyleRule& other) const {
        return selectors == other.selectors && declarations == other.declarations;
    }
};

using PropertyMap = std::map<std::string, std::string>;
using SelectorMap = std::map<std::string, PropertyMap>;

/**
 * Ordered rule set. Order is cascade order; matching and precedence belong
 * to the toolkit's style engine.
 */
class StyleSheet {
public:
    StyleSheet() = default;
    explicit StyleSheet(std::vector<StyleRule> rules) : m_rules(std::move(rules)) {}

    const std::vector<StyleRule>& rules() const { return m_rules; }
    void addRule(StyleRule rule) { m_rules.push_back(std::move(rule)); }

    size_t size() const { return m_rules.size(); }
    bool empty() const { return m_rules.empty(); }

    /**
     * Flatten to selector text -> (property -> value). Later declarations and
     * later rules override earlier ones for the same selector text; comma
     * groups contribute to every selector they list.
     */
    SelectorMap selectorMap() const;

    /**
     * Rules whose selector group lists exactly this selector text.
     */
    std::vector<const StyleRule*> rulesFor(std::string_view selectorText) const;

    bool operator==(const StyleSheet&) const = default;

private:
    std::vector<StyleRule> m_rules;
};

/**
 * Same selector -> property-map associations, formatting ignored.
 */
bool semanticallyEquivalent(const StyleSheet& a, const StyleSheet& b);

} // namespace veneer
