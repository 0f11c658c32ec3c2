#pragma once

#include "StyleRule.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace veneer {

enum class Severity { Warning, Error };

struct Diagnostic {
    Severity severity = Severity::Error;
    int line = 0;
    int column = 0;
    std::string message;
};

/**
 * Rules that parsed cleanly plus everything that was skipped on the way.
 * A malformed rule never reaches `sheet`; the rest of the input still does.
 */
struct ParseResult {
    StyleSheet sheet;
    std::vector<Diagnostic> diagnostics;

    bool ok() const { return errorCount() == 0; }
    size_t errorCount() const;
};

/**
 * Qt style sheet grammar: `Selector[:state][::sub-control] { property: value; }`
 * blocks, comma groups, descendant and child combinators, `#objectName`,
 * `[attribute="value"]`, `:!state`, comments, strings and `url(...)` values.
 *
 * Recovery follows the style engine: a bad selector drops its block, a bad
 * declaration drops itself. A string cut off by a line break ends there and
 * takes only its declaration with it. A block left open ends where the next
 * rule's '{' shows up, and that rule still parses. Nothing throws.
 */
class StyleSheetParser {
public:
    static ParseResult parse(std::string_view text);

    /**
     * The brace-less form a single widget takes, e.g. "color: red; border: none".
     * Produces at most one rule, with no selectors.
     */
    static ParseResult parseDeclarations(std::string_view text);

    /**
     * Parse a single selector group ("QMenu::item:selected, QMenu::separator").
     * Returns false and appends a diagnostic on malformed input.
     */
    static bool parseSelectorGroup(std::string_view text, std::vector<Selector>& out,
                                   std::vector<Diagnostic>& diagnostics,
                                   int line = 1, int column = 1);
};

} // namespace veneer
