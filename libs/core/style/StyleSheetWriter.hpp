#pragma once

#include "StyleRule.hpp"
#include <string>

namespace veneer {

struct WriterOptions {
    bool compact = false;        // one rule per line
    int indent = 4;
    bool groupPerLine = true;    // each selector of a comma group on its own line
};

/**
 * Canonical serialization of a rule set. Parsing the output yields a sheet
 * semantically equivalent to the input; formatting of the original is lost.
 */
class StyleSheetWriter {
public:
    static std::string write(const StyleSheet& sheet, const WriterOptions& options = {});
    static std::string writeRule(const StyleRule& rule, const WriterOptions& options = {});
};

} // namespace veneer
