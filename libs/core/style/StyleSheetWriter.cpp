#include "StyleSheetWriter.hpp"

namespace veneer {

std::string StyleSheetWriter::writeRule(const StyleRule& rule, const WriterOptions& options) {
    std::string out;

    // A selector-less rule is a bare declaration list
    if (rule.selectors.empty()) {
        for (size_t i = 0; i < rule.declarations.size(); ++i) {
            if (i > 0) out += options.compact ? " " : "\n";
            out += rule.declarations[i].property + ": " + rule.declarations[i].value + ";";
        }
        return out;
    }

    const bool splitGroup = options.groupPerLine && !options.compact;
    for (size_t i = 0; i < rule.selectors.size(); ++i) {
        if (i > 0) out += splitGroup ? ",\n" : ", ";
        out += rule.selectors[i].text();
    }

    if (options.compact) {
        out += " {";
        for (const auto& decl : rule.declarations) {
            out += ' ' + decl.property + ": " + decl.value + ';';
        }
        out += rule.declarations.empty() ? "}" : " }";
        return out;
    }

    const std::string pad(static_cast<size_t>(options.indent > 0 ? options.indent : 0), ' ');
    out += " {\n";
    for (const auto& decl : rule.declarations) {
        out += pad + decl.property + ": " + decl.value + ";\n";
    }
    out += "}";
    return out;
}

std::string StyleSheetWriter::write(const StyleSheet& sheet, const WriterOptions& options) {
    std::string out;
    const char* separator = options.compact ? "\n" : "\n\n";
    for (size_t i = 0; i < sheet.rules().size(); ++i) {
        if (i > 0) out += separator;
        out += writeRule(sheet.rules()[i], options);
    }
    if (!out.empty()) out += '\n';
    return out;
}

} // namespace veneer
