#include "ThemeValidator.hpp"
#include "VeneerLogging.hpp"
#include "style/StyleSheetWriter.hpp"
#include "style/StyleValues.hpp"

#include <algorithm>
#include <set>

namespace veneer {

const char* toString(IssueKind kind) {
    switch (kind) {
        case IssueKind::ParseError:            return "parse-error";
        case IssueKind::MissingAsset:          return "missing-asset";
        case IssueKind::UnresolvedPlaceholder: return "unresolved-placeholder";
        case IssueKind::InvalidColor:          return "invalid-color";
        case IssueKind::RoundTripMismatch:     return "round-trip-mismatch";
        case IssueKind::UnknownProperty:       return "unknown-property";
        case IssueKind::UnknownPseudoState:    return "unknown-pseudo-state";
        case IssueKind::UnknownSubControl:     return "unknown-sub-control";
        case IssueKind::DuplicateProperty:     return "duplicate-property";
        case IssueKind::EmptyRule:             return "empty-rule";
    }
    return "unknown";
}

size_t ValidationReport::errorCount() const {
    return static_cast<size_t>(std::count_if(issues.begin(), issues.end(),
        [](const Issue& i) { return i.severity == Severity::Error; }));
}

size_t ValidationReport::warningCount() const {
    return issues.size() - errorCount();
}

std::vector<const Issue*> ValidationReport::issuesOf(IssueKind kind) const {
    std::vector<const Issue*> out;
    for (const auto& issue : issues) {
        if (issue.kind == kind) out.push_back(&issue);
    }
    return out;
}

nlohmann::json ValidationReport::toJson() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& issue : issues) {
        list.push_back({
            {"kind", toString(issue.kind)},
            {"severity", issue.severity == Severity::Error ? "error" : "warning"},
            {"line", issue.line},
            {"selector", issue.selector},
            {"message", issue.message}
        });
    }
    return {
        {"source", source},
        {"passed", passed()},
        {"rules", ruleCount},
        {"urls", urlCount},
        {"colors", colorCount},
        {"errors", errorCount()},
        {"warnings", warningCount()},
        {"issues", std::move(list)}
    };
}

namespace {

void checkSelectors(const StyleRule& rule, ValidationReport& report) {
    for (const auto& selector : rule.selectors) {
        for (const auto& part : selector.parts) {
            if (!part.subControl.empty() && !StyleValues::isKnownSubControl(part.subControl)) {
                report.issues.push_back({IssueKind::UnknownSubControl, Severity::Warning, rule.line,
                                         selector.text(), "unknown sub-control \"::" + part.subControl + "\""});
            }
            for (const auto& state : part.pseudoStates) {
                if (!StyleValues::isKnownPseudoState(state.name)) {
                    report.issues.push_back({IssueKind::UnknownPseudoState, Severity::Warning, rule.line,
                                             selector.text(), "unknown pseudo-state \":" + state.name + "\""});
                }
            }
        }
    }
}

void checkDeclarations(const StyleRule& rule, const AssetResolver& resolver,
                       const ValidatorOptions& options, ValidationReport& report) {
    const std::string selector = rule.selectorText();
    std::set<std::string> seen;

    for (const auto& decl : rule.declarations) {
        if (options.checkVocabulary) {
            if (!StyleValues::isKnownProperty(decl.property)) {
                report.issues.push_back({IssueKind::UnknownProperty, Severity::Warning, decl.line,
                                         selector, "unknown property \"" + decl.property + "\""});
            }
            if (!seen.insert(decl.property).second) {
                report.issues.push_back({IssueKind::DuplicateProperty, Severity::Warning, decl.line,
                                         selector, "property \"" + decl.property + "\" set more than once"});
            }
        }

        const bool unresolved = options.checkAssets && resolver.containsPlaceholder(decl.value);
        if (unresolved) {
            report.issues.push_back({IssueKind::UnresolvedPlaceholder, Severity::Error, decl.line, selector,
                                     "placeholder " + resolver.placeholder().toStdString()
                                     + " left in \"" + decl.property + ": " + decl.value + "\""});
        }

        for (const auto& url : StyleValues::extractUrls(decl.value)) {
            ++report.urlCount;
            if (!options.checkAssets || unresolved) continue;
            if (!resolver.exists(QString::fromStdString(url))) {
                report.issues.push_back({IssueKind::MissingAsset, Severity::Error, decl.line, selector,
                                         "url(" + url + ") does not resolve to a file ("
                                         + resolver.resolve(QString::fromStdString(url)).toStdString() + ")"});
            }
        }

        for (const auto& color : StyleValues::extractHexColors(decl.value)) {
            ++report.colorCount;
            if (!options.checkColors) continue;
            const bool valid = options.allowShortHex ? StyleValues::isQtHexColor(color)
                                                     : StyleValues::isValidHexColor(color);
            if (!valid) {
                report.issues.push_back({IssueKind::InvalidColor, Severity::Error, decl.line, selector,
                                         "\"" + color + "\" in " + decl.property + " is not a "
                                         + (options.allowShortHex ? "hex color" : "6-digit hex color")});
            }
        }
    }
}

} // namespace

ValidationReport ThemeValidator::validate(std::string_view stylesheet,
                                          const AssetResolver& resolver,
                                          const ValidatorOptions& options,
                                          std::string sourceName) {
    ValidationReport report;
    report.source = std::move(sourceName);

    const std::string text = resolver.substitute(stylesheet);
    const ParseResult parsed = StyleSheetParser::parse(text);
    for (const auto& diag : parsed.diagnostics) {
        report.issues.push_back({IssueKind::ParseError, diag.severity, diag.line, std::string(),
                                 std::to_string(diag.line) + ":" + std::to_string(diag.column) + ": " + diag.message});
    }
    report.ruleCount = parsed.sheet.size();

    for (const auto& rule : parsed.sheet.rules()) {
        if (rule.declarations.empty()) {
            report.issues.push_back({IssueKind::EmptyRule, Severity::Warning, rule.line,
                                     rule.selectorText(), "rule has no declarations"});
        }
        if (options.checkVocabulary) checkSelectors(rule, report);
        checkDeclarations(rule, resolver, options, report);
    }

    if (options.checkRoundTrip) {
        const auto reparsed = StyleSheetParser::parse(StyleSheetWriter::write(parsed.sheet));
        if (!reparsed.ok() || !semanticallyEquivalent(parsed.sheet, reparsed.sheet)) {
            report.issues.push_back({IssueKind::RoundTripMismatch, Severity::Error, 0, std::string(),
                                     "re-serialized stylesheet does not parse to the same rule set"});
        }
    }

    std::stable_sort(report.issues.begin(), report.issues.end(),
                     [](const Issue& a, const Issue& b) { return a.line < b.line; });

    vLog_Style("Validated" << QString::fromStdString(report.source) << ":" << report.ruleCount << "rules,"
               << report.errorCount() << "errors," << report.warningCount() << "warnings");
    return report;
}

} // namespace veneer
