#pragma once

#include "assets/AssetResolver.hpp"
#include "style/StyleSheetParser.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace veneer {

enum class IssueKind {
    ParseError,
    MissingAsset,
    UnresolvedPlaceholder,
    InvalidColor,
    RoundTripMismatch,
    UnknownProperty,
    UnknownPseudoState,
    UnknownSubControl,
    DuplicateProperty,
    EmptyRule
};

const char* toString(IssueKind kind);

struct Issue {
    IssueKind kind = IssueKind::ParseError;
    Severity severity = Severity::Error;
    int line = 0;
    std::string selector;
    std::string message;
};

struct ValidatorOptions {
    bool checkAssets = true;       // url(...) targets must exist, no placeholder left
    bool checkColors = true;       // hex literals must be #RRGGBB
    bool allowShortHex = false;    // accept every form QColor parses instead
    bool checkVocabulary = true;   // warn on unknown properties, states, sub-controls
    bool checkRoundTrip = true;    // write + re-parse must give the same rule set
};

struct ValidationReport {
    std::string source;
    std::vector<Issue> issues;
    size_t ruleCount = 0;
    size_t urlCount = 0;
    size_t colorCount = 0;

    bool passed() const { return errorCount() == 0; }
    size_t errorCount() const;
    size_t warningCount() const;
    std::vector<const Issue*> issuesOf(IssueKind kind) const;

    nlohmann::json toJson() const;
};

/**
 * Asset-integrity checks over a theme's stylesheet text: it parses, every
 * url(...) resolves once the placeholder is substituted, every hex color is
 * well formed, and the rule set survives a write/parse round trip.
 */
class ThemeValidator {
public:
    static ValidationReport validate(std::string_view stylesheet,
                                     const AssetResolver& resolver,
                                     const ValidatorOptions& options = {},
                                     std::string sourceName = {});
};

} // namespace veneer
