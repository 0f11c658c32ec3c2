/*
Veneer — veneer-lint
Role: Asset-integrity checks for theme stylesheets and manifests.
Exit status: 0 all inputs pass, 1 a check failed, 2 usage or configuration error.
*/
#include "Log.hpp"
#include "assets/AssetResolver.hpp"
#include "config/ThemeManifest.hpp"
#include "style/StyleSheetParser.hpp"
#include "style/StyleSheetWriter.hpp"
#include "validation/ThemeValidator.hpp"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QFileInfo>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

using namespace veneer;

namespace {

constexpr int kExitPassed = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

struct LintInput {
    QString displayName;
    QString stylesheetPath;
    QString assetsDir;
    QString placeholder;
};

std::optional<std::string> readFile(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        LOG_E("lint", "cannot read {}: {}", path.toStdString(), file.errorString().toStdString());
        return std::nullopt;
    }
    return file.readAll().toStdString();
}

// A manifest brings its own stylesheet, icons and placeholder;
// command line options still win.
std::optional<LintInput> resolveInput(const QString& path, const QString& assetsDir, const QString& placeholder) {
    LintInput input;
    input.displayName = path;
    input.stylesheetPath = path;
    input.assetsDir = assetsDir;
    input.placeholder = placeholder;

    if (path.endsWith(".json")) {
        try {
            const ThemeManifest manifest = ThemeManifest::load(path);
            input.stylesheetPath = manifest.stylesheetPath;
            if (input.assetsDir.isEmpty()) input.assetsDir = manifest.assetsDir;
            if (input.placeholder.isEmpty()) input.placeholder = manifest.placeholder;
            LOG_D("lint", "{} -> theme '{}' ({})", path.toStdString(), manifest.id.toStdString(),
                  manifest.stylesheetPath.toStdString());
        } catch (const ThemeConfigError& e) {
            LOG_E("lint", "{}", e.what());
            return std::nullopt;
        }
    }
    return input;
}

void printReport(const ValidationReport& report) {
    for (const auto& issue : report.issues) {
        const char* severity = issue.severity == Severity::Error ? "error" : "warning";
        if (issue.selector.empty()) {
            fmt::print("{}:{}: {}: [{}] {}\n", report.source, issue.line, severity,
                       toString(issue.kind), issue.message);
        } else {
            fmt::print("{}:{}: {}: [{}] {} ({})\n", report.source, issue.line, severity,
                       toString(issue.kind), issue.message, issue.selector);
        }
    }
    fmt::print("{}: {} - {} rules, {} urls, {} colors, {} errors, {} warnings\n",
               report.source, report.passed() ? "passed" : "FAILED",
               report.ruleCount, report.urlCount, report.colorCount,
               report.errorCount(), report.warningCount());
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("veneer-lint");

    QCommandLineParser parser;
    parser.setApplicationDescription("Check Qt style sheet themes: grammar, icon references, "
                                     "hex colors and write/parse round trip.");
    parser.addHelpOption();
    parser.addPositionalArgument("files", "Stylesheets (.qss) or theme manifests (.json).", "files...");
    QCommandLineOption assetsOption({"a", "assets-dir"}, "Directory the placeholder stands for.", "dir");
    QCommandLineOption placeholderOption({"p", "placeholder"}, "Asset-directory placeholder token.", "token");
    QCommandLineOption noAssetsOption("no-assets", "Skip icon and placeholder checks.");
    QCommandLineOption shortHexOption("allow-short-hex", "Accept every hex form QColor parses.");
    QCommandLineOption noVocabularyOption("no-vocabulary", "Skip unknown property/state/sub-control warnings.");
    QCommandLineOption jsonOption("json", "Print reports as JSON.");
    QCommandLineOption formatOption("format", "Print the canonical serialization instead of checking.");
    QCommandLineOption werrorOption("werror", "Treat warnings as failures.");
    parser.addOptions({assetsOption, placeholderOption, noAssetsOption, shortHexOption,
                       noVocabularyOption, jsonOption, formatOption, werrorOption});
    parser.process(app);

    const QStringList files = parser.positionalArguments();
    if (files.isEmpty()) {
        LOG_E("lint", "no input files");
        parser.showHelp(kExitUsage);
    }

    ValidatorOptions options;
    options.checkAssets = !parser.isSet(noAssetsOption);
    options.allowShortHex = parser.isSet(shortHexOption);
    options.checkVocabulary = !parser.isSet(noVocabularyOption);

    int status = kExitPassed;
    nlohmann::json jsonReports = nlohmann::json::array();

    for (const QString& file : files) {
        const auto input = resolveInput(file, parser.value(assetsOption), parser.value(placeholderOption));
        if (!input) return kExitUsage;
        const auto source = readFile(input->stylesheetPath);
        if (!source) return kExitUsage;

        if (parser.isSet(formatOption)) {
            // Placeholders stay in place so the output can replace the source file
            const ParseResult parsed = StyleSheetParser::parse(*source);
            for (const auto& diag : parsed.diagnostics) {
                LOG_W("format", "{}:{}:{}: {}", input->displayName.toStdString(), diag.line, diag.column, diag.message);
            }
            fmt::print("{}", StyleSheetWriter::write(parsed.sheet));
            if (!parsed.ok()) status = kExitFailed;
            continue;
        }

        const AssetResolver resolver(input->assetsDir, input->placeholder,
                                     QFileInfo(input->stylesheetPath).path());
        const ValidationReport report = ThemeValidator::validate(*source, resolver, options,
                                                                 input->displayName.toStdString());
        const bool failed = !report.passed() || (parser.isSet(werrorOption) && report.warningCount() > 0);
        if (failed) status = kExitFailed;

        if (parser.isSet(jsonOption)) {
            jsonReports.push_back(report.toJson());
        } else {
            printReport(report);
        }
    }

    if (parser.isSet(jsonOption) && !parser.isSet(formatOption)) {
        fmt::print("{}\n", jsonReports.size() == 1 ? jsonReports[0].dump(2) : jsonReports.dump(2));
    }
    return status;
}
