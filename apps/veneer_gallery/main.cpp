/*
Veneer — main.cpp
Role: Widget gallery previewing the bundled themes on every standard control.
*/
#include "widgets/WidgetGallery.hpp"
#include "VeneerLogging.hpp"
#include "config/ThemeSettings.hpp"
#include "themes/FileTheme.hpp"
#include "themes/ThemeManager.hpp"
#include <QApplication>
#include <QCommandLineParser>

using namespace veneer;

// --- Command line ---
struct GalleryOptions {
    QString themeId;
    QString assetsDir;
    bool strict = false;
};

GalleryOptions parseOptions(const QApplication& app) {
    QCommandLineParser parser;
    parser.setApplicationDescription("Preview Veneer themes on the standard Qt widgets.");
    parser.addHelpOption();
    QCommandLineOption themeOption({"t", "theme"}, "Theme id or path to a theme manifest.", "theme");
    QCommandLineOption assetsOption({"a", "assets-dir"}, "Icon directory replacing the theme's own.", "dir");
    QCommandLineOption strictOption("strict", "Do not apply a theme that fails validation.");
    parser.addOption(themeOption);
    parser.addOption(assetsOption);
    parser.addOption(strictOption);
    parser.process(app);

    GalleryOptions options;
    options.themeId = parser.isSet(themeOption) ? parser.value(themeOption) : ThemeSettings::currentTheme();
    options.assetsDir = parser.isSet(assetsOption) ? parser.value(assetsOption) : ThemeSettings::assetsDirOverride();
    options.strict = parser.isSet(strictOption) || ThemeSettings::strict();
    return options;
}

// --- Theme registration ---
QString registerThemes(const GalleryOptions& options) {
    auto& manager = ThemeManager::instance();
    manager.initializeDefaults();
    manager.setAssetsDirOverride(options.assetsDir);
    manager.setStrict(options.strict);

    // A manifest path registers that theme and selects it
    if (options.themeId.endsWith(".json")) {
        try {
            auto theme = FileTheme::fromManifest(options.themeId);
            const QString id = theme->id();
            manager.registerTheme(std::move(theme));
            return id;
        } catch (const ThemeConfigError& e) {
            vLog_Warning("Cannot load theme manifest:" << e.what());
            return ThemeSettings::defaultThemeId();
        }
    }
    return options.themeId;
}

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    QApplication::setApplicationName("veneer-gallery");
    vLog_App("[Veneer Widget Gallery Starting...]");

    const GalleryOptions options = parseOptions(app);
    const QString themeId = registerThemes(options);

    WidgetGallery window;
    if (!window.selectTheme(themeId)) {
        vLog_Warning("Falling back to" << ThemeSettings::defaultThemeId());
        if (!window.selectTheme(ThemeSettings::defaultThemeId())) {
            vLog_Error("No usable theme, running with the platform style");
        }
    }
    window.show();

    return app.exec();
}
