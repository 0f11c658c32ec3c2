#pragma once

#include <QString>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace veneer {

/**
 * A theme manifest or settings value that cannot be used.
 */
class ThemeConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * JSON description of one theme:
 *
 *   {
 *     "id": "dark",
 *     "name": "Dark",
 *     "description": "...",
 *     "stylesheet": "dark.qss",
 *     "assets_dir": "../icons",
 *     "placeholder": "%ASSETS_DIR%"
 *   }
 *
 * `id` and `stylesheet` are required. Paths are relative to the manifest.
 */
struct ThemeManifest {
    QString id;
    QString name;
    QString description;
    QString stylesheetPath;   // absolute
    QString assetsDir;        // absolute, empty when the theme has no icons
    QString placeholder;
    QString manifestPath;

    /**
     * Read and check a manifest file (Qt resource paths allowed).
     * Throws ThemeConfigError.
     */
    static ThemeManifest load(const QString& path);

    /**
     * Build from already-parsed JSON; `baseDir` anchors relative paths and
     * `origin` names the source in error messages. Throws ThemeConfigError.
     */
    static ThemeManifest fromJson(const nlohmann::json& json, const QString& baseDir,
                                  const QString& origin = QString());
};

} // namespace veneer
