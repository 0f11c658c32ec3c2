#pragma once

#include <QString>

namespace veneer {

/**
 * Persisted theme preferences.
 * Uses QSettings with versioning so stale values are ignored across app versions.
 */
class ThemeSettings {
public:
    static constexpr int SETTINGS_VERSION = 1;  // Increment on breaking changes

    /**
     * Theme id to apply at startup. VENEER_THEME overrides the stored value.
     */
    static QString currentTheme();
    static void setCurrentTheme(const QString& themeId);

    /**
     * Directory holding a user-installed icon set, used in place of the
     * theme's own assets. Empty when unset.
     */
    static QString assetsDirOverride();
    static void setAssetsDirOverride(const QString& dir);

    /**
     * Refuse to apply a theme that fails validation.
     */
    static bool strict();
    static void setStrict(bool strict);

    /**
     * Forget every stored preference.
     */
    static void reset();

    static QString defaultThemeId() { return QString("dark"); }
};

} // namespace veneer
