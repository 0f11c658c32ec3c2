#pragma once

#include "ITheme.hpp"
#include "validation/ThemeValidator.hpp"
#include <QApplication>
#include <QString>
#include <QStringList>
#include <map>
#include <memory>
#include <optional>

namespace veneer {

/**
 * Manages application themes.
 * Coordinates theme registration, placeholder substitution, validation and
 * switching. Selector matching and cascade stay with Qt's style engine.
 */
class ThemeManager {
public:
    /**
     * Get the singleton instance.
     */
    static ThemeManager& instance();

    /**
     * Register a theme with the manager.
     */
    void registerTheme(std::unique_ptr<ITheme> theme);

    /**
     * Register the theme a manifest describes. Returns false (and logs) on a
     * bad manifest or unreadable stylesheet.
     */
    bool loadTheme(const QString& manifestPath);

    /**
     * Remove a theme. The current theme id is cleared if it was this one.
     */
    bool unregisterTheme(const QString& themeId);

    /**
     * Apply a theme by ID to the application.
     * In strict mode a theme that fails validation is not applied.
     */
    bool applyTheme(const QString& themeId, QApplication* app);

    /**
     * Stylesheet text ready for setStyleSheet(): placeholder substituted.
     */
    std::optional<QString> render(const QString& themeId) const;

    /**
     * Run the asset-integrity checks on a registered theme.
     */
    std::optional<ValidationReport> validate(const QString& themeId,
                                             const ValidatorOptions& options = {}) const;

    /**
     * Get list of available theme IDs.
     */
    QStringList availableThemes() const;

    /**
     * Get theme name by ID.
     */
    QString themeName(const QString& themeId) const;

    const ITheme* theme(const QString& themeId) const;

    /**
     * Get the current active theme ID.
     */
    QString currentTheme() const { return m_currentTheme; }

    /**
     * Report produced by the last applyTheme() call.
     */
    const std::optional<ValidationReport>& lastReport() const { return m_lastReport; }

    /**
     * Icon directory used instead of every theme's own. Empty to disable.
     */
    void setAssetsDirOverride(const QString& dir) { m_assetsOverride = dir; }
    QString assetsDirOverride() const { return m_assetsOverride; }

    void setStrict(bool strict) { m_strict = strict; }
    bool strict() const { return m_strict; }

    /**
     * Initialize default themes.
     * Registers the built-in themes shipped as Qt resources.
     */
    void initializeDefaults();

private:
    ThemeManager() = default;
    ~ThemeManager() = default;
    ThemeManager(const ThemeManager&) = delete;
    ThemeManager& operator=(const ThemeManager&) = delete;

    AssetResolver resolverFor(const ITheme& theme) const;

    std::map<QString, std::unique_ptr<ITheme>> m_themes;
    QString m_currentTheme;
    QString m_assetsOverride;
    bool m_strict = false;
    std::optional<ValidationReport> m_lastReport;
};

} // namespace veneer
