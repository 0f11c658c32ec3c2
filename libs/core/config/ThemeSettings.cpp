#include "ThemeSettings.hpp"
#include "VeneerLogging.hpp"

#include <QSettings>

namespace veneer {

namespace {

constexpr const char* kGroup = "theme";

// Opens the settings group, discarding values written by another version.
class ScopedThemeGroup {
public:
    ScopedThemeGroup() : m_settings("Veneer", "Veneer") {
        m_settings.beginGroup(kGroup);
        const int savedVersion = m_settings.value("version", ThemeSettings::SETTINGS_VERSION).toInt();
        if (savedVersion != ThemeSettings::SETTINGS_VERSION) {
            vLog_Warning("Theme settings version mismatch:" << savedVersion << "vs"
                         << ThemeSettings::SETTINGS_VERSION << "- discarding stored preferences");
            m_settings.remove(QString());
        }
    }

    ~ScopedThemeGroup() {
        m_settings.endGroup();
        m_settings.sync();
    }

    QSettings& settings() { return m_settings; }

    void write(const QString& key, const QVariant& value) {
        m_settings.setValue("version", ThemeSettings::SETTINGS_VERSION);
        m_settings.setValue(key, value);
    }

private:
    QSettings m_settings;
};

} // namespace

QString ThemeSettings::currentTheme() {
    const QByteArray env = qgetenv("VENEER_THEME");
    if (!env.isEmpty()) {
        return QString::fromLocal8Bit(env).trimmed();
    }
    ScopedThemeGroup group;
    return group.settings().value("current", defaultThemeId()).toString();
}

void ThemeSettings::setCurrentTheme(const QString& themeId) {
    ScopedThemeGroup group;
    group.write("current", themeId);
}

QString ThemeSettings::assetsDirOverride() {
    ScopedThemeGroup group;
    return group.settings().value("assetsDir").toString();
}

void ThemeSettings::setAssetsDirOverride(const QString& dir) {
    ScopedThemeGroup group;
    if (dir.isEmpty()) {
        group.settings().remove("assetsDir");
        return;
    }
    group.write("assetsDir", dir);
}

bool ThemeSettings::strict() {
    ScopedThemeGroup group;
    return group.settings().value("strict", false).toBool();
}

void ThemeSettings::setStrict(bool strict) {
    ScopedThemeGroup group;
    group.write("strict", strict);
}

void ThemeSettings::reset() {
    QSettings settings("Veneer", "Veneer");
    settings.remove(kGroup);
    settings.sync();
}

} // namespace veneer
