#include "ThemeManager.hpp"
#include "FileTheme.hpp"
#include "VeneerLogging.hpp"

// Resources compiled into a static library must be registered by hand
static void initVeneerResources() {
    Q_INIT_RESOURCE(veneer_themes);
}

namespace veneer {

ThemeManager& ThemeManager::instance() {
    static ThemeManager instance;
    return instance;
}

void ThemeManager::registerTheme(std::unique_ptr<ITheme> theme) {
    if (!theme) {
        vLog_Warning("ThemeManager: Attempted to register null theme");
        return;
    }

    QString id = theme->id();
    if (m_themes.find(id) != m_themes.end()) {
        vLog_Warning("ThemeManager: Theme" << id << "already registered, replacing");
    }

    m_themes[id] = std::move(theme);
    vLog_App("ThemeManager: Registered theme" << id << "-" << m_themes[id]->name());
}

bool ThemeManager::loadTheme(const QString& manifestPath) {
    try {
        registerTheme(FileTheme::fromManifest(manifestPath));
        return true;
    } catch (const ThemeConfigError& e) {
        vLog_Warning("ThemeManager: Cannot load theme:" << e.what());
        return false;
    }
}

bool ThemeManager::unregisterTheme(const QString& themeId) {
    auto it = m_themes.find(themeId);
    if (it == m_themes.end()) {
        return false;
    }
    m_themes.erase(it);
    if (m_currentTheme == themeId) {
        m_currentTheme.clear();
    }
    return true;
}

AssetResolver ThemeManager::resolverFor(const ITheme& theme) const {
    const QString assets = m_assetsOverride.isEmpty() ? theme.assetsDirectory() : m_assetsOverride;
    return AssetResolver(assets, theme.placeholder(), theme.baseDirectory());
}

std::optional<QString> ThemeManager::render(const QString& themeId) const {
    auto it = m_themes.find(themeId);
    if (it == m_themes.end()) {
        return std::nullopt;
    }
    return resolverFor(*it->second).substitute(it->second->stylesheet());
}

std::optional<ValidationReport> ThemeManager::validate(const QString& themeId,
                                                       const ValidatorOptions& options) const {
    auto it = m_themes.find(themeId);
    if (it == m_themes.end()) {
        return std::nullopt;
    }
    const QByteArray source = it->second->stylesheet().toUtf8();
    return ThemeValidator::validate(std::string_view(source.constData(), static_cast<size_t>(source.size())),
                                    resolverFor(*it->second), options, themeId.toStdString());
}

bool ThemeManager::applyTheme(const QString& themeId, QApplication* app) {
    if (!app) {
        vLog_Warning("ThemeManager: Cannot apply theme to null QApplication");
        return false;
    }

    auto it = m_themes.find(themeId);
    if (it == m_themes.end()) {
        vLog_Warning("ThemeManager: Theme" << themeId << "not found");
        return false;
    }

    m_lastReport = validate(themeId);
    if (!m_lastReport->passed()) {
        for (const auto& issue : m_lastReport->issues) {
            if (issue.severity != Severity::Error) continue;
            vLog_Warning("ThemeManager:" << themeId << "line" << issue.line << toString(issue.kind)
                         << QString::fromStdString(issue.message));
        }
        if (m_strict) {
            vLog_Error("ThemeManager: Refusing to apply" << themeId << "in strict mode:"
                       << m_lastReport->errorCount() << "errors");
            return false;
        }
    }

    app->setStyleSheet(*render(themeId));
    m_currentTheme = themeId;

    vLog_App("ThemeManager: Applied theme" << themeId << "-" << it->second->name());
    return true;
}

QStringList ThemeManager::availableThemes() const {
    QStringList themes;
    for (const auto& pair : m_themes) {
        themes << pair.first;
    }
    return themes;
}

QString ThemeManager::themeName(const QString& themeId) const {
    auto it = m_themes.find(themeId);
    if (it == m_themes.end()) {
        return QString();
    }
    return it->second->name();
}

const ITheme* ThemeManager::theme(const QString& themeId) const {
    auto it = m_themes.find(themeId);
    return it == m_themes.end() ? nullptr : it->second.get();
}

void ThemeManager::initializeDefaults() {
    initVeneerResources();

    // Built-in themes ship as resources next to their icons
    for (const char* manifest : {":/veneer/themes/dark.json", ":/veneer/themes/light.json"}) {
        if (!loadTheme(QString::fromLatin1(manifest))) {
            vLog_Error("ThemeManager: Built-in theme" << manifest << "failed to load");
        }
    }
}

} // namespace veneer
