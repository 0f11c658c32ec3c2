#include "FileTheme.hpp"
#include "VeneerLogging.hpp"

#include <QFile>
#include <QFileInfo>

namespace veneer {

FileTheme::FileTheme(ThemeManifest manifest)
    : m_manifest(std::move(manifest))
{
    QFile file(m_manifest.stylesheetPath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        throw ThemeConfigError(m_manifest.stylesheetPath.toStdString() + ": cannot read stylesheet for theme '"
                               + m_manifest.id.toStdString() + "' (" + file.errorString().toStdString() + ")");
    }
    m_stylesheet = QString::fromUtf8(file.readAll());
    vLog_App("FileTheme:" << m_manifest.id << "read" << m_stylesheet.size() << "chars from"
             << m_manifest.stylesheetPath);
}

std::unique_ptr<FileTheme> FileTheme::fromManifest(const QString& manifestPath) {
    return std::make_unique<FileTheme>(ThemeManifest::load(manifestPath));
}

QString FileTheme::baseDirectory() const {
    return QFileInfo(m_manifest.stylesheetPath).path();
}

} // namespace veneer
