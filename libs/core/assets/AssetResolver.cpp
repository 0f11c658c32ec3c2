#include "AssetResolver.hpp"
#include "VeneerLogging.hpp"

#include <QDir>
#include <QFileInfo>

namespace veneer {

namespace {

bool isResourcePath(const QString& path) {
    return path.startsWith(QLatin1Char(':'));
}

} // namespace

AssetResolver::AssetResolver(const QString& assetsDir, const QString& placeholder, const QString& baseDir)
    : m_assetsDir(assetsDir.isEmpty() ? QString() : absolutePath(assetsDir, baseDir))
    , m_placeholder(placeholder.isEmpty() ? QString::fromLatin1(kDefaultAssetsPlaceholder) : placeholder)
    , m_baseDir(baseDir.isEmpty() ? QDir::currentPath() : absolutePath(baseDir))
{
}

QString AssetResolver::absolutePath(const QString& path, const QString& baseDir) {
    QString out = QDir::fromNativeSeparators(path);
    if (out.startsWith(QLatin1String("qrc:"))) {
        out = out.mid(3);
    }
    if (!isResourcePath(out) && QDir::isRelativePath(out)) {
        const QDir base(baseDir.isEmpty() ? QDir::currentPath() : baseDir);
        out = base.absoluteFilePath(out);
    }
    return QDir::cleanPath(out);
}

QString AssetResolver::substitute(const QString& text) const {
    if (m_assetsDir.isEmpty()) {
        if (text.contains(m_placeholder)) {
            vLog_Warning("AssetResolver: no assets directory configured, leaving" << m_placeholder << "in place");
        }
        return text;
    }
    QString out = text;
    out.replace(m_placeholder, m_assetsDir);
    return out;
}

std::string AssetResolver::substitute(std::string_view text) const {
    const QString in = QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
    return substitute(in).toStdString();
}

bool AssetResolver::containsPlaceholder(std::string_view text) const {
    return text.find(m_placeholder.toStdString()) != std::string_view::npos;
}

QString AssetResolver::resolve(const QString& urlTarget) const {
    QString target = QDir::fromNativeSeparators(urlTarget.trimmed());
    if (target.startsWith(QLatin1String("qrc:"))) {
        target = target.mid(3);
    }
    if (isResourcePath(target) || QDir::isAbsolutePath(target)) {
        return QDir::cleanPath(target);
    }
    return QDir::cleanPath(QDir(m_baseDir).absoluteFilePath(target));
}

bool AssetResolver::exists(const QString& urlTarget) const {
    const QString path = resolve(urlTarget);
    const bool found = QFileInfo(path).isFile();
    vLog_Assets("AssetResolver:" << urlTarget << "->" << path << (found ? "found" : "missing"));
    return found;
}

} // namespace veneer
