#pragma once

#include "ITheme.hpp"
#include "config/ThemeManifest.hpp"
#include <QString>
#include <memory>

namespace veneer {

/**
 * Theme described by a JSON manifest next to its .qss file.
 * The stylesheet is read once, when the theme is created.
 */
class FileTheme : public ITheme {
public:
    /**
     * Throws ThemeConfigError if the stylesheet cannot be read.
     */
    explicit FileTheme(ThemeManifest manifest);

    /**
     * Load manifest and stylesheet. Throws ThemeConfigError.
     */
    static std::unique_ptr<FileTheme> fromManifest(const QString& manifestPath);

    QString name() const override { return m_manifest.name; }
    QString id() const override { return m_manifest.id; }
    QString description() const override { return m_manifest.description; }
    QString stylesheet() const override { return m_stylesheet; }
    QString assetsDirectory() const override { return m_manifest.assetsDir; }
    QString placeholder() const override { return m_manifest.placeholder; }
    QString baseDirectory() const override;

    const ThemeManifest& manifest() const { return m_manifest; }

private:
    ThemeManifest m_manifest;
    QString m_stylesheet;
};

} // namespace veneer
