#pragma once

#include <QString>
#include <string>
#include <string_view>

namespace veneer {

inline constexpr const char* kDefaultAssetsPlaceholder = "%ASSETS_DIR%";

/**
 * Substitutes the asset-directory placeholder in stylesheet text and resolves
 * url(...) targets to files. Qt resource directories (":/...") count as
 * absolute; relative url targets resolve against the stylesheet's directory.
 */
class AssetResolver {
public:
    explicit AssetResolver(const QString& assetsDir,
                           const QString& placeholder = QString::fromLatin1(kDefaultAssetsPlaceholder),
                           const QString& baseDir = QString());

    /**
     * Absolute, forward-slashed, no trailing slash. Empty if none was given.
     */
    const QString& assetsDirectory() const { return m_assetsDir; }
    const QString& placeholder() const { return m_placeholder; }
    const QString& baseDirectory() const { return m_baseDir; }

    /**
     * Replace every placeholder occurrence with the assets directory.
     * Text is returned unchanged when no assets directory is configured.
     */
    QString substitute(const QString& text) const;
    std::string substitute(std::string_view text) const;

    bool containsPlaceholder(std::string_view text) const;

    /**
     * Absolute path a url(...) target refers to.
     */
    QString resolve(const QString& urlTarget) const;

    /**
     * Whether the url(...) target names an existing file.
     */
    bool exists(const QString& urlTarget) const;

    /**
     * Absolute form of `path`, relative ones taken against `baseDir`
     * (or the working directory when `baseDir` is empty).
     */
    static QString absolutePath(const QString& path, const QString& baseDir = QString());

private:
    QString m_assetsDir;
    QString m_placeholder;
    QString m_baseDir;
};

} // namespace veneer
