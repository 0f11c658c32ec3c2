#pragma once

#include "assets/AssetResolver.hpp"
#include <QString>

namespace veneer {

/**
 * Interface for theme implementations.
 * Each theme provides a name and a stylesheet whose icon references go
 * through the asset-directory placeholder.
 */
class ITheme {
public:
    virtual ~ITheme() = default;

    /**
     * Get the display name of this theme.
     */
    virtual QString name() const = 0;

    /**
     * Get the unique identifier for this theme.
     */
    virtual QString id() const = 0;

    /**
     * Stylesheet source, placeholder not yet substituted.
     */
    virtual QString stylesheet() const = 0;

    /**
     * Optional: Get a description of the theme.
     */
    virtual QString description() const { return QString(); }

    /**
     * Directory the placeholder stands for. Empty for themes without icons.
     */
    virtual QString assetsDirectory() const { return QString(); }

    virtual QString placeholder() const { return QString::fromLatin1(kDefaultAssetsPlaceholder); }

    /**
     * Directory relative url(...) targets are resolved against.
     */
    virtual QString baseDirectory() const { return QString(); }
};

} // namespace veneer
