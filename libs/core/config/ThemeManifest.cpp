#include "ThemeManifest.hpp"
#include "VeneerLogging.hpp"
#include "assets/AssetResolver.hpp"

#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>

namespace veneer {

namespace {

std::string describe(const QString& origin) {
    return origin.isEmpty() ? std::string("theme manifest") : origin.toStdString();
}

QString optionalString(const nlohmann::json& json, const char* field, const QString& origin) {
    if (!json.contains(field) || json[field].is_null()) return QString();
    if (!json[field].is_string()) {
        throw ThemeConfigError(describe(origin) + ": field '" + field + "' must be a string");
    }
    return QString::fromStdString(json[field].get<std::string>());
}

QString requiredString(const nlohmann::json& json, const char* field, const QString& origin) {
    const QString value = optionalString(json, field, origin);
    if (value.trimmed().isEmpty()) {
        throw ThemeConfigError(describe(origin) + ": missing required field '" + field + "'");
    }
    return value;
}

} // namespace

ThemeManifest ThemeManifest::fromJson(const nlohmann::json& json, const QString& baseDir, const QString& origin) {
    if (!json.is_object()) {
        throw ThemeConfigError(describe(origin) + ": expected a JSON object");
    }

    ThemeManifest manifest;
    manifest.id = requiredString(json, "id", origin);
    static const QRegularExpression idPattern(QStringLiteral("^[a-z0-9][a-z0-9_-]*$"));
    if (!idPattern.match(manifest.id).hasMatch()) {
        throw ThemeConfigError(describe(origin) + ": invalid theme id '" + manifest.id.toStdString()
                               + "' (lower-case letters, digits, '-' and '_')");
    }

    manifest.name = optionalString(json, "name", origin);
    if (manifest.name.isEmpty()) manifest.name = manifest.id;
    manifest.description = optionalString(json, "description", origin);

    manifest.stylesheetPath = AssetResolver::absolutePath(requiredString(json, "stylesheet", origin), baseDir);

    const QString assets = optionalString(json, "assets_dir", origin);
    if (!assets.isEmpty()) {
        manifest.assetsDir = AssetResolver::absolutePath(assets, baseDir);
    }

    manifest.placeholder = optionalString(json, "placeholder", origin);
    if (json.contains("placeholder") && manifest.placeholder.isEmpty()) {
        throw ThemeConfigError(describe(origin) + ": field 'placeholder' must not be empty");
    }
    if (manifest.placeholder.isEmpty()) {
        manifest.placeholder = QString::fromLatin1(kDefaultAssetsPlaceholder);
    }

    manifest.manifestPath = origin;
    return manifest;
}

ThemeManifest ThemeManifest::load(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw ThemeConfigError(path.toStdString() + ": cannot open theme manifest ("
                               + file.errorString().toStdString() + ")");
    }
    const QByteArray bytes = file.readAll();

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(bytes.constData(), bytes.constData() + bytes.size());
    } catch (const nlohmann::json::parse_error& e) {
        throw ThemeConfigError(path.toStdString() + ": malformed JSON: " + e.what());
    }

    const QString baseDir = QFileInfo(path).path();
    ThemeManifest manifest = fromJson(json, baseDir, path);
    vLog_App("ThemeManifest: loaded" << manifest.id << "from" << path);
    return manifest;
}

} // namespace veneer
