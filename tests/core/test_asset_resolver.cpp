/*
Veneer — AssetResolver Tests
Role: Verify placeholder substitution and url(...) target resolution
Testing Strategy: Fixture icon directory on disk + Qt resource style paths
*/
#include <gtest/gtest.h>
#include "assets/AssetResolver.hpp"
#include <QDir>

using namespace veneer;

namespace {

const QString kFixtures = QStringLiteral(VENEER_FIXTURES_DIR);
const QString kIcons = kFixtures + "/icons";

} // namespace

TEST(AssetResolver, SubstitutesEveryPlaceholder) {
    AssetResolver resolver("/opt/icons");
    EXPECT_EQ(resolver.substitute(std::string_view("a: url(%ASSETS_DIR%/x.svg); b: url(%ASSETS_DIR%/y.svg);")),
              "a: url(/opt/icons/x.svg); b: url(/opt/icons/y.svg);");
    EXPECT_EQ(resolver.placeholder(), QString(kDefaultAssetsPlaceholder));
}

TEST(AssetResolver, CustomPlaceholder) {
    AssetResolver resolver("/opt/icons", "@icons@");
    EXPECT_EQ(resolver.substitute(QString("url(@icons@/x.svg) url(%ASSETS_DIR%/y.svg)")),
              QString("url(/opt/icons/x.svg) url(%ASSETS_DIR%/y.svg)"));
    EXPECT_TRUE(resolver.containsPlaceholder("url(@icons@/x.svg)"));
    EXPECT_FALSE(resolver.containsPlaceholder("url(%ASSETS_DIR%/x.svg)"));
}

TEST(AssetResolver, LeavesTextUntouchedWithoutAssetsDirectory) {
    AssetResolver resolver{QString()};
    const std::string text = "image: url(%ASSETS_DIR%/check.svg);";
    EXPECT_TRUE(resolver.assetsDirectory().isEmpty());
    EXPECT_EQ(resolver.substitute(std::string_view(text)), text);
}

TEST(AssetResolver, NormalizesAssetsDirectory) {
    EXPECT_EQ(AssetResolver("/opt/theme/icons/").assetsDirectory(), QString("/opt/theme/icons"));
    EXPECT_EQ(AssetResolver("/opt/theme/../icons").assetsDirectory(), QString("/opt/icons"));
    EXPECT_EQ(AssetResolver("icons", kDefaultAssetsPlaceholder, "/opt/theme").assetsDirectory(),
              QString("/opt/theme/icons"));
    EXPECT_EQ(AssetResolver(":/veneer/icons/").assetsDirectory(), QString(":/veneer/icons"));
    EXPECT_EQ(AssetResolver("qrc:/veneer/icons").assetsDirectory(), QString(":/veneer/icons"));
}

TEST(AssetResolver, AbsolutePath) {
    EXPECT_EQ(AssetResolver::absolutePath("icons", "/base"), QString("/base/icons"));
    EXPECT_EQ(AssetResolver::absolutePath("/abs/icons", "/base"), QString("/abs/icons"));
    EXPECT_EQ(AssetResolver::absolutePath("./a/../b", "/base"), QString("/base/b"));
    EXPECT_EQ(AssetResolver::absolutePath("x"), QDir::cleanPath(QDir::current().absoluteFilePath("x")));
}

TEST(AssetResolver, ResolvesUrlTargets) {
    AssetResolver resolver(kIcons, kDefaultAssetsPlaceholder, "/themes/dark");
    EXPECT_EQ(resolver.resolve("/usr/share/icons/a.svg"), QString("/usr/share/icons/a.svg"));
    EXPECT_EQ(resolver.resolve("icons/a.svg"), QString("/themes/dark/icons/a.svg"));
    EXPECT_EQ(resolver.resolve(" ../shared/a.svg "), QString("/themes/shared/a.svg"));
    EXPECT_EQ(resolver.resolve(":/veneer/icons/a.svg"), QString(":/veneer/icons/a.svg"));
    EXPECT_EQ(resolver.resolve("qrc:/veneer/icons/a.svg"), QString(":/veneer/icons/a.svg"));
}

TEST(AssetResolver, ChecksFilesExist) {
    AssetResolver resolver(kIcons, kDefaultAssetsPlaceholder, kFixtures);
    EXPECT_TRUE(resolver.exists(kIcons + "/check.svg"));
    EXPECT_TRUE(resolver.exists("icons/arrow-down.svg"));
    EXPECT_FALSE(resolver.exists(kIcons + "/missing.svg"));
    // Directories are not assets
    EXPECT_FALSE(resolver.exists(kIcons));
}
