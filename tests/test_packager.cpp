// ═══════════════════════════════════════════════════════════════════
//  test_packager.cpp — Tests for artifact layout and placement
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <forgepp/crypto.h>
#include <forgepp/discovery.h>
#include <forgepp/errors.h>
#include <forgepp/packager.h>
#include <forgepp/testing.h>

using namespace forgepp;
using forgepp::testing::TempTree;
using forgepp::testing::writeTree;

namespace {

std::vector<std::string> entryNames(const std::vector<zip::ArchiveEntry>& entries) {
    std::vector<std::string> out;
    for (auto& e : entries) out.push_back(e.name);
    return out;
}

} // namespace

class PackagerTest : public ::testing::Test {
protected:
    TempTree tree;
    Config config;

    void SetUp() override {
        writeTree(tree, {
            {"src/handlers/users_handler.py", "from domain.entities.user import User\n"},
            {"src/domain/entities/user.py", "class User: pass\n"},
            {"src/orm/models.py", "Base = object\n"},
            {"src/adapters/__init__.py", ""},
            {"src/adapters/database/db_session.py", "SESSION = None\n"},
        });
        tree.mkdir("out");
        config = Config::defaults(tree.root());
    }

    FunctionUnit usersFunction() {
        auto functions = UnitDiscoverer(config).discoverFunctions();
        EXPECT_EQ(functions.size(), 1u);
        return functions.at(0);
    }

    LayerUnit adaptersLayer() {
        config.layers = {"adapters"};
        auto layers = UnitDiscoverer(config).discoverLayers();
        EXPECT_EQ(layers.size(), 1u);
        return layers.at(0);
    }
};

TEST_F(PackagerTest, FunctionLayout) {
    ArtifactPackager packager(config);
    auto layout = packager.layout(usersFunction());

    std::vector<std::string> paths;
    for (auto& [archivePath, source] : layout) paths.push_back(archivePath);
    EXPECT_EQ(paths, (std::vector<std::string>{"domain/entities/user.py", "orm/models.py", "users_handler.py"}));
}

TEST_F(PackagerTest, LayerLayoutUsesRuntimePrefix) {
    ArtifactPackager packager(config);
    auto layout = packager.layout(adaptersLayer());

    ASSERT_EQ(layout.size(), 2u);
    EXPECT_TRUE(layout.count("python/adapters/__init__.py"));
    EXPECT_TRUE(layout.count("python/adapters/database/db_session.py"));
}

TEST_F(PackagerTest, PackagesFunctionArchive) {
    ArtifactPackager packager(config);
    auto result = packager.package(usersFunction(), tree.path("out"));

    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.kind, UnitKind::Function);
    EXPECT_EQ(result.filesProcessed, 3u);
    EXPECT_EQ(result.artifact, tree.path("out/users_handler.zip").string());

    auto bytes = tree.read("out/users_handler.zip");
    EXPECT_EQ(result.archiveSize, bytes.size());
    EXPECT_EQ(result.codeSha256, crypto::codeSha256(bytes));

    auto entries = zip::readArchive(bytes);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[2].name, "users_handler.py");
    EXPECT_EQ(entries[2].data, "from domain.entities.user import User\n");
}

TEST_F(PackagerTest, PackagesLayerArchive) {
    ArtifactPackager packager(config);
    auto result = packager.package(adaptersLayer(), tree.path("out"));

    EXPECT_EQ(result.kind, UnitKind::Layer);
    auto entries = zip::readArchive(tree.read("out/adapters.zip"));
    EXPECT_EQ(entryNames(entries),
              (std::vector<std::string>{"python/adapters/__init__.py", "python/adapters/database/db_session.py"}));
}

TEST_F(PackagerTest, RepackagingIsByteIdentical) {
    ArtifactPackager packager(config);
    auto first = packager.package(usersFunction(), tree.path("out"));
    auto firstBytes = tree.read("out/users_handler.zip");
    auto second = packager.package(usersFunction(), tree.path("out"));

    EXPECT_EQ(first.codeSha256, second.codeSha256);
    EXPECT_EQ(tree.read("out/users_handler.zip"), firstBytes);
}

TEST_F(PackagerTest, OversizedArchiveIsNotPlaced) {
    tree.write("src/orm/blob.py", crypto::randomBytes(4096));
    config.maxArchiveBytes = 1024;
    ArtifactPackager packager(config);

    EXPECT_THROW(packager.package(usersFunction(), tree.path("out")), PackagingError);
    EXPECT_FALSE(tree.exists("out/users_handler.zip"));
    EXPECT_TRUE(std::filesystem::is_empty(tree.path("out")));
}

TEST_F(PackagerTest, MissingSourceLeavesNoArtifact) {
    auto unit = usersFunction();
    unit.sharedModules.push_back(tree.path("src/domain/vanished.py"));
    ArtifactPackager packager(config);

    try {
        packager.package(unit, tree.path("out"));
        FAIL() << "expected PackagingError";
    } catch (const PackagingError& e) {
        EXPECT_NE(std::string(e.what()).find("vanished.py"), std::string::npos);
    }
    EXPECT_TRUE(std::filesystem::is_empty(tree.path("out")));
}

TEST_F(PackagerTest, UnlistableSourcesFailTheUnit) {
    auto unit = adaptersLayer();
    unit.listingError = "Permission denied";
    ArtifactPackager packager(config);

    try {
        packager.package(unit, tree.path("out"));
        FAIL() << "expected PackagingError";
    } catch (const PackagingError& e) {
        EXPECT_STREQ(e.what(), "Cannot list sources for adapters: Permission denied");
    }
    EXPECT_TRUE(std::filesystem::is_empty(tree.path("out")));
}

TEST_F(PackagerTest, MissingDestinationIsPackagingError) {
    ArtifactPackager packager(config);
    EXPECT_THROW(packager.package(usersFunction(), tree.path("no/such/dir")), PackagingError);
}

TEST_F(PackagerTest, SchemaIsWrittenVerbatim) {
    MergedDocument doc;
    doc.text = "# Source: apps/app.graphql\ntype Query { id: ID }\n";
    doc.sources = {"apps/app.graphql"};

    ArtifactPackager packager(config);
    auto result = packager.packageSchema({"app", tree.path("src/api/graphql/apps/app.graphql")}, doc, tree.path("out"));

    EXPECT_EQ(result.kind, UnitKind::Schema);
    EXPECT_EQ(result.filesProcessed, 1u);
    EXPECT_EQ(tree.read("out/app.graphql"), doc.text);
}
