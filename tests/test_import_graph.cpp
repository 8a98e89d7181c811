// ═══════════════════════════════════════════════════════════════════
//  test_import_graph.cpp — Tests for schema import merging
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <forgepp/import_graph.h>
#include <forgepp/testing.h>
#include <forgepp/validator.h>

using namespace forgepp;
using forgepp::testing::TempTree;
using forgepp::testing::writeTree;

namespace {

std::size_t occurrences(const std::string& haystack, const std::string& needle) {
    std::size_t count = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

} // namespace

class ImportGraphTest : public ::testing::Test {
protected:
    TempTree tree;

    MergedDocument resolve(const std::string& entry) {
        FragmentCache cache(tree.root());
        ImportGraphResolver resolver(cache);
        return resolver.resolve(tree.path(entry));
    }
};

TEST_F(ImportGraphTest, MergesImportBeforeImporter) {
    writeTree(tree, {
        {"app.graphql", "import \"./common/types.graphql\"\n\ntype Query { id: ID }\n"},
        {"common/types.graphql", "type PageInfo { hasMore: Boolean }\n"},
    });

    auto doc = resolve("app.graphql");

    EXPECT_EQ(doc.text,
        "# Source: common/types.graphql\n"
        "type PageInfo { hasMore: Boolean }\n"
        "\n"
        "# Source: app.graphql\n"
        "type Query { id: ID }\n");
    EXPECT_EQ(doc.sources, (std::vector<std::string>{"common/types.graphql", "app.graphql"}));

    auto report = SchemaValidator().validate(doc.text);
    EXPECT_TRUE(report.valid());
    EXPECT_TRUE(report.warnings.empty());
}

TEST_F(ImportGraphTest, ResolvingTwiceIsByteIdentical) {
    writeTree(tree, {
        {"app.graphql", "import \"a.graphql\"\nimport \"b.graphql\"\ntype Query { a: A b: B }\n"},
        {"a.graphql", "import \"c.graphql\"\ntype A { c: C }\n"},
        {"b.graphql", "import \"c.graphql\"\ntype B { c: C }\n"},
        {"c.graphql", "type C { id: ID }\n"},
    });

    auto first = resolve("app.graphql");
    auto second = resolve("app.graphql");
    EXPECT_EQ(first.text, second.text);
    EXPECT_EQ(first.sources, second.sources);
}

TEST_F(ImportGraphTest, SharedImportAppearsOnce) {
    writeTree(tree, {
        {"app.graphql", "import \"./a.graphql\"\nimport \"./b.graphql\"\ntype Query { a: A b: B }\n"},
        {"a.graphql", "import \"./c.graphql\"\ntype A { c: C }\n"},
        {"b.graphql", "import \"c.graphql\"\ntype B { c: C }\n"},
        {"c.graphql", "type C { id: ID }\n"},
    });

    auto doc = resolve("app.graphql");
    EXPECT_EQ(occurrences(doc.text, "type C { id: ID }"), 1u);
    EXPECT_EQ(occurrences(doc.text, "# Source: c.graphql"), 1u);
    EXPECT_EQ(doc.sources, (std::vector<std::string>{"c.graphql", "a.graphql", "b.graphql", "app.graphql"}));
    EXPECT_TRUE(SchemaValidator().validate(doc.text).valid());
}

TEST_F(ImportGraphTest, PreservesImportOrder) {
    writeTree(tree, {
        {"e.graphql", "import \"b.graphql\"\nimport \"a.graphql\"\ntype Query { id: ID }\n"},
        {"a.graphql", "type A { id: ID }\n"},
        {"b.graphql", "type B { id: ID }\n"},
    });

    auto doc = resolve("e.graphql");
    auto b = doc.text.find("type B");
    auto a = doc.text.find("type A");
    auto e = doc.text.find("type Query");
    ASSERT_NE(a, std::string::npos);
    EXPECT_LT(b, a);
    EXPECT_LT(a, e);
}

TEST_F(ImportGraphTest, DifferentSpellingsAreOneNode) {
    writeTree(tree, {
        {"apps/app.graphql",
         "import \"../common/types.graphql\"\n"
         "import \"common/types.graphql\"\n"
         "import \"/common/./types.graphql\"\n"
         "type Query { id: ID }\n"},
        {"common/types.graphql", "scalar DateTime\n"},
    });

    auto doc = resolve("apps/app.graphql");
    EXPECT_EQ(doc.fragmentCount(), 2u);
    EXPECT_EQ(occurrences(doc.text, "scalar DateTime"), 1u);
}

TEST_F(ImportGraphTest, MissingImportNamesImporterAndReference) {
    writeTree(tree, {
        {"app.graphql", "type Query { id: ID }\nimport \"./missing.graphql\"\n"},
    });

    try {
        resolve("app.graphql");
        FAIL() << "expected ImportNotFound";
    } catch (const ImportNotFound& e) {
        EXPECT_EQ(e.importingFile(), "app.graphql:2");
        EXPECT_EQ(e.reference(), "./missing.graphql");
        EXPECT_NE(std::string(e.what()).find("./missing.graphql"), std::string::npos);
    }
}

TEST_F(ImportGraphTest, MissingEntryPoint) {
    EXPECT_THROW(resolve("nope.graphql"), ImportNotFound);
}

TEST_F(ImportGraphTest, SelfImportIsCycle) {
    tree.write("a.graphql", "import \"a.graphql\"\ntype Query { id: ID }\n");

    try {
        resolve("a.graphql");
        FAIL() << "expected CircularImportError";
    } catch (const CircularImportError& e) {
        EXPECT_EQ(e.chain(), (std::vector<std::string>{"a.graphql", "a.graphql"}));
        EXPECT_STREQ(e.what(), "Circular import: a.graphql -> a.graphql");
    }
}

TEST_F(ImportGraphTest, CycleBackToEntryPoint) {
    writeTree(tree, {
        {"a.graphql", "import \"b.graphql\"\ntype Query { id: ID }\n"},
        {"b.graphql", "import \"a.graphql\"\ntype B { id: ID }\n"},
    });

    try {
        resolve("a.graphql");
        FAIL() << "expected CircularImportError";
    } catch (const CircularImportError& e) {
        EXPECT_STREQ(e.what(), "Circular import: a.graphql -> b.graphql -> a.graphql");
    }
}

TEST_F(ImportGraphTest, CycleBelowEntryPointNamesOnlyActiveChain) {
    writeTree(tree, {
        {"app.graphql", "import \"x.graphql\"\ntype Query { id: ID }\n"},
        {"x.graphql", "import \"y.graphql\"\ntype X { id: ID }\n"},
        {"y.graphql", "import \"x.graphql\"\ntype Y { id: ID }\n"},
    });

    try {
        resolve("app.graphql");
        FAIL() << "expected CircularImportError";
    } catch (const CircularImportError& e) {
        EXPECT_EQ(e.chain(), (std::vector<std::string>{"app.graphql", "x.graphql", "y.graphql", "x.graphql"}));
    }
}

// A diamond is not a cycle: d is reached twice but never while on the stack
TEST_F(ImportGraphTest, DiamondIsNotACycle) {
    writeTree(tree, {
        {"app.graphql", "import \"b.graphql\"\nimport \"c.graphql\"\ntype Query { id: ID }\n"},
        {"b.graphql", "import \"d.graphql\"\ntype B { id: ID }\n"},
        {"c.graphql", "import \"d.graphql\"\ntype C { id: ID }\n"},
        {"d.graphql", "type D { id: ID }\n"},
    });

    EXPECT_NO_THROW(resolve("app.graphql"));
}

TEST_F(ImportGraphTest, DeepChainDoesNotRecurse) {
    constexpr int depth = 2000;
    for (int i = 0; i < depth; ++i) {
        tree.write("f" + std::to_string(i) + ".graphql",
                   "import \"f" + std::to_string(i + 1) + ".graphql\"\ntype T" + std::to_string(i) + " { id: ID }\n");
    }
    tree.write("f" + std::to_string(depth) + ".graphql", "type Query { id: ID }\n");

    auto doc = resolve("f0.graphql");
    EXPECT_EQ(doc.fragmentCount(), static_cast<std::size_t>(depth + 1));
    EXPECT_EQ(doc.sources.front(), "f" + std::to_string(depth) + ".graphql");
    EXPECT_EQ(doc.sources.back(), "f0.graphql");
}

// ── Cycles of length 1 through 5, entered from a non-cyclic entry point ──
class CycleLengthTest : public ::testing::TestWithParam<int> {};

TEST_P(CycleLengthTest, DetectsCycle) {
    TempTree tree;
    int length = GetParam();

    tree.write("entry.graphql", "import \"n0.graphql\"\ntype Query { id: ID }\n");
    for (int i = 0; i < length; ++i) {
        auto next = "n" + std::to_string((i + 1) % length) + ".graphql";
        tree.write("n" + std::to_string(i) + ".graphql",
                   "import \"" + next + "\"\ntype N" + std::to_string(i) + " { id: ID }\n");
    }

    FragmentCache cache(tree.root());
    ImportGraphResolver resolver(cache);
    try {
        resolver.resolve(tree.path("entry.graphql"));
        FAIL() << "expected CircularImportError";
    } catch (const CircularImportError& e) {
        // entry, n0..n(length-1), then n0 again
        ASSERT_EQ(e.chain().size(), static_cast<std::size_t>(length + 2));
        EXPECT_EQ(e.chain().front(), "entry.graphql");
        EXPECT_EQ(e.chain()[1], "n0.graphql");
        EXPECT_EQ(e.chain().back(), "n0.graphql");
    }
}

INSTANTIATE_TEST_SUITE_P(Lengths, CycleLengthTest, ::testing::Values(1, 2, 3, 4, 5));
