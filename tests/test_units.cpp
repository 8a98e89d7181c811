// ═══════════════════════════════════════════════════════════════════
//  test_units.cpp — Tests for build results and the run summary
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <forgepp/units.h>

using namespace forgepp;

namespace {

BuildResult ok(const std::string& name, UnitKind kind) {
    BuildResult r;
    r.name = name;
    r.kind = kind;
    r.status = UnitStatus::Succeeded;
    r.filesProcessed = 2;
    r.archiveSize = 512;
    return r;
}

} // namespace

TEST(BuildUnitTest, KindAndName) {
    BuildUnit f = FunctionUnit{"users_handler", {}, {}, {}};
    BuildUnit l = LayerUnit{"adapters", {}, {}};
    BuildUnit s = SchemaUnit{"app", {}};

    EXPECT_EQ(kindOf(f), UnitKind::Function);
    EXPECT_EQ(kindOf(l), UnitKind::Layer);
    EXPECT_EQ(kindOf(s), UnitKind::Schema);
    EXPECT_EQ(nameOf(l), "adapters");
}

TEST(BuildResultTest, FailureAndSkipped) {
    BuildUnit s = SchemaUnit{"app", {}};

    auto failed = BuildResult::failure(s, ErrorKind::ImportNotFound, "missing");
    EXPECT_TRUE(failed.failed());
    EXPECT_EQ(failed.kind, UnitKind::Schema);
    EXPECT_EQ(failed.errorDetail, "missing");

    auto skipped = BuildResult::skipped(s);
    EXPECT_FALSE(skipped.failed());
    EXPECT_FALSE(skipped.succeeded());
    EXPECT_EQ(skipped.errorDetail, "not attempted");
}

TEST(BuildResultTest, JsonRoundTrip) {
    auto original = BuildResult::failure(SchemaUnit{"app", {}}, ErrorKind::CircularImport, "a -> b -> a");
    auto j = toJson(original);

    EXPECT_EQ(j["status"], "failed");
    EXPECT_EQ(j["kind"], "schema");
    EXPECT_EQ(j["error"], "CircularImportError");

    auto restored = nlohmann::json::parse(j.dump()).get<BuildResult>();
    EXPECT_EQ(restored.name, "app");
    EXPECT_EQ(restored.error, ErrorKind::CircularImport);
    EXPECT_EQ(restored.status, UnitStatus::Failed);
}

TEST(BuildResultTest, SuccessHasNullError) {
    auto j = toJson(ok("adapters", UnitKind::Layer));
    EXPECT_TRUE(j["error"].is_null());
    EXPECT_EQ(j["status"], "success");
}

TEST(BuildSummaryTest, SucceedsOnlyWithoutFailures) {
    BuildSummary summary;
    PhaseReport layers;
    layers.phase = Phase::BuildLayers;
    layers.attempted = true;
    layers.found = 1;
    layers.results = {ok("adapters", UnitKind::Layer)};
    summary.phases.push_back(layers);

    EXPECT_TRUE(summary.succeeded());
    EXPECT_EQ(summary.exitCode(), 0);

    PhaseReport schemas;
    schemas.phase = Phase::BuildSchemas;
    schemas.attempted = true;
    schemas.found = 2;
    schemas.results = {ok("a", UnitKind::Schema),
                       BuildResult::failure(SchemaUnit{"b", {}}, ErrorKind::Validation, "dup")};
    summary.phases.push_back(schemas);

    EXPECT_FALSE(summary.succeeded());
    EXPECT_EQ(summary.exitCode(), 1);
    EXPECT_EQ(summary.failures().size(), 1u);
    EXPECT_EQ(summary.allResults().size(), 3u);
    ASSERT_NE(summary.phase(Phase::BuildSchemas), nullptr);
    EXPECT_EQ(summary.phase(Phase::BuildSchemas)->failedCount(), 1u);
    EXPECT_EQ(summary.phase(Phase::BuildFunctions), nullptr);
}

TEST(BuildSummaryTest, FatalOrCancelledFails) {
    BuildSummary fatal;
    fatal.fatalError = "source directory not found";
    EXPECT_EQ(fatal.exitCode(), 1);

    BuildSummary cancelled;
    cancelled.cancelled = true;
    EXPECT_EQ(cancelled.exitCode(), 1);
}

TEST(BuildSummaryTest, JsonShape) {
    BuildSummary summary;
    summary.lambdasDir = "/p/build/lambdas";
    PhaseReport functions;
    functions.phase = Phase::BuildFunctions;
    functions.attempted = true;
    functions.found = 1;
    functions.results = {BuildResult::failure(FunctionUnit{"users_handler", {}, {}, {}},
                                              ErrorKind::Packaging, "too large")};
    summary.phases.push_back(functions);

    auto j = summary.toJson();
    EXPECT_EQ(j["success"], false);
    EXPECT_EQ(j["exitCode"], 1);
    EXPECT_TRUE(j["fatalError"].is_null());
    EXPECT_EQ(j["artifacts"]["lambdas"], "/p/build/lambdas");
    EXPECT_EQ(j["phases"][0]["phase"], "BuildFunctions");
    ASSERT_EQ(j["failed"].size(), 1u);
    EXPECT_EQ(j["failed"][0]["name"], "users_handler");
    EXPECT_EQ(j["failed"][0]["kind"], "function");
    EXPECT_EQ(j["failed"][0]["error"], "PackagingError");
    EXPECT_EQ(j["failed"][0]["detail"], "too large");
}
