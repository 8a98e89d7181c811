#pragma once
// ═══════════════════════════════════════════════════════════════════
//  forgepp/orchestrator.h — The build run state machine
// ═══════════════════════════════════════════════════════════════════
//
//  Clean → Prepare → BuildLayers → BuildFunctions → BuildSchemas
//        → Summarize → Done
//
//  Clean and Prepare are fatal on failure. Inside the three build
//  phases a failing unit is recorded and the phase moves on.
//  Summarize always runs.
//
//  Usage:
//    auto config = Config::load(root);
//    BuildOrchestrator build(config);
//    auto summary = build.run();
//    return summary.exitCode();
//
// ═══════════════════════════════════════════════════════════════════

#include "config.h"
#include "discovery.h"
#include "fragment.h"
#include "import_graph.h"
#include "lifecycle.h"
#include "packager.h"
#include "units.h"
#include "validator.h"

#include <functional>
#include <vector>

namespace forgepp {

class BuildOrchestrator {
public:
    explicit BuildOrchestrator(Config config);
    BuildOrchestrator(Config config, lifecycle::CancellationToken& token);

    BuildOrchestrator(const BuildOrchestrator&) = delete;
    BuildOrchestrator& operator=(const BuildOrchestrator&) = delete;

    // Full run. Environment failures end up in BuildSummary::fatalError.
    BuildSummary run();

    // Clean phase only; throws EnvironmentError
    void cleanOnly();

    // One unit behind the same failure boundary a full run uses
    BuildResult buildUnit(const BuildUnit& unit, FragmentCache& cache) const;

    Phase phase() const { return phase_; }
    const Config& config() const { return config_; }

private:
    Config config_;
    lifecycle::CancellationToken ownToken_;
    lifecycle::CancellationToken& token_;
    Phase phase_ = Phase::Clean;

    SchemaValidator validator_;
    ArtifactPackager packager_;

    void enter(Phase next);
    void clean() const;
    void prepare() const;

    PhaseReport buildPhase(Phase phase, int step, const char* title,
                           const std::function<std::vector<BuildUnit>()>& discover,
                           FragmentCache& cache);

    BuildResult buildLayer(const LayerUnit& unit) const;
    BuildResult buildFunction(const FunctionUnit& unit) const;
    BuildResult buildSchema(const SchemaUnit& unit, FragmentCache& cache) const;

    void summarize(const BuildSummary& summary) const;
};

} // namespace forgepp
