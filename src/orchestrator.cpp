// ═══════════════════════════════════════════════════════════════════
//  orchestrator.cpp — Phase sequencing and per-unit failure isolation
// ═══════════════════════════════════════════════════════════════════

#include "forgepp/orchestrator.h"
#include "forgepp/console.h"
#include "forgepp/errors.h"
#include "forgepp/fs.h"
#include "forgepp/path.h"
#include "forgepp/scheduler.h"

#include <stdexcept>
#include <system_error>

namespace forgepp {

namespace {

template <typename... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

template <typename Unit>
std::vector<BuildUnit> asUnits(std::vector<Unit> units) {
    std::vector<BuildUnit> out;
    out.reserve(units.size());
    for (auto& u : units) out.emplace_back(std::move(u));
    return out;
}

const char* pluralName(Phase phase) {
    switch (phase) {
        case Phase::BuildLayers:    return "Lambda Layers";
        case Phase::BuildFunctions: return "Lambda Functions";
        case Phase::BuildSchemas:   return "AppSync Schemas";
        default:                    return "units";
    }
}

UnitKind unitKindOf(Phase phase) {
    switch (phase) {
        case Phase::BuildLayers:  return UnitKind::Layer;
        case Phase::BuildSchemas: return UnitKind::Schema;
        default:                  return UnitKind::Function;
    }
}

} // namespace

BuildOrchestrator::BuildOrchestrator(Config config)
    : config_(std::move(config)), token_(ownToken_), packager_(config_) {}

BuildOrchestrator::BuildOrchestrator(Config config, lifecycle::CancellationToken& token)
    : config_(std::move(config)), token_(token), packager_(config_) {}

void BuildOrchestrator::enter(Phase next) {
    if (next < phase_) {
        throw std::logic_error(std::string("Illegal phase transition ") +
                               toString(phase_) + " -> " + toString(next));
    }
    phase_ = next;
}

// ═══════════════════════════════════════════
//  Fatal phases
// ═══════════════════════════════════════════

void BuildOrchestrator::clean() const {
    std::vector<std::filesystem::path> targets{config_.buildDir};
    targets.insert(targets.end(), config_.extraCleanDirs.begin(), config_.extraCleanDirs.end());

    // Checked for every target before anything is removed
    for (auto& dir : targets) {
        if (path::isWithin(config_.projectRoot, dir) || path::isWithin(config_.srcDir, dir) ||
            path::isWithin(dir, config_.srcDir)) {
            throw EnvironmentError("Refusing to clean " + dir.string() +
                                   ": it holds project sources");
        }
    }

    for (auto& dir : targets) {
        if (!fs::existsSync(dir)) continue;
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        if (ec) {
            throw EnvironmentError("Cannot clean " + dir.string() + ": " + ec.message());
        }
        console::debug("Cleaned directory:", dir.string());
    }
}

void BuildOrchestrator::prepare() const {
    if (!fs::isDirectorySync(config_.srcDir)) {
        throw EnvironmentError("Invalid project structure: source directory not found: " +
                               config_.srcDir.string());
    }

    for (auto& dir : {config_.buildDir, config_.lambdasDir, config_.layersDir, config_.appsyncDir}) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw EnvironmentError("Cannot create " + dir.string() + ": " + ec.message());
        }
        try {
            fs::AtomicFile probe(dir / ".write-probe");
            probe.discard();
        } catch (const std::runtime_error& e) {
            throw EnvironmentError("Build directory is not writable: " + std::string(e.what()));
        }
        console::debug("Build directory ready:", dir.string());
    }
}

void BuildOrchestrator::cleanOnly() {
    enter(Phase::Clean);
    clean();
    enter(Phase::Done);
}

// ═══════════════════════════════════════════
//  Unit builds
// ═══════════════════════════════════════════

BuildResult BuildOrchestrator::buildLayer(const LayerUnit& unit) const {
    console::info("Building layer:", unit.name);
    auto result = packager_.package(unit, config_.layersDir);
    console::success("Built layer:", unit.name,
                     "(" + std::to_string(result.filesProcessed) + " files, " +
                     std::to_string(result.archiveSize) + " bytes)");
    return result;
}

BuildResult BuildOrchestrator::buildFunction(const FunctionUnit& unit) const {
    console::info("Building Lambda:", unit.name);
    auto result = packager_.package(unit, config_.lambdasDir);
    console::success("Built Lambda package:", unit.name,
                     "(" + std::to_string(result.filesProcessed) + " files, " +
                     std::to_string(result.archiveSize) + " bytes)");
    return result;
}

BuildResult BuildOrchestrator::buildSchema(const SchemaUnit& unit, FragmentCache& cache) const {
    console::info("Building schema:", unit.name);

    ImportGraphResolver resolver(cache);
    auto document = resolver.resolve(unit.entryPoint);

    auto report = validator_.validate(document.text);
    for (auto& warning : report.warnings) console::warn(unit.name + ":", warning);
    if (!report.valid()) throw ValidationError(unit.name, report.messages());
    console::debug("Schema validation passed for", unit.name);

    auto result = packager_.packageSchema(unit, document, config_.appsyncDir);
    console::success("Built schema:", unit.name,
                     "(" + std::to_string(result.filesProcessed) + " files processed)");
    return result;
}

BuildResult BuildOrchestrator::buildUnit(const BuildUnit& unit, FragmentCache& cache) const {
    try {
        return std::visit(overloaded{
            [&](const LayerUnit& u) { return buildLayer(u); },
            [&](const FunctionUnit& u) { return buildFunction(u); },
            [&](const SchemaUnit& u) { return buildSchema(u, cache); },
        }, unit);
    } catch (const BuildError& e) {
        console::error("Failed to build", std::string(toString(kindOf(unit))), nameOf(unit) + ":", e.what());
        return BuildResult::failure(unit, e.kind(), e.what());
    } catch (const std::exception& e) {
        console::error("Failed to build", std::string(toString(kindOf(unit))), nameOf(unit) + ":", e.what());
        return BuildResult::failure(unit, ErrorKind::Internal, e.what());
    }
}

PhaseReport BuildOrchestrator::buildPhase(Phase phase, int step, const char* title,
                                          const std::function<std::vector<BuildUnit>()>& discover,
                                          FragmentCache& cache) {
    enter(phase);
    console::step(step, title);

    PhaseReport report;
    report.phase = phase;
    report.attempted = true;

    std::vector<BuildUnit> units;
    try {
        units = discover();
    } catch (const std::exception& e) {
        console::error("Discovery failed:", e.what());
        BuildResult failed;
        failed.name = "discovery";
        failed.kind = unitKindOf(phase);
        failed.status = UnitStatus::Failed;
        failed.error = ErrorKind::Environment;
        failed.errorDetail = e.what();
        report.results.push_back(std::move(failed));
        return report;
    }

    report.found = units.size();
    if (units.empty()) {
        console::warn("No", pluralName(phase), "found to build");
        return report;
    }
    console::info("Found", units.size(), pluralName(phase));

    // One slot per unit; workers never touch each other's slots
    report.results.resize(units.size());
    scheduler::forEach(units.size(), config_.jobs, token_,
        [&](std::size_t i) { report.results[i] = buildUnit(units[i], cache); },
        [&](std::size_t i) { report.results[i] = BuildResult::skipped(units[i]); });

    auto failed = report.failedCount();
    if (failed > 0) {
        std::string names;
        for (auto& r : report.results) {
            if (!r.failed()) continue;
            if (!names.empty()) names += ", ";
            names += r.name;
        }
        console::error("Failed to build:", names);
    } else if (report.succeededCount() == units.size()) {
        console::success("Successfully built", units.size(), pluralName(phase));
    }
    return report;
}

// ═══════════════════════════════════════════
//  run
// ═══════════════════════════════════════════

BuildSummary BuildOrchestrator::run() {
    BuildSummary summary;
    summary.lambdasDir = config_.lambdasDir;
    summary.layersDir = config_.layersDir;
    summary.appsyncDir = config_.appsyncDir;

    try {
        enter(Phase::Clean);
        console::step(1, "CLEAN BUILD ENVIRONMENT");
        clean();
        console::success("Build artifacts cleaned");

        enter(Phase::Prepare);
        console::step(2, "PREPARE BUILD ENVIRONMENT");
        prepare();
        console::success("Build directories ready");
    } catch (const EnvironmentError& e) {
        console::error(e.what());
        summary.fatalError = e.what();
        enter(Phase::Summarize);
        summarize(summary);
        enter(Phase::Done);
        return summary;
    }

    UnitDiscoverer discoverer(config_);
    FragmentCache cache(config_.graphqlDir);

    // After an interrupt the remaining phases are recorded but not attempted
    auto runPhase = [&](Phase phase, int step, const char* title,
                        const std::function<std::vector<BuildUnit>()>& discover) {
        if (token_.isCancelled()) {
            PhaseReport skipped;
            skipped.phase = phase;
            summary.phases.push_back(std::move(skipped));
            return;
        }
        summary.phases.push_back(buildPhase(phase, step, title, discover, cache));
    };

    runPhase(Phase::BuildLayers, 3, "BUILD LAMBDA LAYERS",
             [&] { return asUnits(discoverer.discoverLayers()); });
    runPhase(Phase::BuildFunctions, 4, "BUILD LAMBDA FUNCTIONS",
             [&] { return asUnits(discoverer.discoverFunctions()); });
    runPhase(Phase::BuildSchemas, 5, "BUILD APPSYNC SCHEMAS",
             [&] { return asUnits(discoverer.discoverSchemas()); });

    summary.cancelled = token_.isCancelled();

    enter(Phase::Summarize);
    summarize(summary);
    enter(Phase::Done);
    return summary;
}

void BuildOrchestrator::summarize(const BuildSummary& summary) const {
    console::step(6, "BUILD SUMMARY");

    if (!summary.fatalError.empty()) {
        console::error("Build aborted before any unit was attempted:", summary.fatalError);
        return;
    }

    for (auto& phase : summary.phases) {
        std::string counts = std::to_string(phase.succeededCount()) + "/" +
                             std::to_string(phase.found) + " built";
        if (auto failed = phase.failedCount()) counts += ", " + std::to_string(failed) + " failed";
        console::info(std::string(pluralName(phase.phase)) + ":", counts);
    }
    for (auto& failure : summary.failures()) {
        console::error(std::string(toString(failure.kind)), failure.name,
                       "[" + std::string(toString(failure.error)) + "]", failure.errorDetail);
    }
    console::info("Build Directory:", config_.buildDir.string());

    if (fs::isDirectorySync(config_.buildDir)) {
        try {
            fs::writeFileAtomicSync(config_.summaryFile(), summary.toJson().dump(2) + "\n");
            console::debug("Wrote", config_.summaryFile().string());
        } catch (const std::runtime_error& e) {
            console::warn("Could not write build summary:", e.what());
        }
    }

    if (summary.cancelled) {
        console::warn("Build interrupted; remaining units were not attempted");
    } else if (summary.succeeded()) {
        console::success("All artifacts built successfully!");
    } else {
        console::error("Some artifacts failed to build");
    }
}

} // namespace forgepp
