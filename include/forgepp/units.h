#pragma once
// ═══════════════════════════════════════════════════════════════════
//  forgepp/units.h — Buildable units, per-unit results, run summary
// ═══════════════════════════════════════════════════════════════════

#include "errors.h"
#include "json_utils.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace forgepp {

FORGEPP_SERIALIZE_ENUM(ErrorKind, {
    {ErrorKind::None, nullptr},
    {ErrorKind::ImportNotFound, "ImportNotFound"},
    {ErrorKind::CircularImport, "CircularImportError"},
    {ErrorKind::Validation, "ValidationError"},
    {ErrorKind::Packaging, "PackagingError"},
    {ErrorKind::Environment, "EnvironmentError"},
    {ErrorKind::Internal, "InternalError"},
})

// ═══════════════════════════════════════════
//  Units (closed set)
// ═══════════════════════════════════════════

struct FunctionUnit {
    std::string name;
    std::filesystem::path handler;
    std::filesystem::path moduleRoot;                   // archive paths are relative to this
    std::vector<std::filesystem::path> sharedModules;
    std::string listingError;                           // shared modules could not be listed
};

struct LayerUnit {
    std::string name;
    std::filesystem::path sourceDir;
    std::vector<std::filesystem::path> files;
    std::string listingError;                           // sourceDir could not be listed
};

struct SchemaUnit {
    std::string name;
    std::filesystem::path entryPoint;
};

using BuildUnit = std::variant<FunctionUnit, LayerUnit, SchemaUnit>;

enum class UnitKind { Function, Layer, Schema };

FORGEPP_SERIALIZE_ENUM(UnitKind, {
    {UnitKind::Function, "function"},
    {UnitKind::Layer, "layer"},
    {UnitKind::Schema, "schema"},
})

inline const char* toString(UnitKind kind) {
    switch (kind) {
        case UnitKind::Function: return "function";
        case UnitKind::Layer:    return "layer";
        case UnitKind::Schema:   return "schema";
    }
    return "unknown";
}

inline UnitKind kindOf(const BuildUnit& unit) {
    return std::visit([](const auto& u) -> UnitKind {
        using T = std::decay_t<decltype(u)>;
        if constexpr (std::is_same_v<T, FunctionUnit>) return UnitKind::Function;
        else if constexpr (std::is_same_v<T, LayerUnit>) return UnitKind::Layer;
        else return UnitKind::Schema;
    }, unit);
}

inline const std::string& nameOf(const BuildUnit& unit) {
    return std::visit([](const auto& u) -> const std::string& { return u.name; }, unit);
}

// ═══════════════════════════════════════════
//  Results
// ═══════════════════════════════════════════

enum class UnitStatus { Succeeded, Failed, Skipped };

FORGEPP_SERIALIZE_ENUM(UnitStatus, {
    {UnitStatus::Succeeded, "success"},
    {UnitStatus::Failed, "failed"},
    {UnitStatus::Skipped, "skipped"},
})

inline const char* toString(UnitStatus status) {
    switch (status) {
        case UnitStatus::Succeeded: return "success";
        case UnitStatus::Failed:    return "failed";
        case UnitStatus::Skipped:   return "skipped";
    }
    return "unknown";
}

struct BuildResult {
    std::string name;
    UnitKind kind = UnitKind::Function;
    UnitStatus status = UnitStatus::Skipped;
    ErrorKind error = ErrorKind::None;
    std::string errorDetail;

    // ── Metrics ──
    std::size_t filesProcessed = 0;
    std::uint64_t archiveSize = 0;
    std::string artifact;
    std::string codeSha256;

    bool succeeded() const { return status == UnitStatus::Succeeded; }
    bool failed() const { return status == UnitStatus::Failed; }

    static BuildResult failure(const BuildUnit& unit, ErrorKind error, std::string detail) {
        BuildResult r;
        r.name = nameOf(unit);
        r.kind = kindOf(unit);
        r.status = UnitStatus::Failed;
        r.error = error;
        r.errorDetail = std::move(detail);
        return r;
    }

    static BuildResult skipped(const BuildUnit& unit) {
        BuildResult r;
        r.name = nameOf(unit);
        r.kind = kindOf(unit);
        r.status = UnitStatus::Skipped;
        r.errorDetail = "not attempted";
        return r;
    }

    FORGEPP_SERIALIZE(BuildResult, name, kind, status, error, errorDetail,
                      filesProcessed, archiveSize, artifact, codeSha256)
};

enum class Phase { Clean, Prepare, BuildLayers, BuildFunctions, BuildSchemas, Summarize, Done };

FORGEPP_SERIALIZE_ENUM(Phase, {
    {Phase::Clean, "Clean"},
    {Phase::Prepare, "Prepare"},
    {Phase::BuildLayers, "BuildLayers"},
    {Phase::BuildFunctions, "BuildFunctions"},
    {Phase::BuildSchemas, "BuildSchemas"},
    {Phase::Summarize, "Summarize"},
    {Phase::Done, "Done"},
})

inline const char* toString(Phase phase) {
    switch (phase) {
        case Phase::Clean:          return "Clean";
        case Phase::Prepare:        return "Prepare";
        case Phase::BuildLayers:    return "BuildLayers";
        case Phase::BuildFunctions: return "BuildFunctions";
        case Phase::BuildSchemas:   return "BuildSchemas";
        case Phase::Summarize:      return "Summarize";
        case Phase::Done:           return "Done";
    }
    return "Unknown";
}

struct PhaseReport {
    Phase phase = Phase::BuildLayers;
    bool attempted = false;
    std::size_t found = 0;
    std::vector<BuildResult> results;

    std::size_t failedCount() const;
    std::size_t succeededCount() const;

    FORGEPP_SERIALIZE(PhaseReport, phase, attempted, found, results)
};

// ═══════════════════════════════════════════
//  BuildSummary
//  Aggregated once, after every phase has joined.
// ═══════════════════════════════════════════
struct BuildSummary {
    std::vector<PhaseReport> phases;
    std::string fatalError;                 // Clean/Prepare failure, empty otherwise
    bool cancelled = false;
    std::filesystem::path lambdasDir;
    std::filesystem::path layersDir;
    std::filesystem::path appsyncDir;

    bool succeeded() const;
    int exitCode() const { return succeeded() ? 0 : 1; }

    std::vector<BuildResult> allResults() const;
    std::vector<BuildResult> failures() const;
    const PhaseReport* phase(Phase p) const;

    nlohmann::json toJson() const;
};

} // namespace forgepp
