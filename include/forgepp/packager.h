#pragma once
// ═══════════════════════════════════════════════════════════════════
//  forgepp/packager.h — Assemble deployable artifacts
// ═══════════════════════════════════════════════════════════════════
//
//  Function archive        Layer archive
//  ────────────────        ─────────────
//  user_handler.py         python/adapters/__init__.py
//  application/...         python/adapters/database/db_session.py
//  domain/...
//  orm/...
//
//  Every artifact is written to a temp file inside the destination
//  directory and renamed into place once complete.
//
// ═══════════════════════════════════════════════════════════════════

#include "config.h"
#include "import_graph.h"
#include "units.h"
#include "zip.h"

#include <filesystem>
#include <map>
#include <string>

namespace forgepp {

class ArtifactPackager {
public:
    explicit ArtifactPackager(const Config& config) : config_(config) {}

    // Throw PackagingError; the orchestrator turns that into a failed result
    BuildResult package(const FunctionUnit& unit, const std::filesystem::path& destinationDir) const;
    BuildResult package(const LayerUnit& unit, const std::filesystem::path& destinationDir) const;
    BuildResult packageSchema(const SchemaUnit& unit, const MergedDocument& document,
                              const std::filesystem::path& destinationDir) const;

    // Archive layout without writing anything (archive path -> source file)
    std::map<std::string, std::filesystem::path> layout(const FunctionUnit& unit) const;
    std::map<std::string, std::filesystem::path> layout(const LayerUnit& unit) const;

private:
    const Config& config_;

    BuildResult writeArchive(const std::string& name, UnitKind kind,
                             const std::map<std::string, std::filesystem::path>& files,
                             const std::filesystem::path& destination) const;
};

} // namespace forgepp
