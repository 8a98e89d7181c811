#pragma once
// ═══════════════════════════════════════════════════════════════════
//  forgepp/config.h — Project layout and build options
// ═══════════════════════════════════════════════════════════════════
//
//  Defaults describe the conventional layout:
//
//    <root>/src/handlers/*_handler.py        → build/lambdas/<name>.zip
//    <root>/src/{application,domain,orm}/    (bundled into every function)
//    <root>/src/{adapters,utils}/            → build/layers/<name>.zip
//    <root>/src/api/graphql/apps/*.graphql   → build/appsync/<name>.graphql
//
//  An optional <root>/forgepp.json overrides any of them:
//
//    {
//      "layers": ["adapters", "utils", "clients"],
//      "max_archive_bytes": 10485760,
//      "jobs": 4
//    }
//
// ═══════════════════════════════════════════════════════════════════

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace forgepp {

inline constexpr const char* kConfigFileName = "forgepp.json";

struct Config {
    std::filesystem::path projectRoot;

    // ── Sources ──
    std::filesystem::path srcDir;
    std::filesystem::path handlersDir;
    std::filesystem::path graphqlDir;       // schema root for root-relative imports
    std::filesystem::path schemaAppsDir;    // entry points
    std::vector<std::string> functionModuleDirs = {"application", "domain", "orm"};
    std::vector<std::string> layers = {"adapters", "utils"};
    std::string handlerSuffix = "_handler.py";
    std::string schemaExtension = ".graphql";

    // ── Outputs ──
    std::filesystem::path buildDir;
    std::filesystem::path lambdasDir;
    std::filesystem::path layersDir;
    std::filesystem::path appsyncDir;
    std::vector<std::filesystem::path> extraCleanDirs;
    std::string summaryFileName = "build-summary.json";

    // ── Packaging ──
    std::string layerRootDir = "python";
    std::uint64_t maxArchiveBytes = 50ull * 1024 * 1024;

    // ── Run ──
    unsigned jobs = 1;
    bool verbose = false;

    // Project root used when none is given: the nearest directory holding
    // forgepp.json, else the parent of a `builder` directory, else the
    // nearest `backend` directory, else `from` itself.
    static std::filesystem::path detectProjectRoot(const std::filesystem::path& from);

    // Default layout rooted at `projectRoot`
    static Config defaults(const std::filesystem::path& projectRoot);

    // Defaults, then forgepp.json when present. Throws EnvironmentError
    // on unreadable or ill-typed configuration.
    static Config load(const std::filesystem::path& projectRoot);

    // Applies the keys present in `j`; relative paths are taken from the project root.
    // Ill-typed values throw nlohmann::json::type_error.
    void apply(const nlohmann::json& j);

    std::filesystem::path summaryFile() const { return buildDir / summaryFileName; }
};

} // namespace forgepp
