// ═══════════════════════════════════════════════════════════════════
//  config.cpp — Layout defaults and forgepp.json overrides
// ═══════════════════════════════════════════════════════════════════

#include "forgepp/config.h"
#include "forgepp/console.h"
#include "forgepp/errors.h"
#include "forgepp/fs.h"
#include "forgepp/path.h"

#include <algorithm>

namespace forgepp {

std::filesystem::path Config::detectProjectRoot(const std::filesystem::path& from) {
    auto start = path::canonical(from);

    for (auto dir = start; ; dir = dir.parent_path()) {
        if (fs::isFileSync(dir / kConfigFileName)) return dir;
        if (dir == dir.root_path() || dir.parent_path() == dir) break;
    }

    if (start.filename() == "builder") return start.parent_path();
    for (auto dir = start; ; dir = dir.parent_path()) {
        if (dir.filename() == "backend") return dir;
        if (dir == dir.root_path() || dir.parent_path() == dir) break;
    }
    return start;
}

Config Config::defaults(const std::filesystem::path& projectRoot) {
    Config c;
    c.projectRoot   = path::canonical(projectRoot);
    c.srcDir        = c.projectRoot / "src";
    c.handlersDir   = c.srcDir / "handlers";
    c.graphqlDir    = c.srcDir / "api" / "graphql";
    c.schemaAppsDir = c.graphqlDir / "apps";

    c.buildDir   = c.projectRoot / "build";
    c.lambdasDir = c.buildDir / "lambdas";
    c.layersDir  = c.buildDir / "layers";
    c.appsyncDir = c.buildDir / "appsync";

    c.extraCleanDirs = {c.projectRoot / "devops" / "infrastructure" / "local" / ".extracted"};
    return c;
}

Config Config::load(const std::filesystem::path& projectRoot) {
    auto config = defaults(projectRoot);
    auto file = config.projectRoot / kConfigFileName;
    if (!fs::isFileSync(file)) return config;

    try {
        config.apply(nlohmann::json::parse(fs::readFileSync(file)));
    } catch (const EnvironmentError&) {
        throw;
    } catch (const nlohmann::json::exception& e) {
        throw EnvironmentError("Invalid " + file.string() + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw EnvironmentError("Cannot read " + file.string() + ": " + e.what());
    }
    console::debug("Loaded configuration from", file.string());
    return config;
}

void Config::apply(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw EnvironmentError(std::string(kConfigFileName) + " must contain a JSON object");
    }

    auto dir = [&](const char* key, std::filesystem::path& target) {
        if (j.contains(key)) target = path::normalize(projectRoot / j.at(key).get<std::string>());
    };

    // Nested directories follow a relocated parent unless set explicitly
    dir("src_dir", srcDir);
    if (j.contains("src_dir")) {
        handlersDir = srcDir / "handlers";
        graphqlDir  = srcDir / "api" / "graphql";
    }
    dir("handlers_dir", handlersDir);
    dir("graphql_dir", graphqlDir);
    if (j.contains("src_dir") || j.contains("graphql_dir")) schemaAppsDir = graphqlDir / "apps";
    dir("apps_dir", schemaAppsDir);

    dir("build_dir", buildDir);
    if (j.contains("build_dir")) {
        lambdasDir = buildDir / "lambdas";
        layersDir  = buildDir / "layers";
        appsyncDir = buildDir / "appsync";
    }
    dir("lambdas_dir", lambdasDir);
    dir("layers_dir", layersDir);
    dir("appsync_dir", appsyncDir);

    if (j.contains("function_modules")) functionModuleDirs = j.at("function_modules").get<std::vector<std::string>>();
    if (j.contains("layers")) layers = j.at("layers").get<std::vector<std::string>>();
    if (j.contains("handler_suffix")) handlerSuffix = j.at("handler_suffix").get<std::string>();
    if (j.contains("layer_root")) layerRootDir = j.at("layer_root").get<std::string>();
    if (j.contains("max_archive_bytes")) maxArchiveBytes = j.at("max_archive_bytes").get<std::uint64_t>();
    if (j.contains("jobs")) jobs = std::max(1u, j.at("jobs").get<unsigned>());
    if (j.contains("summary_file")) summaryFileName = j.at("summary_file").get<std::string>();
    if (j.contains("verbose")) verbose = j.at("verbose").get<bool>();

    if (j.contains("clean_extra")) {
        extraCleanDirs.clear();
        for (auto& entry : j.at("clean_extra").get<std::vector<std::string>>()) {
            extraCleanDirs.push_back(path::normalize(projectRoot / entry));
        }
    }
}

} // namespace forgepp
