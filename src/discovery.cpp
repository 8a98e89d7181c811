// ═══════════════════════════════════════════════════════════════════
//  discovery.cpp — Handler, layer and schema entry point listing
// ═══════════════════════════════════════════════════════════════════

#include "forgepp/discovery.h"
#include "forgepp/console.h"
#include "forgepp/fs.h"

#include <algorithm>

namespace forgepp {

namespace {

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

DiscoveredUnits UnitDiscoverer::discover() const {
    return {discoverFunctions(), discoverLayers(), discoverSchemas()};
}

// Every function carries the complete shared-module set so the handler's
// own imports resolve unmodified after extraction. A module directory that
// cannot be listed is reported through `error` and fails every function.
std::vector<std::filesystem::path> UnitDiscoverer::sharedModules(std::string& error) const {
    std::vector<std::filesystem::path> modules;
    for (auto& dir : config_.functionModuleDirs) {
        auto root = config_.srcDir / dir;
        if (!fs::isDirectorySync(root)) {
            console::debug("Function module directory not found:", root.string());
            continue;
        }
        try {
            auto files = fs::walkFilesSync(root);
            modules.insert(modules.end(), files.begin(), files.end());
        } catch (const std::filesystem::filesystem_error& e) {
            console::error("Cannot list function modules:", e.what());
            if (error.empty()) error = e.what();
        }
    }
    return modules;
}

std::vector<FunctionUnit> UnitDiscoverer::discoverFunctions() const {
    std::vector<FunctionUnit> units;
    if (!fs::isDirectorySync(config_.handlersDir)) {
        console::warn("Handlers directory not found:", config_.handlersDir.string());
        return units;
    }

    std::string modulesError;
    auto modules = sharedModules(modulesError);
    for (auto& file : fs::readdirFilesSync(config_.handlersDir)) {
        auto filename = file.filename().string();
        if (filename[0] == '_' || !endsWith(filename, config_.handlerSuffix)) continue;

        FunctionUnit unit;
        unit.name = file.stem().string();
        unit.handler = file;
        unit.moduleRoot = config_.srcDir;
        unit.sharedModules = modules;
        unit.listingError = modulesError;
        units.push_back(std::move(unit));
    }
    return units;
}

std::vector<LayerUnit> UnitDiscoverer::discoverLayers() const {
    std::vector<LayerUnit> units;
    for (auto& name : config_.layers) {
        auto dir = config_.srcDir / name;
        if (!fs::isDirectorySync(dir)) {
            console::warn("Declared layer has no source directory:", dir.string());
            continue;
        }
        LayerUnit unit{name, dir, {}, {}};
        try {
            unit.files = fs::walkFilesSync(dir);
        } catch (const std::filesystem::filesystem_error& e) {
            console::error("Cannot list layer", name + ":", e.what());
            unit.listingError = e.what();
        }
        units.push_back(std::move(unit));
    }
    std::sort(units.begin(), units.end(),
              [](const LayerUnit& a, const LayerUnit& b) { return a.name < b.name; });
    return units;
}

std::vector<SchemaUnit> UnitDiscoverer::discoverSchemas() const {
    std::vector<SchemaUnit> units;
    if (!fs::isDirectorySync(config_.schemaAppsDir)) {
        console::warn("Schema entry point directory not found:", config_.schemaAppsDir.string());
        return units;
    }
    for (auto& file : fs::readdirFilesSync(config_.schemaAppsDir)) {
        if (file.extension() != config_.schemaExtension) continue;
        units.push_back({file.stem().string(), file});
    }
    return units;
}

} // namespace forgepp
