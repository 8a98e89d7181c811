#pragma once
// ═══════════════════════════════════════════════════════════════════
//  forgepp/discovery.h — Enumerate the units a build will produce
// ═══════════════════════════════════════════════════════════════════
//
//  Pure listing: names and existence only, no file is read. Each
//  collection is sorted by unit name; an empty one is not an error.
//
// ═══════════════════════════════════════════════════════════════════

#include "config.h"
#include "units.h"

#include <string>
#include <vector>

namespace forgepp {

struct DiscoveredUnits {
    std::vector<FunctionUnit> functions;
    std::vector<LayerUnit> layers;
    std::vector<SchemaUnit> schemas;
};

class UnitDiscoverer {
public:
    explicit UnitDiscoverer(const Config& config) : config_(config) {}

    DiscoveredUnits discover() const;

    std::vector<FunctionUnit> discoverFunctions() const;
    std::vector<LayerUnit> discoverLayers() const;
    std::vector<SchemaUnit> discoverSchemas() const;

private:
    const Config& config_;

    std::vector<std::filesystem::path> sharedModules(std::string& error) const;
};

} // namespace forgepp
