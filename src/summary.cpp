// ═══════════════════════════════════════════════════════════════════
//  summary.cpp — Result aggregation and the machine-readable summary
// ═══════════════════════════════════════════════════════════════════

#include "forgepp/units.h"

#include <algorithm>
#include <iterator>

namespace forgepp {

std::size_t PhaseReport::failedCount() const {
    return static_cast<std::size_t>(std::count_if(results.begin(), results.end(),
        [](const BuildResult& r) { return r.failed(); }));
}

std::size_t PhaseReport::succeededCount() const {
    return static_cast<std::size_t>(std::count_if(results.begin(), results.end(),
        [](const BuildResult& r) { return r.succeeded(); }));
}

bool BuildSummary::succeeded() const {
    if (!fatalError.empty() || cancelled) return false;
    return std::none_of(phases.begin(), phases.end(),
        [](const PhaseReport& p) { return p.failedCount() > 0; });
}

std::vector<BuildResult> BuildSummary::allResults() const {
    std::vector<BuildResult> out;
    for (auto& p : phases) out.insert(out.end(), p.results.begin(), p.results.end());
    return out;
}

std::vector<BuildResult> BuildSummary::failures() const {
    std::vector<BuildResult> out;
    for (auto& p : phases) {
        std::copy_if(p.results.begin(), p.results.end(), std::back_inserter(out),
                     [](const BuildResult& r) { return r.failed(); });
    }
    return out;
}

const PhaseReport* BuildSummary::phase(Phase p) const {
    auto it = std::find_if(phases.begin(), phases.end(),
                           [p](const PhaseReport& r) { return r.phase == p; });
    return it == phases.end() ? nullptr : &*it;
}

nlohmann::json BuildSummary::toJson() const {
    nlohmann::json j = {
        {"success", succeeded()},
        {"exitCode", exitCode()},
        {"cancelled", cancelled},
        {"phases", forgepp::toJson(phases)},
        {"artifacts", {
            {"lambdas", lambdasDir.string()},
            {"layers", layersDir.string()},
            {"appsync", appsyncDir.string()},
        }},
    };
    j["fatalError"] = fatalError.empty() ? nlohmann::json(nullptr) : nlohmann::json(fatalError);

    nlohmann::json failed = nlohmann::json::array();
    for (auto& r : failures()) {
        failed.push_back({{"name", r.name}, {"kind", r.kind}, {"error", r.error}, {"detail", r.errorDetail}});
    }
    j["failed"] = failed;
    return j;
}

} // namespace forgepp
