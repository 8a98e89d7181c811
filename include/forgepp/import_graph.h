#pragma once
// ═══════════════════════════════════════════════════════════════════
//  forgepp/import_graph.h — Merge a schema entry point and its imports
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    FragmentCache cache(schemaRoot);
//    ImportGraphResolver resolver(cache);
//    auto doc = resolver.resolve(schemaRoot / "apps" / "app.graphql");
//    fs::writeFileAtomicSync(out, doc.text);
//
//  Each fragment appears exactly once, after everything it imports:
//
//    # Source: common/types.graphql
//    type PageInfo { hasMore: Boolean }
//
//    # Source: apps/app.graphql
//    type Query { id: ID }
//
// ═══════════════════════════════════════════════════════════════════

#include "fragment.h"

#include <filesystem>
#include <string>
#include <vector>

namespace forgepp {

inline constexpr const char* kSourceHeaderPrefix = "# Source: ";

struct MergedDocument {
    std::filesystem::path entryPoint;
    std::string text;
    std::vector<std::string> sources;   // display paths, merge order, entry point last

    std::size_t fragmentCount() const { return sources.size(); }
};

class ImportGraphResolver {
public:
    explicit ImportGraphResolver(FragmentCache& cache) : cache_(cache) {}

    // Throws ImportNotFound or CircularImportError
    MergedDocument resolve(const std::filesystem::path& entryPoint) const;

private:
    FragmentCache& cache_;
};

} // namespace forgepp
