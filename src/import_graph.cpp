// ═══════════════════════════════════════════════════════════════════
//  import_graph.cpp — Depth-first import merge with cycle detection
// ═══════════════════════════════════════════════════════════════════
//
//  The walk keeps its own frame stack instead of recursing, so the
//  depth of an import chain is limited by memory rather than by the
//  host call stack, and the active chain is always available for the
//  CircularImportError message.
//
// ═══════════════════════════════════════════════════════════════════

#include "forgepp/import_graph.h"
#include "forgepp/console.h"
#include "forgepp/errors.h"

#include <sstream>
#include <unordered_set>

namespace forgepp {

namespace {

struct Frame {
    FragmentPtr fragment;
    std::size_t nextImport = 0;
};

// Owned by a single resolve() call
struct ResolutionContext {
    std::unordered_set<std::string> onStack;
    std::unordered_set<std::string> merged;
    std::vector<Frame> stack;
    std::vector<FragmentPtr> output;

    void push(FragmentPtr fragment) {
        onStack.insert(fragment->path.generic_string());
        stack.push_back({std::move(fragment), 0});
    }

    void finishTop() {
        auto fragment = std::move(stack.back().fragment);
        stack.pop_back();
        auto key = fragment->path.generic_string();
        onStack.erase(key);
        merged.insert(key);
        output.push_back(std::move(fragment));
    }

    std::vector<std::string> chainTo(const std::string& reentered) const {
        std::vector<std::string> chain;
        chain.reserve(stack.size() + 1);
        for (auto& frame : stack) chain.push_back(frame.fragment->displayPath);
        chain.push_back(reentered);
        return chain;
    }
};

FragmentPtr loadOrThrow(FragmentCache& cache, const std::filesystem::path& target,
                        const std::string& importingFile, const std::string& reference) {
    try {
        return cache.load(target);
    } catch (const std::runtime_error& e) {
        throw ImportNotFound(importingFile, reference, target.generic_string() + " (" + e.what() + ")");
    }
}

std::string render(const std::vector<FragmentPtr>& blocks) {
    std::ostringstream out;
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        if (i > 0) out << '\n';
        out << kSourceHeaderPrefix << blocks[i]->displayPath << '\n';
        if (!blocks[i]->body.empty()) out << blocks[i]->body << '\n';
    }
    return out.str();
}

} // namespace

MergedDocument ImportGraphResolver::resolve(const std::filesystem::path& entryPoint) const {
    const auto& schemaRoot = cache_.schemaRoot();
    auto entry = path::canonical(entryPoint);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(entry, ec)) {
        throw ImportNotFound(path::display(entry, schemaRoot), entryPoint.string(),
                             entry.generic_string());
    }

    ResolutionContext ctx;
    ctx.push(loadOrThrow(cache_, entry, path::display(entry, schemaRoot), entryPoint.string()));

    while (!ctx.stack.empty()) {
        auto& frame = ctx.stack.back();
        const auto& imports = frame.fragment->imports;

        if (frame.nextImport == imports.size()) {
            ctx.finishTop();
            continue;
        }

        // push() below may reallocate the stack; keep the importer alive by value
        FragmentPtr importer = frame.fragment;
        const auto& ref = imports[frame.nextImport++];
        auto importingFile = importer->displayPath + ":" + std::to_string(ref.line);

        auto target = path::resolveImport(ref.path, importer->path.parent_path(),
                                          schemaRoot, importingFile);
        auto key = target.generic_string();

        // On-stack first: a cycle back to the entry point is never "already merged"
        if (ctx.onStack.count(key)) {
            throw CircularImportError(ctx.chainTo(path::display(target, schemaRoot)));
        }
        if (ctx.merged.count(key)) {
            console::debug("Skipping already merged", ref.path, "in", importingFile);
            continue;
        }

        console::debug("Resolving import", ref.path, "->", path::display(target, schemaRoot));
        ctx.push(loadOrThrow(cache_, target, importingFile, ref.path));
    }

    MergedDocument doc;
    doc.entryPoint = entry;
    doc.text = render(ctx.output);
    doc.sources.reserve(ctx.output.size());
    for (auto& fragment : ctx.output) doc.sources.push_back(fragment->displayPath);
    return doc;
}

} // namespace forgepp
