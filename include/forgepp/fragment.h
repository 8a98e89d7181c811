#pragma once
// ═══════════════════════════════════════════════════════════════════
//  forgepp/fragment.h — Schema fragments and their import directives
// ═══════════════════════════════════════════════════════════════════
//
//  A fragment is one .graphql source file. Lines of the exact form
//
//      import "<path>"
//
//  are import directives; they are removed from the fragment body and
//  replaced by the imported content during merging. Any other quoting
//  is ordinary schema text.
//
// ═══════════════════════════════════════════════════════════════════

#include "path.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace forgepp {

struct ImportReference {
    std::string path;
    path::ReferenceKind kind = path::ReferenceKind::RootRelative;
    std::size_t line = 0;
};

struct FragmentFile {
    std::filesystem::path path;      // canonical absolute path
    std::string displayPath;         // relative to the schema root
    std::string text;                // raw file content
    std::string body;                // text without import lines, blank edges trimmed
    std::vector<ImportReference> imports;
};

using FragmentPtr = std::shared_ptr<const FragmentFile>;

// ── Returns the quoted path when `line` is an import directive ──
std::optional<std::string> parseImportDirective(std::string_view line);

// ── Splits raw text into body and ordered import references ──
FragmentFile parseFragment(std::filesystem::path canonicalPath,
                           std::string displayPath,
                           std::string text);

// ═══════════════════════════════════════════
//  class FragmentCache
//  Loads each canonical path at most once per run. Fragments are
//  immutable, so concurrent schema units share them read-only.
// ═══════════════════════════════════════════
class FragmentCache {
public:
    explicit FragmentCache(std::filesystem::path schemaRoot);

    // Throws std::runtime_error when the file cannot be read
    FragmentPtr load(const std::filesystem::path& canonicalPath);

    const std::filesystem::path& schemaRoot() const { return schemaRoot_; }
    std::size_t size() const;

private:
    std::filesystem::path schemaRoot_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, FragmentPtr> fragments_;
};

} // namespace forgepp
