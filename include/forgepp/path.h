#pragma once
// ═══════════════════════════════════════════════════════════════════
//  forgepp/path.h — Path normalization and import reference resolution
// ═══════════════════════════════════════════════════════════════════
//
//  Every path used as a map key or compared for equality goes through
//  path::canonical() first, so `./a.graphql`, `a.graphql` and
//  `sub/../a.graphql` all name the same graph node.
//
// ═══════════════════════════════════════════════════════════════════

#include "errors.h"

#include <algorithm>
#include <filesystem>
#include <string>
#include <system_error>

namespace forgepp::path {

namespace stdfs = std::filesystem;

// ── path::join ── Variadic join of path segments
template <typename... Args>
stdfs::path join(const stdfs::path& first, const Args&... rest) {
    stdfs::path result(first);
    ((result /= rest), ...);
    return result;
}

// ── path::normalize ── Collapse . and .. lexically
inline stdfs::path normalize(const stdfs::path& p) {
    return p.lexically_normal();
}

// ── path::canonical ── Absolute, normalized, symlinks resolved where they exist
inline stdfs::path canonical(const stdfs::path& p) {
    std::error_code ec;
    auto absolute = stdfs::absolute(p, ec);
    if (ec) return normalize(p);
    auto resolved = stdfs::weakly_canonical(absolute, ec);
    if (ec) return normalize(absolute);
    return resolved;
}

// ── path::display ── Generic (`/`) form relative to `root`, absolute when outside it
inline std::string display(const stdfs::path& p, const stdfs::path& root) {
    auto rel = p.lexically_relative(root);
    if (rel.empty() || *rel.begin() == "..") return p.generic_string();
    return rel.generic_string();
}

// ── path::isWithin ──
inline bool isWithin(const stdfs::path& p, const stdfs::path& root) {
    auto rel = p.lexically_relative(root);
    return !rel.empty() && *rel.begin() != "..";
}

enum class ReferenceKind {
    Relative,       // ./x or ../x: against the importing file's directory
    RootRelative,   // anything else: against the schema root
};

inline ReferenceKind classify(const std::string& reference) {
    if (reference.rfind("./", 0) == 0 || reference.rfind("../", 0) == 0) {
        return ReferenceKind::Relative;
    }
    return ReferenceKind::RootRelative;
}

// ── path::resolveImport ──
// Maps an import reference to the canonical path of an existing fragment.
// Throws ImportNotFound naming the importing file and the raw reference.
inline stdfs::path resolveImport(const std::string& reference,
                                 const stdfs::path& currentFileDir,
                                 const stdfs::path& schemaRoot,
                                 const std::string& importingFile) {
    stdfs::path target;
    if (classify(reference) == ReferenceKind::Relative) {
        target = currentFileDir / reference;
    } else {
        // A leading slash still means "from the schema root"
        auto trimmed = reference.substr(std::min(reference.find_first_not_of('/'), reference.size()));
        target = schemaRoot / trimmed;
    }
    auto candidate = path::canonical(path::normalize(target));

    std::error_code ec;
    if (!stdfs::is_regular_file(candidate, ec)) {
        throw ImportNotFound(importingFile, reference, candidate.generic_string());
    }
    return candidate;
}

} // namespace forgepp::path
