#pragma once
// ═══════════════════════════════════════════════════════════════════
//  forgepp/errors.h — Build error taxonomy
// ═══════════════════════════════════════════════════════════════════
//
//  Unit-scoped errors (ImportNotFound, CircularImportError,
//  ValidationError, PackagingError) are caught at the unit boundary
//  and turned into a failed BuildResult. EnvironmentError aborts the
//  whole run.
//
// ═══════════════════════════════════════════════════════════════════

#include <stdexcept>
#include <string>
#include <vector>

namespace forgepp {

enum class ErrorKind {
    None,
    ImportNotFound,
    CircularImport,
    Validation,
    Packaging,
    Environment,
    Internal,
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:           return "None";
        case ErrorKind::ImportNotFound: return "ImportNotFound";
        case ErrorKind::CircularImport: return "CircularImportError";
        case ErrorKind::Validation:     return "ValidationError";
        case ErrorKind::Packaging:      return "PackagingError";
        case ErrorKind::Environment:    return "EnvironmentError";
        case ErrorKind::Internal:       return "InternalError";
    }
    return "Unknown";
}

// ── Base of every error the build raises ──
class BuildError : public std::runtime_error {
public:
    BuildError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// ── An import directive that does not resolve to an existing fragment ──
class ImportNotFound : public BuildError {
public:
    ImportNotFound(std::string importingFile, std::string reference, std::string attempted)
        : BuildError(ErrorKind::ImportNotFound,
                     "Import \"" + reference + "\" in " + importingFile +
                     " not found (resolved to " + attempted + ")"),
          importingFile_(std::move(importingFile)),
          reference_(std::move(reference)),
          attempted_(std::move(attempted)) {}

    const std::string& importingFile() const { return importingFile_; }
    const std::string& reference() const { return reference_; }
    const std::string& attemptedPath() const { return attempted_; }

private:
    std::string importingFile_;
    std::string reference_;
    std::string attempted_;
};

// ── A fragment reached while it is still on the resolution stack ──
class CircularImportError : public BuildError {
public:
    explicit CircularImportError(std::vector<std::string> chain)
        : BuildError(ErrorKind::CircularImport, "Circular import: " + render(chain)),
          chain_(std::move(chain)) {}

    // Stack content at detection time followed by the re-reached fragment
    const std::vector<std::string>& chain() const { return chain_; }

private:
    std::vector<std::string> chain_;

    static std::string render(const std::vector<std::string>& chain) {
        std::string out;
        for (std::size_t i = 0; i < chain.size(); ++i) {
            if (i > 0) out += " -> ";
            out += chain[i];
        }
        return out;
    }
};

// ── A merged schema that failed validation; every problem is in what() ──
class ValidationError : public BuildError {
public:
    ValidationError(const std::string& schema, std::vector<std::string> problems)
        : BuildError(ErrorKind::Validation,
                     "Schema " + schema + " failed validation: " + render(problems)),
          problems_(std::move(problems)) {}

    const std::vector<std::string>& problems() const { return problems_; }

private:
    std::vector<std::string> problems_;

    static std::string render(const std::vector<std::string>& problems) {
        std::string out;
        for (std::size_t i = 0; i < problems.size(); ++i) {
            if (i > 0) out += "; ";
            out += problems[i];
        }
        return out;
    }
};

class PackagingError : public BuildError {
public:
    explicit PackagingError(const std::string& message)
        : BuildError(ErrorKind::Packaging, message) {}
};

class EnvironmentError : public BuildError {
public:
    explicit EnvironmentError(const std::string& message)
        : BuildError(ErrorKind::Environment, message) {}
};

} // namespace forgepp
