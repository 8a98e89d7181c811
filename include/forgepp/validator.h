#pragma once
// ═══════════════════════════════════════════════════════════════════
//  forgepp/validator.h — Structural checks on merged schema documents
// ═══════════════════════════════════════════════════════════════════
//
//  Not a GraphQL grammar. A lexical scan that skips strings, block
//  strings and comments, tracks brace depth, and collects top-level
//  definition names. Every check runs; every problem is reported.
//
// ═══════════════════════════════════════════════════════════════════

#include <string>
#include <vector>

namespace forgepp {

struct SourceLocation {
    std::string source;     // display path from the nearest `# Source:` header
    std::size_t line = 0;   // line within that source block

    std::string toString() const;
};

enum class ProblemKind {
    UnbalancedBraces,
    DuplicateDefinition,
    EmptyDocument,
};

struct ValidationProblem {
    ProblemKind kind;
    std::string message;
    SourceLocation location;
};

struct ValidationReport {
    std::vector<ValidationProblem> problems;
    std::vector<std::string> warnings;

    bool valid() const { return problems.empty(); }
    bool has(ProblemKind kind) const;
    std::vector<std::string> messages() const;
};

class SchemaValidator {
public:
    // Never throws
    ValidationReport validate(const std::string& mergedText) const;
};

} // namespace forgepp
