// ═══════════════════════════════════════════════════════════════════
//  validator.cpp — Brace balance and duplicate definition checks
// ═══════════════════════════════════════════════════════════════════

#include "forgepp/validator.h"
#include "forgepp/import_graph.h"

#include <algorithm>
#include <cstring>
#include <unordered_map>
#include <unordered_set>

namespace forgepp {

std::string SourceLocation::toString() const {
    return source + ":" + std::to_string(line);
}

bool ValidationReport::has(ProblemKind kind) const {
    return std::any_of(problems.begin(), problems.end(),
                       [kind](const ValidationProblem& p) { return p.kind == kind; });
}

std::vector<std::string> ValidationReport::messages() const {
    std::vector<std::string> out;
    out.reserve(problems.size());
    for (auto& p : problems) out.push_back(p.message);
    return out;
}

namespace detail {

// ═══════════════════════════════════════════
//  SchemaScanner
//  Walks the merged text once. Tracks the current `# Source:` block
//  so every location is reported against the original fragment.
// ═══════════════════════════════════════════
class SchemaScanner {
public:
    explicit SchemaScanner(const std::string& source)
        : source_(source) {}

    ValidationReport scan() {
        while (pos_ < source_.size()) {
            char c = peek();
            if (c == '\n') {
                advance();
            } else if (c == ' ' || c == '\t' || c == '\r' || c == ',') {
                advance();
            } else if (c == '#') {
                skipComment();
            } else if (c == '"') {
                sawToken_ = true;
                pendingKeyword_ = false;
                skipString();
            } else if (c == '{') {
                sawToken_ = true;
                pendingKeyword_ = false;
                openBraces_.push_back(location());
                advance();
            } else if (c == '}') {
                sawToken_ = true;
                pendingKeyword_ = false;
                if (openBraces_.empty()) {
                    if (unmatchedClose_++ == 0) firstUnmatched_ = location();
                } else {
                    openBraces_.pop_back();
                }
                advance();
            } else if (isIdentStart(c)) {
                sawToken_ = true;
                auto loc = location();
                onWord(parseIdentifier(), loc);
            } else {
                sawToken_ = true;
                pendingKeyword_ = false;
                advance();
            }
        }
        finish();
        return std::move(report_);
    }

private:
    const std::string& source_;
    std::size_t pos_ = 0;
    std::size_t line_ = 1;
    bool atLineStart_ = true;

    std::string currentSource_ = "<document>";
    std::size_t headerLine_ = 0;

    std::vector<SourceLocation> openBraces_;
    std::size_t unmatchedClose_ = 0;
    SourceLocation firstUnmatched_;

    std::string previousWord_;
    bool pendingKeyword_ = false;
    std::unordered_map<std::string, SourceLocation> definitions_;
    std::unordered_set<std::string> rootTypes_;
    bool sawToken_ = false;

    ValidationReport report_;

    char peek(std::size_t ahead = 0) const {
        return pos_ + ahead < source_.size() ? source_[pos_ + ahead] : '\0';
    }

    char advance() {
        if (pos_ >= source_.size()) return '\0';
        char c = source_[pos_++];
        if (c == '\n') {
            line_++;
            atLineStart_ = true;
        } else {
            atLineStart_ = false;
        }
        return c;
    }

    SourceLocation location() const {
        return {currentSource_, line_ - headerLine_};
    }

    static bool isIdentStart(char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
    }

    static bool isIdentChar(char c) {
        return isIdentStart(c) || (c >= '0' && c <= '9');
    }

    std::string parseIdentifier() {
        std::string result;
        while (pos_ < source_.size() && isIdentChar(source_[pos_])) {
            result += advance();
        }
        return result;
    }

    // ── Comments; a `# Source:` header at column 0 switches the current block ──
    void skipComment() {
        bool header = atLineStart_;
        std::size_t start = pos_;
        while (pos_ < source_.size() && peek() != '\n') advance();

        if (!header) return;
        auto prefixLen = std::strlen(kSourceHeaderPrefix);
        if (source_.compare(start, prefixLen, kSourceHeaderPrefix) != 0) return;

        auto name = source_.substr(start + prefixLen, pos_ - start - prefixLen);
        if (!name.empty() && name.back() == '\r') name.pop_back();
        currentSource_ = name;
        headerLine_ = line_;
    }

    // ── "..." and """...""" literals, braces inside them do not count ──
    void skipString() {
        if (peek(1) == '"' && peek(2) == '"') {
            advance(); advance(); advance();
            while (pos_ < source_.size()) {
                if (peek() == '\\' && peek(1) == '"' && peek(2) == '"' && peek(3) == '"') {
                    advance(); advance(); advance(); advance();
                } else if (peek() == '"' && peek(1) == '"' && peek(2) == '"') {
                    advance(); advance(); advance();
                    return;
                } else {
                    advance();
                }
            }
            return;
        }

        advance();
        while (pos_ < source_.size() && peek() != '"' && peek() != '\n') {
            if (peek() == '\\') advance();
            advance();
        }
        if (peek() == '"') advance();
    }

    static bool isDefinitionKeyword(const std::string& word) {
        return word == "type" || word == "input" || word == "enum" ||
               word == "interface" || word == "union" || word == "scalar";
    }

    void onWord(const std::string& word, const SourceLocation& loc) {
        if (!openBraces_.empty()) {
            previousWord_.clear();
            pendingKeyword_ = false;
            return;
        }

        if (pendingKeyword_) {
            pendingKeyword_ = false;
            bool extension = previousWord_ == "extend";
            if (word == "Query" || word == "Mutation") rootTypes_.insert(word);
            if (!extension) recordDefinition(word, loc);
            previousWord_.clear();
            return;
        }

        if (word == "schema") rootTypes_.insert(word);

        if (isDefinitionKeyword(word)) {
            pendingKeyword_ = true;
            // keep previousWord_ so `extend type X` is recognised
            return;
        }
        previousWord_ = word;
    }

    void recordDefinition(const std::string& name, const SourceLocation& loc) {
        auto [it, inserted] = definitions_.emplace(name, loc);
        if (inserted) return;
        report_.problems.push_back({
            ProblemKind::DuplicateDefinition,
            "Duplicate definition '" + name + "': first defined at " +
                it->second.toString() + ", redefined at " + loc.toString(),
            loc
        });
    }

    void finish() {
        if (!openBraces_.empty()) {
            auto& outermost = openBraces_.front();
            report_.problems.push_back({
                ProblemKind::UnbalancedBraces,
                "Unbalanced braces: " + std::to_string(openBraces_.size()) +
                    " unclosed '{' (outermost opened at " + outermost.toString() + ")",
                outermost
            });
        }
        if (unmatchedClose_ > 0) {
            report_.problems.push_back({
                ProblemKind::UnbalancedBraces,
                "Unbalanced braces: " + std::to_string(unmatchedClose_) +
                    " unmatched '}' (first at " + firstUnmatched_.toString() + ")",
                firstUnmatched_
            });
        }
        if (!sawToken_) {
            report_.problems.push_back({
                ProblemKind::EmptyDocument,
                "Merged document contains no schema definitions",
                {currentSource_, 0}
            });
        } else if (rootTypes_.empty()) {
            report_.warnings.push_back("Schema defines neither a Query nor a Mutation type");
        }
    }
};

} // namespace detail

ValidationReport SchemaValidator::validate(const std::string& mergedText) const {
    detail::SchemaScanner scanner(mergedText);
    return scanner.scan();
}

} // namespace forgepp
