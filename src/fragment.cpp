// ═══════════════════════════════════════════════════════════════════
//  fragment.cpp — Fragment loading and import directive extraction
// ═══════════════════════════════════════════════════════════════════

#include "forgepp/fragment.h"
#include "forgepp/console.h"
#include "forgepp/fs.h"

#include <mutex>
#include <regex>
#include <sstream>

namespace forgepp {

namespace detail {

inline std::string_view trim(std::string_view s) {
    auto begin = s.find_first_not_of(" \t\r");
    if (begin == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

inline bool isBlank(std::string_view s) {
    return trim(s).empty();
}

} // namespace detail

std::optional<std::string> parseImportDirective(std::string_view line) {
    static const std::regex directive(R"re(^import[ \t]+"([^"]+)"$)re");

    auto trimmed = detail::trim(line);
    if (trimmed.rfind("import", 0) != 0) return std::nullopt;

    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_match(trimmed.begin(), trimmed.end(), match, directive)) {
        return std::nullopt;
    }
    return match[1].str();
}

FragmentFile parseFragment(std::filesystem::path canonicalPath,
                           std::string displayPath,
                           std::string text) {
    FragmentFile fragment;
    fragment.path = std::move(canonicalPath);
    fragment.displayPath = std::move(displayPath);

    std::vector<std::string_view> kept;
    std::string_view rest(text);
    std::size_t lineNo = 0;
    while (!rest.empty()) {
        auto nl = rest.find('\n');
        auto line = rest.substr(0, nl);
        rest = nl == std::string_view::npos ? std::string_view{} : rest.substr(nl + 1);
        ++lineNo;

        if (auto ref = parseImportDirective(line)) {
            fragment.imports.push_back({*ref, path::classify(*ref), lineNo});
            continue;
        }
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        kept.push_back(line);
    }

    std::size_t first = 0, last = kept.size();
    while (first < last && detail::isBlank(kept[first])) ++first;
    while (last > first && detail::isBlank(kept[last - 1])) --last;

    std::ostringstream body;
    for (std::size_t i = first; i < last; ++i) {
        if (i > first) body << '\n';
        body << kept[i];
    }
    fragment.body = body.str();
    fragment.text = std::move(text);
    return fragment;
}

FragmentCache::FragmentCache(std::filesystem::path schemaRoot)
    : schemaRoot_(path::canonical(schemaRoot)) {}

FragmentPtr FragmentCache::load(const std::filesystem::path& canonicalPath) {
    auto key = canonicalPath.generic_string();
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = fragments_.find(key);
        if (it != fragments_.end()) return it->second;
    }

    // Read outside the lock; a racing loader produces the same content
    auto text = fs::readFileSync(canonicalPath);
    auto fragment = std::make_shared<const FragmentFile>(
        parseFragment(canonicalPath, path::display(canonicalPath, schemaRoot_), std::move(text)));
    console::debug("Loaded fragment", fragment->displayPath,
                   "(" + std::to_string(fragment->imports.size()) + " imports)");

    std::unique_lock<std::shared_mutex> lock(mutex_);
    return fragments_.emplace(key, std::move(fragment)).first->second;
}

std::size_t FragmentCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return fragments_.size();
}

} // namespace forgepp
