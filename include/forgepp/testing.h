#pragma once
// ═══════════════════════════════════════════════════════════════════
//  forgepp/testing.h — Scratch project trees for tests
// ═══════════════════════════════════════════════════════════════════
//
//  testing::TempTree tree;
//  tree.write("src/handlers/users_handler.py", "def handler(e, c): pass\n");
//  auto config = Config::defaults(tree.root());
//
// ═══════════════════════════════════════════════════════════════════

#include "crypto.h"
#include "fs.h"

#include <filesystem>
#include <initializer_list>
#include <string>
#include <system_error>
#include <utility>

namespace forgepp::testing {

// ═══════════════════════════════════════════
//  class TempTree
//  A fresh directory under the system temp dir, removed on destruction.
// ═══════════════════════════════════════════
class TempTree {
public:
    TempTree() {
        root_ = std::filesystem::temp_directory_path() / ("forgepp-test-" + crypto::randomHex(8));
        std::filesystem::create_directories(root_);
        root_ = std::filesystem::canonical(root_);
    }

    ~TempTree() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempTree(const TempTree&) = delete;
    TempTree& operator=(const TempTree&) = delete;

    const std::filesystem::path& root() const { return root_; }

    std::filesystem::path path(const std::string& relPath) const { return root_ / relPath; }

    // Creates parent directories as needed
    std::filesystem::path write(const std::string& relPath, const std::string& content) {
        auto target = root_ / relPath;
        std::filesystem::create_directories(target.parent_path());
        fs::writeFileSync(target, content);
        return target;
    }

    std::filesystem::path mkdir(const std::string& relPath) {
        auto target = root_ / relPath;
        std::filesystem::create_directories(target);
        return target;
    }

    std::string read(const std::string& relPath) const { return fs::readFileSync(root_ / relPath); }

    bool exists(const std::string& relPath) const { return fs::existsSync(root_ / relPath); }

private:
    std::filesystem::path root_;
};

// ── Bulk write: {{"a.graphql", "..."}, {"b/c.graphql", "..."}} ──
inline void writeTree(TempTree& tree,
                      std::initializer_list<std::pair<std::string, std::string>> files) {
    for (auto& [rel, content] : files) tree.write(rel, content);
}

} // namespace forgepp::testing
