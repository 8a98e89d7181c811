#pragma once
// ═══════════════════════════════════════════════════════════════════
//  forgepp/fs.h — File system operations and atomic artifact writes
// ═══════════════════════════════════════════════════════════════════

#include "crypto.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace forgepp::fs {

namespace stdfs = std::filesystem;

// ═══════════════════════════════════════════
//  Synchronous API
// ═══════════════════════════════════════════

inline std::string readFileSync(const stdfs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("ENOENT: no such file or directory, open '" + path.string() + "'");
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("EIO: i/o error, read '" + path.string() + "'");
    }
    return oss.str();
}

inline void writeFileSync(const stdfs::path& path, const std::string& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("EACCES: permission denied, open '" + path.string() + "'");
    }
    file << data;
}

inline bool existsSync(const stdfs::path& path) {
    std::error_code ec;
    return stdfs::exists(path, ec);
}

inline bool isFileSync(const stdfs::path& path) {
    std::error_code ec;
    return stdfs::is_regular_file(path, ec);
}

inline bool isDirectorySync(const stdfs::path& path) {
    std::error_code ec;
    return stdfs::is_directory(path, ec);
}

// ── Entries skipped by every listing: dotfiles and byte-code caches ──
inline bool isIgnoredEntry(const stdfs::path& p) {
    auto name = p.filename().string();
    if (name.empty() || name[0] == '.') return true;
    if (name == "__pycache__") return true;
    return p.extension() == ".pyc";
}

// ── Regular files, plus entries whose type cannot be read ──
// A symlink loop is kept so the unit that owns it fails when it is
// packaged; a dangling link is not_found and is skipped.
inline bool isListedEntry(const stdfs::directory_entry& entry) {
    std::error_code ec;
    auto st = entry.status(ec);
    if (stdfs::is_regular_file(st)) return true;
    return ec && st.type() == stdfs::file_type::none;
}

// ── Regular files directly under `dir`, sorted ──
// Throws std::filesystem::filesystem_error when `dir` cannot be read.
inline std::vector<stdfs::path> readdirFilesSync(const stdfs::path& dir) {
    std::vector<stdfs::path> result;
    for (auto& entry : stdfs::directory_iterator(dir)) {
        if (isIgnoredEntry(entry.path())) continue;
        if (isListedEntry(entry)) result.push_back(entry.path());
    }
    std::sort(result.begin(), result.end());
    return result;
}

// ── Regular files anywhere under `dir`, sorted, ignored subtrees pruned ──
// Symlinked directories are not followed.
inline std::vector<stdfs::path> walkFilesSync(const stdfs::path& dir) {
    std::vector<stdfs::path> result;
    auto it = stdfs::recursive_directory_iterator(dir);
    for (auto end = stdfs::recursive_directory_iterator(); it != end; ++it) {
        if (isIgnoredEntry(it->path())) {
            std::error_code ec;
            if (it->is_directory(ec)) it.disable_recursion_pending();
            continue;
        }
        if (isListedEntry(*it)) result.push_back(it->path());
    }
    std::sort(result.begin(), result.end());
    return result;
}

// ═══════════════════════════════════════════
//  class AtomicFile
//  Writes to a hidden temp file beside the destination and renames
//  it into place on commit(). Without a commit the temp file is
//  removed, so the destination never holds a partial artifact.
// ═══════════════════════════════════════════
class AtomicFile {
public:
    explicit AtomicFile(stdfs::path destination)
        : destination_(std::move(destination)) {
        tempPath_ = destination_.parent_path() /
            ("." + destination_.filename().string() + "." + crypto::randomHex(6) + ".tmp");
        out_.open(tempPath_, std::ios::binary | std::ios::trunc);
        if (!out_.is_open()) {
            throw std::runtime_error("EACCES: permission denied, open '" + tempPath_.string() + "'");
        }
    }

    ~AtomicFile() { discard(); }

    AtomicFile(const AtomicFile&) = delete;
    AtomicFile& operator=(const AtomicFile&) = delete;

    AtomicFile& write(const std::string& data) {
        out_.write(data.data(), static_cast<std::streamsize>(data.size()));
        return *this;
    }

    // ── Flush, close and move into place ──
    void commit() {
        if (committed_) return;
        out_.flush();
        bool good = out_.good();
        out_.close();
        if (!good || out_.fail()) {
            discard();
            throw std::runtime_error("EIO: write failed, '" + tempPath_.string() + "'");
        }
        std::error_code ec;
        stdfs::rename(tempPath_, destination_, ec);
        if (ec) {
            discard();
            throw std::runtime_error("rename '" + tempPath_.string() + "' -> '" +
                                     destination_.string() + "': " + ec.message());
        }
        committed_ = true;
    }

    void discard() noexcept {
        if (committed_) return;
        if (out_.is_open()) out_.close();
        std::error_code ec;
        stdfs::remove(tempPath_, ec);
    }

    bool committed() const { return committed_; }
    const stdfs::path& destination() const { return destination_; }
    const stdfs::path& tempPath() const { return tempPath_; }

private:
    stdfs::path destination_;
    stdfs::path tempPath_;
    std::ofstream out_;
    bool committed_ = false;
};

inline void writeFileAtomicSync(const stdfs::path& path, const std::string& data) {
    AtomicFile file(path);
    file.write(data);
    file.commit();
}

} // namespace forgepp::fs
