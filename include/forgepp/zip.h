#pragma once
// ═══════════════════════════════════════════════════════════════════
//  forgepp/zip.h — Deterministic ZIP archive writer and reader
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    zip::ZipWriter writer;
//    writer.add("user_handler.py", fs::readFileSync(handler));
//    writer.add("domain/entities/user.py", fs::readFileSync(entity));
//    std::string bytes = writer.finish();
//
//  Entries are written in path order with a fixed 1980-01-01 timestamp
//  and 0644 permissions, so identical inputs give identical bytes.
//
// ═══════════════════════════════════════════════════════════════════

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <zlib.h>

namespace forgepp::zip {

struct ArchiveEntry {
    std::string name;
    std::uint16_t method = 0;           // 0 = stored, 8 = deflate
    std::uint32_t crc = 0;
    std::uint64_t compressedSize = 0;
    std::uint64_t size = 0;
    std::uint32_t externalAttributes = 0;
    std::string data;                   // uncompressed content
};

class ZipWriter {
public:
    explicit ZipWriter(int level = Z_DEFAULT_COMPRESSION) : level_(level) {}

    // Compresses immediately. Throws std::invalid_argument on an empty,
    // absolute or duplicate archive path.
    void add(const std::string& archivePath, const std::string& contents);

    bool contains(const std::string& archivePath) const { return entries_.count(archivePath) > 0; }
    std::size_t entryCount() const { return entries_.size(); }
    std::uint64_t uncompressedSize() const { return uncompressed_; }

    // Serializes the archive. Throws std::length_error past the
    // classic (non-ZIP64) format limits.
    std::string finish() const;

private:
    struct Pending {
        std::uint16_t method;
        std::uint32_t crc;
        std::uint64_t size;
        std::string payload;
    };

    int level_;
    std::map<std::string, Pending> entries_;
    std::uint64_t uncompressed_ = 0;
};

// ── Parses and inflates a whole archive; throws std::runtime_error if malformed ──
std::vector<ArchiveEntry> readArchive(const std::string& bytes);

} // namespace forgepp::zip
