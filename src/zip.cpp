// ═══════════════════════════════════════════════════════════════════
//  zip.cpp — ZIP (PKWARE APPNOTE 6.3) encoding on top of zlib
// ═══════════════════════════════════════════════════════════════════

#include "forgepp/zip.h"
#include "forgepp/compress.h"

#include <limits>
#include <stdexcept>

namespace forgepp::zip {

namespace {

constexpr std::uint32_t kLocalHeaderSig   = 0x04034b50;
constexpr std::uint32_t kCentralHeaderSig = 0x02014b50;
constexpr std::uint32_t kEndOfCentralSig  = 0x06054b50;

constexpr std::uint16_t kVersionNeeded = 20;
constexpr std::uint16_t kVersionMadeBy = (3 << 8) | 20;    // unix, 2.0
constexpr std::uint16_t kFlagUtf8      = 1 << 11;
constexpr std::uint16_t kDosTime       = 0;
constexpr std::uint16_t kDosDate       = (0 << 9) | (1 << 5) | 1;  // 1980-01-01
constexpr std::uint32_t kRegularFile   = 0100644u << 16;

constexpr std::uint16_t kMethodStored  = 0;
constexpr std::uint16_t kMethodDeflate = 8;

constexpr std::size_t kLocalHeaderSize   = 30;
constexpr std::size_t kCentralHeaderSize = 46;
constexpr std::size_t kEndOfCentralSize  = 22;

void put16(std::string& out, std::uint16_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

void put32(std::string& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

std::uint16_t get16(const std::string& in, std::size_t at) {
    if (at + 2 > in.size()) throw std::runtime_error("zip: truncated archive");
    return static_cast<std::uint16_t>(static_cast<unsigned char>(in[at]) |
                                      (static_cast<unsigned char>(in[at + 1]) << 8));
}

std::uint32_t get32(const std::string& in, std::size_t at) {
    if (at + 4 > in.size()) throw std::runtime_error("zip: truncated archive");
    std::uint32_t v = 0;
    for (int i = 3; i >= 0; --i) v = (v << 8) | static_cast<unsigned char>(in[at + i]);
    return v;
}

std::uint32_t narrow32(std::uint64_t v, const char* what) {
    if (v >= std::numeric_limits<std::uint32_t>::max()) {
        throw std::length_error(std::string("zip: ") + what + " exceeds 4 GiB (ZIP64 unsupported)");
    }
    return static_cast<std::uint32_t>(v);
}

} // namespace

void ZipWriter::add(const std::string& archivePath, const std::string& contents) {
    if (archivePath.empty() || archivePath.front() == '/' || archivePath.back() == '/') {
        throw std::invalid_argument("zip: invalid entry name '" + archivePath + "'");
    }
    if (entries_.count(archivePath)) {
        throw std::invalid_argument("zip: duplicate entry '" + archivePath + "'");
    }

    Pending entry;
    entry.crc = compress::crc32(contents);
    entry.size = contents.size();
    auto deflated = compress::deflateRaw(contents, level_);
    if (deflated.size() < contents.size()) {
        entry.method = kMethodDeflate;
        entry.payload = std::move(deflated);
    } else {
        entry.method = kMethodStored;
        entry.payload = contents;
    }
    uncompressed_ += entry.size;
    entries_.emplace(archivePath, std::move(entry));
}

std::string ZipWriter::finish() const {
    if (entries_.size() >= 0xFFFF) {
        throw std::length_error("zip: too many entries (ZIP64 unsupported)");
    }

    std::string out;
    std::string central;
    for (auto& [name, e] : entries_) {
        auto offset = narrow32(out.size(), "archive");
        auto csize = narrow32(e.payload.size(), "entry");
        auto usize = narrow32(e.size, "entry");
        auto nameLen = static_cast<std::uint16_t>(name.size());

        put32(out, kLocalHeaderSig);
        put16(out, kVersionNeeded);
        put16(out, kFlagUtf8);
        put16(out, e.method);
        put16(out, kDosTime);
        put16(out, kDosDate);
        put32(out, e.crc);
        put32(out, csize);
        put32(out, usize);
        put16(out, nameLen);
        put16(out, 0);
        out += name;
        out += e.payload;

        put32(central, kCentralHeaderSig);
        put16(central, kVersionMadeBy);
        put16(central, kVersionNeeded);
        put16(central, kFlagUtf8);
        put16(central, e.method);
        put16(central, kDosTime);
        put16(central, kDosDate);
        put32(central, e.crc);
        put32(central, csize);
        put32(central, usize);
        put16(central, nameLen);
        put16(central, 0);      // extra
        put16(central, 0);      // comment
        put16(central, 0);      // disk
        put16(central, 0);      // internal attributes
        put32(central, kRegularFile);
        put32(central, offset);
        central += name;
    }

    auto centralOffset = narrow32(out.size(), "archive");
    auto centralSize = narrow32(central.size(), "central directory");
    out += central;

    auto count = static_cast<std::uint16_t>(entries_.size());
    put32(out, kEndOfCentralSig);
    put16(out, 0);
    put16(out, 0);
    put16(out, count);
    put16(out, count);
    put32(out, centralSize);
    put32(out, centralOffset);
    put16(out, 0);
    narrow32(out.size(), "archive");
    return out;
}

std::vector<ArchiveEntry> readArchive(const std::string& bytes) {
    if (bytes.size() < kEndOfCentralSize) throw std::runtime_error("zip: archive too small");

    // End-of-central-directory record, allowing for a trailing comment
    std::size_t eocd = std::string::npos;
    std::size_t floor = bytes.size() > kEndOfCentralSize + 0xFFFF
        ? bytes.size() - kEndOfCentralSize - 0xFFFF : 0;
    for (std::size_t at = bytes.size() - kEndOfCentralSize + 1; at-- > floor;) {
        if (get32(bytes, at) == kEndOfCentralSig) {
            eocd = at;
            break;
        }
    }
    if (eocd == std::string::npos) throw std::runtime_error("zip: end of central directory not found");

    auto count = get16(bytes, eocd + 10);
    std::size_t at = get32(bytes, eocd + 16);

    std::vector<ArchiveEntry> entries;
    entries.reserve(count);
    for (std::uint16_t i = 0; i < count; ++i) {
        if (get32(bytes, at) != kCentralHeaderSig) throw std::runtime_error("zip: bad central header");

        ArchiveEntry e;
        e.method = get16(bytes, at + 10);
        e.crc = get32(bytes, at + 16);
        e.compressedSize = get32(bytes, at + 20);
        e.size = get32(bytes, at + 24);
        auto nameLen = get16(bytes, at + 28);
        auto extraLen = get16(bytes, at + 30);
        auto commentLen = get16(bytes, at + 32);
        e.externalAttributes = get32(bytes, at + 38);
        std::size_t local = get32(bytes, at + 42);
        if (at + kCentralHeaderSize + nameLen > bytes.size()) throw std::runtime_error("zip: truncated archive");
        e.name = bytes.substr(at + kCentralHeaderSize, nameLen);
        at += kCentralHeaderSize + nameLen + extraLen + commentLen;

        if (get32(bytes, local) != kLocalHeaderSig) throw std::runtime_error("zip: bad local header for " + e.name);
        std::size_t dataAt = local + kLocalHeaderSize + get16(bytes, local + 26) + get16(bytes, local + 28);
        if (dataAt + e.compressedSize > bytes.size()) throw std::runtime_error("zip: truncated data for " + e.name);
        auto payload = bytes.substr(dataAt, e.compressedSize);

        if (e.method == kMethodDeflate) {
            e.data = compress::inflateRaw(payload);
        } else if (e.method == kMethodStored) {
            e.data = std::move(payload);
        } else {
            throw std::runtime_error("zip: unsupported method " + std::to_string(e.method) + " for " + e.name);
        }
        if (e.data.size() != e.size || compress::crc32(e.data) != e.crc) {
            throw std::runtime_error("zip: checksum mismatch for " + e.name);
        }
        entries.push_back(std::move(e));
    }
    return entries;
}

} // namespace forgepp::zip
