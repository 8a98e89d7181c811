#pragma once
// ═══════════════════════════════════════════════════════════════════
//  forgepp/compress.h — Raw deflate / inflate and CRC-32 (zlib)
// ═══════════════════════════════════════════════════════════════════
//
//  ZIP entries carry raw deflate streams (no zlib or gzip wrapper),
//  hence the negative window bits below.
//
// ═══════════════════════════════════════════════════════════════════

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <zlib.h>

namespace forgepp::compress {

inline std::uint32_t crc32(const std::string& data) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    const auto* bytes = reinterpret_cast<const Bytef*>(data.data());
    std::size_t remaining = data.size();
    while (remaining > 0) {
        auto chunk = static_cast<uInt>(std::min<std::size_t>(remaining, 1u << 30));
        crc = ::crc32(crc, bytes, chunk);
        bytes += chunk;
        remaining -= chunk;
    }
    return static_cast<std::uint32_t>(crc);
}

// ── Raw deflate of a whole buffer ──
inline std::string deflateRaw(const std::string& input, int level = Z_DEFAULT_COMPRESSION) {
    z_stream zs{};
    if (deflateInit2(&zs, level, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());

    std::string output;
    output.resize(deflateBound(&zs, static_cast<uLong>(input.size())));

    zs.next_out = reinterpret_cast<Bytef*>(output.data());
    zs.avail_out = static_cast<uInt>(output.size());

    int ret = deflate(&zs, Z_FINISH);
    deflateEnd(&zs);
    if (ret != Z_STREAM_END) {
        throw std::runtime_error("deflate failed: " + std::to_string(ret));
    }

    output.resize(zs.total_out);
    return output;
}

// ── Raw inflate of a whole buffer ──
inline std::string inflateRaw(const std::string& input) {
    z_stream zs{};
    if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) {
        throw std::runtime_error("inflateInit2 failed");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());

    std::string output;
    char buf[32768];
    int ret;
    do {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof(buf);
        ret = inflate(&zs, Z_NO_FLUSH);
        output.append(buf, sizeof(buf) - zs.avail_out);
    } while (ret == Z_OK);

    inflateEnd(&zs);
    if (ret != Z_STREAM_END) {
        throw std::runtime_error("inflate failed: " + std::to_string(ret));
    }
    return output;
}

} // namespace forgepp::compress
