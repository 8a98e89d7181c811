#pragma once
// ═══════════════════════════════════════════════════════════════════
//  forgepp/crypto.h — Artifact digests, base64, random suffixes
// ═══════════════════════════════════════════════════════════════════

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

#include <openssl/rand.h>
#include <openssl/sha.h>

namespace forgepp::crypto {

inline std::string toHex(const unsigned char* data, std::size_t len) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < len; i++) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

// ── Raw 32-byte SHA-256 digest ──
inline std::string sha256Digest(const std::string& input) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), hash);
    return std::string(reinterpret_cast<const char*>(hash), SHA256_DIGEST_LENGTH);
}

inline std::string sha256(const std::string& input) {
    auto digest = sha256Digest(input);
    return toHex(reinterpret_cast<const unsigned char*>(digest.data()), digest.size());
}

inline std::string base64Encode(const std::string& input) {
    static const char table[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    int val = 0, valb = -6;
    for (unsigned char c : input) {
        val = (val << 8) + c;
        valb += 8;
        while (valb >= 0) {
            out.push_back(table[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) out.push_back(table[((val << 8) >> (valb + 8)) & 0x3F]);
    while (out.size() % 4) out.push_back('=');
    return out;
}

// ── Digest in the form the deployment target reports as CodeSha256 ──
inline std::string codeSha256(const std::string& artifactBytes) {
    return base64Encode(sha256Digest(artifactBytes));
}

inline std::string randomBytes(std::size_t length) {
    std::string buf(length, '\0');
    if (RAND_bytes(reinterpret_cast<unsigned char*>(buf.data()),
                   static_cast<int>(length)) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
    return buf;
}

inline std::string randomHex(std::size_t length) {
    auto bytes = randomBytes(length);
    return toHex(reinterpret_cast<const unsigned char*>(bytes.data()), length);
}

} // namespace forgepp::crypto
