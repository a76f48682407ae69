#pragma once
// ═══════════════════════════════════════════════════════════════════
//  peerlink/crypto.h — Random identifiers and streaming SHA-256
// ═══════════════════════════════════════════════════════════════════

#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include <openssl/evp.h>
#include <openssl/rand.h>

namespace peerlink::crypto {

inline std::string toHex(const unsigned char* data, std::size_t len) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < len; i++) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

// ═══════════════════════════════════════════
//  Random bytes
// ═══════════════════════════════════════════

inline std::string randomBytes(std::size_t length) {
    std::string buf(length, '\0');
    if (RAND_bytes(reinterpret_cast<unsigned char*>(buf.data()),
                   static_cast<int>(length)) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
    return buf;
}

// ── Uniform integer in [min, max] without modulo bias ──
inline std::uint32_t randomInRange(std::uint32_t min, std::uint32_t max) {
    if (min > max) throw std::invalid_argument("randomInRange: min > max");
    const std::uint64_t span  = static_cast<std::uint64_t>(max) - min + 1;
    const std::uint64_t limit = (std::uint64_t{1} << 32) - ((std::uint64_t{1} << 32) % span);
    while (true) {
        std::uint32_t value = 0;
        if (RAND_bytes(reinterpret_cast<unsigned char*>(&value), sizeof(value)) != 1) {
            throw std::runtime_error("Failed to generate random bytes");
        }
        if (value < limit) return min + static_cast<std::uint32_t>(value % span);
    }
}

// ═══════════════════════════════════════════
//  UUID v4
// ═══════════════════════════════════════════

inline std::string uuid() {
    auto bytes = randomBytes(16);
    auto* b = reinterpret_cast<unsigned char*>(bytes.data());
    b[6] = (b[6] & 0x0F) | 0x40; // Version 4
    b[8] = (b[8] & 0x3F) | 0x80; // Variant 1
    char buf[37];
    std::snprintf(buf, sizeof(buf),
        "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
        b[0],b[1],b[2],b[3],b[4],b[5],b[6],b[7],
        b[8],b[9],b[10],b[11],b[12],b[13],b[14],b[15]);
    return buf;
}

// ═══════════════════════════════════════════
//  Incremental SHA-256
//  Fed while an artifact streams to disk, so the file is never
//  read back just to be hashed.
// ═══════════════════════════════════════════
class Sha256 {
public:
    Sha256() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
        if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("Failed to initialise SHA-256");
        }
    }

    void update(const char* data, std::size_t size) {
        if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
            throw std::runtime_error("SHA-256 update failed");
        }
    }

    // Lowercase hex digest; the object cannot be updated afterwards
    std::string hexDigest() {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), digest, &len) != 1) {
            throw std::runtime_error("SHA-256 finalisation failed");
        }
        return toHex(digest, len);
    }

private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
};

inline std::string sha256(const std::string& input) {
    Sha256 hash;
    hash.update(input.data(), input.size());
    return hash.hexDigest();
}

} // namespace peerlink::crypto
