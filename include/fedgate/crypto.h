#pragma once
// ═══════════════════════════════════════════════════════════════════
//  fedgate/crypto.h — SHA-256 signatures and random ids (OpenSSL)
// ═══════════════════════════════════════════════════════════════════

#include <stdexcept>
#include <string>

#include <openssl/evp.h>
#include <openssl/rand.h>

namespace fedgate::crypto {

inline std::string toHex(const unsigned char* data, std::size_t len) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out(len * 2, '0');
    for (std::size_t i = 0; i < len; ++i) {
        out[2 * i] = kDigits[data[i] >> 4];
        out[2 * i + 1] = kDigits[data[i] & 0x0f];
    }
    return out;
}

// ── Incremental digest over several parts, each length-prefixed ──
class Sha256 {
public:
    Sha256() : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_ || EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx_);
            throw std::runtime_error("Failed to initialize SHA-256 context");
        }
    }
    ~Sha256() { EVP_MD_CTX_free(ctx_); }

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    Sha256& update(const std::string& part) {
        auto length = std::to_string(part.size()) + ":";
        if (EVP_DigestUpdate(ctx_, length.data(), length.size()) != 1 ||
            EVP_DigestUpdate(ctx_, part.data(), part.size()) != 1) {
            throw std::runtime_error("SHA-256 update failed");
        }
        return *this;
    }

    std::string hex() {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_, hash, &len) != 1) {
            throw std::runtime_error("SHA-256 finalization failed");
        }
        return toHex(hash, len);
    }

private:
    EVP_MD_CTX* ctx_;
};

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

} // namespace fedgate::crypto
