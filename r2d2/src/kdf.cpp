#include "kdf.hpp"
#include <stdexcept>
#include <openssl/evp.h>

extern "C" {
#include "SP800-185.h"
}

static std::string hex_encode(const uint8_t* data, size_t len) {
    static const char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += kHex[data[i] >> 4];
        out += kHex[data[i] & 0x0F];
    }
    return out;
}

// NOTE: XKCP KMAC256 takes lengths in BITS
SecretBytes derive_payload_key(const SecretBytes& content_key) {
    static const char*  kCustom    = "r2d2-content-v1";
    static const size_t kCustomLen = 15; // strlen(kCustom)
    static const char*  kMessage   = "payload";
    static const size_t kMessageLen = 7;

    SecretBytes key(32);
    if (KMAC256(content_key.data(), content_key.size() * 8,
                (const uint8_t*)kMessage, kMessageLen * 8,
                key.data(),               256,
                (const uint8_t*)kCustom,  kCustomLen * 8) != 0)
        throw std::runtime_error("KMAC256 KDF failed");
    return key;
}

std::string sha256_hex(const std::string& data) {
    uint8_t md[32];
    unsigned int md_len = 0;
    if (EVP_Digest(data.data(), data.size(), md, &md_len, EVP_sha256(), nullptr) != 1 ||
        md_len != 32)
        throw std::runtime_error("SHA-256 digest failed");
    return hex_encode(md, 32);
}
