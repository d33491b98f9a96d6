#include "symmetric.hpp"
#include "errors.hpp"
#include <stdexcept>
#include <openssl/evp.h>

// ── AES-256-GCM core ─────────────────────────────────────────────────────────
// One context setup for both directions; `enc` is 1 to seal, 0 to open.

static EVP_CIPHER_CTX* gcm_begin(int enc, const uint8_t key[32], const uint8_t nonce[12])
{
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");

    if (EVP_CipherInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr, enc) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, AEAD_NONCE_LEN, nullptr) != 1 ||
        EVP_CipherInit_ex(ctx, nullptr, nullptr, key, nonce, enc) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("AES-256-GCM setup failed");
    }
    return ctx;
}

// Runs `in` through the cipher into `out` (resized to the bytes produced).
// Returns false only when the final step fails, which on open means the tag
// did not match.
static bool gcm_run(EVP_CIPHER_CTX* ctx, const uint8_t* in, size_t in_len,
                    std::vector<uint8_t>& out)
{
    out.assign(in_len + AEAD_TAG_LEN, 0);
    int len = 0;
    if (in_len > 0 && EVP_CipherUpdate(ctx, out.data(), &len, in, (int)in_len) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("AES-256-GCM update failed");
    }
    int tail = 0;
    bool ok = EVP_CipherFinal_ex(ctx, out.data() + len, &tail) == 1;
    out.resize((size_t)(len + tail));
    return ok;
}

static void gcm_encrypt(const uint8_t key[32], const uint8_t nonce[12],
                        const std::vector<uint8_t>& plaintext,
                        std::vector<uint8_t>& ct, uint8_t tag[16])
{
    EVP_CIPHER_CTX* ctx = gcm_begin(1, key, nonce);
    if (!gcm_run(ctx, plaintext.data(), plaintext.size(), ct) ||
        EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, AEAD_TAG_LEN, tag) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("AES-256-GCM seal failed");
    }
    EVP_CIPHER_CTX_free(ctx);
}

static std::vector<uint8_t> gcm_decrypt(const uint8_t key[32], const uint8_t nonce[12],
                                        const uint8_t* ct, size_t ct_len,
                                        const uint8_t tag[16])
{
    EVP_CIPHER_CTX* ctx = gcm_begin(0, key, nonce);
    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, AEAD_TAG_LEN,
                            const_cast<uint8_t*>(tag)) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("AES-256-GCM SET_TAG failed");
    }

    std::vector<uint8_t> pt;
    bool authentic = gcm_run(ctx, ct, ct_len, pt);
    EVP_CIPHER_CTX_free(ctx);
    if (!authentic) {
        OPENSSL_cleanse(pt.data(), pt.size());
        throw DecryptionError("AES-256-GCM authentication failed");
    }
    return pt;
}

namespace aead {

// ── ct || tag, caller nonce ──────────────────────────────────────────────────

std::vector<uint8_t> seal_at(const uint8_t key[32],
                             const uint8_t nonce[12],
                             const std::vector<uint8_t>& plaintext)
{
    std::vector<uint8_t> out;
    uint8_t tag[AEAD_TAG_LEN];
    gcm_encrypt(key, nonce, plaintext, out, tag);
    out.insert(out.end(), tag, tag + AEAD_TAG_LEN);
    return out;
}

std::vector<uint8_t> open_at(const uint8_t key[32],
                             const uint8_t nonce[12],
                             const std::vector<uint8_t>& ct_tag)
{
    if (ct_tag.size() < (size_t)AEAD_TAG_LEN)
        throw MalformedInputError("AES-256-GCM block too short");

    size_t ct_len = ct_tag.size() - AEAD_TAG_LEN;
    return gcm_decrypt(key, nonce, ct_tag.data(), ct_len, ct_tag.data() + ct_len);
}

} // namespace aead
