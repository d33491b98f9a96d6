#include "content.hpp"
#include "errors.hpp"
#include "kdf.hpp"
#include "message.hpp"
#include "symmetric.hpp"
#include <openssl/rand.h>
#include <algorithm>
#include <cstddef>
#include <stdexcept>

namespace content {

static void block_nonce(uint64_t index, bool last, uint8_t nonce[AEAD_NONCE_LEN]) {
    for (int i = 0; i < AEAD_NONCE_LEN; ++i)
        nonce[i] = 0;
    for (int i = 0; i < 8; ++i)
        nonce[i] = (uint8_t)((index >> (56 - 8 * i)) & 0xFF);
    nonce[AEAD_NONCE_LEN - 1] = last ? 1 : 0;
}

static void require_key(const SecretBytes& key) {
    if (key.size() != CONTENT_KEY_LEN)
        throw std::invalid_argument("content key must be 32 bytes");
}

// ── Content key ──────────────────────────────────────────────────────────────

SecretBytes new_content_key() {
    SecretBytes key(CONTENT_KEY_LEN);
    if (RAND_bytes(key.data(), (int)CONTENT_KEY_LEN) != 1)
        throw std::runtime_error("RAND_bytes failed");
    return key;
}

std::string seal_content_key(const SecretBytes& key, const node_key::PublicKey& file_pub) {
    require_key(key);
    return message::seal_public(key.bytes(), file_pub);
}

SecretBytes unseal_content_key(const std::string& packet, const node_key::UnlockedKey& file_key) {
    SecretBytes key = message::open_public(packet, file_key);
    if (key.size() != CONTENT_KEY_LEN)
        throw MalformedInputError("content key packet: expected 32 bytes, got " +
                                  std::to_string(key.size()));
    return key;
}

// ── Blocks ───────────────────────────────────────────────────────────────────

std::vector<uint8_t> encrypt_block(const SecretBytes& key, uint64_t index,
                                   const std::vector<uint8_t>& plaintext, bool last)
{
    require_key(key);
    uint8_t nonce[AEAD_NONCE_LEN];
    block_nonce(index, last, nonce);
    SecretBytes pk = derive_payload_key(key);
    return aead::seal_at(pk.data(), nonce, plaintext);
}

std::vector<uint8_t> decrypt_block(const SecretBytes& key, uint64_t index,
                                   const std::vector<uint8_t>& ct_tag, bool last)
{
    require_key(key);
    uint8_t nonce[AEAD_NONCE_LEN];
    block_nonce(index, last, nonce);
    SecretBytes pk = derive_payload_key(key);
    return aead::open_at(pk.data(), nonce, ct_tag);
}

std::vector<std::vector<uint8_t>> encrypt_payload(const SecretBytes& key,
                                                  const std::vector<uint8_t>& plaintext,
                                                  size_t block_size)
{
    if (block_size == 0)
        throw std::invalid_argument("block size must be positive");

    size_t count = plaintext.empty() ? 1 : (plaintext.size() + block_size - 1) / block_size;

    std::vector<std::vector<uint8_t>> blocks;
    for (size_t i = 0; i < count; ++i) {
        size_t off = i * block_size;
        size_t n   = std::min(block_size, plaintext.size() - off);
        std::vector<uint8_t> chunk(plaintext.begin() + (std::ptrdiff_t)off,
                                   plaintext.begin() + (std::ptrdiff_t)(off + n));
        blocks.push_back(encrypt_block(key, FIRST_BLOCK_INDEX + i, chunk, i + 1 == count));
    }
    return blocks;
}

std::vector<uint8_t> decrypt_payload(const SecretBytes& key,
                                     const std::vector<std::vector<uint8_t>>& blocks)
{
    if (blocks.empty())
        throw MalformedInputError("payload: no blocks");

    std::vector<uint8_t> out;
    for (size_t i = 0; i < blocks.size(); ++i) {
        std::vector<uint8_t> pt = decrypt_block(key, FIRST_BLOCK_INDEX + i, blocks[i],
                                                i + 1 == blocks.size());
        out.insert(out.end(), pt.begin(), pt.end());
    }
    return out;
}

// ── Thumbnail ────────────────────────────────────────────────────────────────

std::vector<uint8_t> encrypt_thumbnail(const SecretBytes& key, const std::vector<uint8_t>& plaintext) {
    return encrypt_block(key, THUMBNAIL_INDEX, plaintext, true);
}

std::vector<uint8_t> decrypt_thumbnail(const SecretBytes& key, const std::vector<uint8_t>& ct_tag) {
    return decrypt_block(key, THUMBNAIL_INDEX, ct_tag, true);
}

} // namespace content
