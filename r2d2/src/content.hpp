#pragma once
#include "node_key.hpp"
#include "secret.hpp"
#include <vector>
#include <string>
#include <cstdint>

// File body and thumbnail encryption.
//
// Each block is AES-256-GCM under the payload key (derive_payload_key of the
// 32-byte content key). Nonce: big-endian block index in bytes 0..7, zero in
// 8..10, byte 11 is 1 on the last block of a stream and 0 otherwise.
// Stored layout per block: ciphertext || tag(16).
// Index 0 is the thumbnail, a stream of one block. Body blocks are numbered
// from 1; an empty body is a single empty last block.

namespace content {

static constexpr size_t   CONTENT_KEY_LEN   = 32;
static constexpr uint64_t THUMBNAIL_INDEX   = 0;
static constexpr uint64_t FIRST_BLOCK_INDEX = 1;

SecretBytes new_content_key();

// MESSAGE sealed to the file node's public key.
std::string seal_content_key(const SecretBytes& key, const node_key::PublicKey& file_pub);

// Wrong key: DecryptionError. Payload that is not 32 bytes: MalformedInputError.
SecretBytes unseal_content_key(const std::string& packet, const node_key::UnlockedKey& file_key);

std::vector<uint8_t> encrypt_block(const SecretBytes& key, uint64_t index,
                                   const std::vector<uint8_t>& plaintext, bool last);
std::vector<uint8_t> decrypt_block(const SecretBytes& key, uint64_t index,
                                   const std::vector<uint8_t>& ct_tag, bool last);

// Splits into blocks of at most block_size bytes, numbered from 1. Always
// yields at least one block.
std::vector<std::vector<uint8_t>> encrypt_payload(const SecretBytes& key,
                                                  const std::vector<uint8_t>& plaintext,
                                                  size_t block_size);

// blocks[i] is block number i + 1 and only the final one may carry the last
// flag. No blocks is a MalformedInputError; a missing tail, or blocks after
// the last one, a DecryptionError.
std::vector<uint8_t> decrypt_payload(const SecretBytes& key,
                                     const std::vector<std::vector<uint8_t>>& blocks);

std::vector<uint8_t> encrypt_thumbnail(const SecretBytes& key, const std::vector<uint8_t>& plaintext);
std::vector<uint8_t> decrypt_thumbnail(const SecretBytes& key, const std::vector<uint8_t>& ct_tag);

} // namespace content
