#pragma once
#include <vector>
#include <cstdint>

// AES-256-GCM with a caller-supplied nonce and no associated data.
// Output/expected layout: ciphertext(N) || tag(16), the layout the transfer
// layer uploads for file blocks.
//
// Authentication failure is a DecryptionError; input too short to hold the
// framing is a MalformedInputError.

static constexpr int AEAD_KEY_LEN   = 32;
static constexpr int AEAD_NONCE_LEN = 12;
static constexpr int AEAD_TAG_LEN   = 16;

namespace aead {

std::vector<uint8_t> seal_at(const uint8_t key[32],
                             const uint8_t nonce[12],
                             const std::vector<uint8_t>& plaintext);

std::vector<uint8_t> open_at(const uint8_t key[32],
                             const uint8_t nonce[12],
                             const std::vector<uint8_t>& ct_tag);

} // namespace aead
