#pragma once
#include "node_key.hpp"
#include "secret.hpp"
#include <vector>
#include <string>
#include <cstdint>

// Armored PGP MESSAGE blocks.
//
// Password mode: one SKESK packet (iterated and salted S2K, SHA-256,
// AES-256) followed by a SEIPD packet with MDC.
// Public-key mode: one PKESK packet for the recipient's ECDH subkey followed
// by a SEIPD packet with MDC.
// The literal data packet inside is never compressed.

namespace message {

std::string seal_password(const std::vector<uint8_t>& plaintext,
                          const std::string& password,
                          uint32_t iterations);

std::string seal_public(const std::vector<uint8_t>& plaintext,
                        const node_key::PublicKey& recipient);

// Wrong password or key, or a message with no session key packet for it, is
// a DecryptionError. A broken block, or a password S2K above
// S2K_MAX_ITERATIONS, is a MalformedInputError.
SecretBytes open_password(const std::string& armored, const std::string& password);
SecretBytes open_public(const std::string& armored, const node_key::UnlockedKey& key);

} // namespace message
