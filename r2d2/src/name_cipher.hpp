#pragma once
#include "node_key.hpp"
#include <string>

namespace name_cipher {

struct EncryptedName {
    std::string ciphertext;   // MESSAGE sealed to the node key
    std::string name_hash;
};

// ASCII lower-case, ASCII whitespace trimmed at both ends.
std::string canonical_name(const std::string& name);

// Lowercase hex SHA-256 of canonical_name(name). Lets the server detect
// duplicate names in a folder without reading them.
std::string name_hash(const std::string& name);

EncryptedName encrypt_name(const std::string& plaintext, const node_key::PublicKey& key);

// DecryptionError / MalformedInputError on a bad ciphertext.
std::string decrypt_name(const std::string& ciphertext, const node_key::UnlockedKey& key);

// Returns `placeholder` (and logs a warning) instead of throwing.
std::string decrypt_name_or(const std::string& ciphertext,
                            const node_key::UnlockedKey& key,
                            const std::string& placeholder);

} // namespace name_cipher
