#pragma once
#include "node.hpp"
#include "secret.hpp"
#include <string>
#include <cstdint>

// A node keypair: an OpenPGP transferable key with an EdDSA (Ed25519)
// primary for signing and an ECDH (Curve25519) subkey for encryption,
// bound to a "Name <email>" user id by its self-signatures.
//
// Stored form is an armored PGP PRIVATE KEY BLOCK whose secret packets are
// protected with the node's session key (iterated and salted S2K, SHA-256,
// AES-256).

namespace node_key {

struct PublicKey {
    std::string armored;   // PGP PUBLIC KEY BLOCK
    std::string uid;
    std::string key_id;    // primary key id, 16 uppercase hex digits

    std::string email() const;
};

// Decrypted key. Lives only in memory as an unprotected secret key block,
// wiped on destruction.
struct UnlockedKey {
    PublicKey    pub;
    SecretString secret;
};

UnlockedKey generate(const Identity& id);

// Armored PRIVATE KEY BLOCK with every secret packet protected by `passphrase`.
std::string lock(const UnlockedKey& key, const std::string& passphrase,
                 uint32_t iterations);

// Throws DecryptionError on a wrong passphrase, MalformedInputError on a
// block that does not parse, is not protected, fails its self-signature or
// asks for more than S2K_MAX_ITERATIONS.
UnlockedKey unlock(const std::string& armored_private, const std::string& passphrase);

// Accepts either a PRIVATE or a PUBLIC KEY BLOCK. Self-signatures are checked.
PublicKey read_public(const std::string& armored);

// Text between '<' and '>' in a "Name <email>" uid, or the uid itself if it
// has no angle brackets.
std::string email_of(const std::string& uid);

} // namespace node_key
