#pragma once
#include "node.hpp"
#include "kdf.hpp"
#include "secret.hpp"
#include <string>
#include <cstdint>

// Inputs for creating a share, folder or file under an unlocked parent.
struct GenerateRequest {
    std::string        name;
    Identity           owner;
    NodeKind           kind = NodeKind::File;
    std::string        parent_private_key;          // PRIVATE KEY BLOCK, locked with parent_session_key
    std::string        parent_passphrase;           // parent's sealed key packet
    std::string        parent_passphrase_signature; // optional
    SessionKey         parent_session_key;
    std::string        parent_key_packet_id;
    ExtendedAttributes xattrs;
    // Key that signed the parent's packet. Empty means the parent signed it
    // itself, which only holds for a user node.
    std::string        parent_signer_key;
    uint32_t           iterations = S2K_DEFAULT_ITERATIONS;
};

// Everything the server stores for the new node, plus the secrets the caller
// keeps in memory.
struct GeneratedKeys {
    std::string node_key;
    std::string node_passphrase;
    std::string node_passphrase_signature;
    SecretBytes content_key;             // files only
    std::string content_key_packet;      // files only
    std::string content_key_signature;   // files only
    std::string name_hash;
    std::string folder_name;             // encrypted name
    std::string xattrs;                  // empty when no attributes
    std::string key_packet_id;
    SessionKey  session_key;
};

struct MoveRequest {
    NodeKind    kind = NodeKind::File;
    std::string name;
    SessionKey  item_session_key;
    std::string item_key_packet_id;
    std::string target_private_key;      // locked with target_session_key
    SessionKey  target_session_key;
    std::string target_key_packet_id;
    uint32_t    iterations = S2K_DEFAULT_ITERATIONS;
};

struct MoveResult {
    std::string node_passphrase;
    std::string node_passphrase_signature;
    std::string name_hash;
    std::string key_packet_id;
};

namespace node_keygen {

// Throws SignatureInvalidError if the parent's own packet signature does not
// verify, DecryptionError if the parent key does not open.
GeneratedKeys generate_node_keys(const GenerateRequest& req);

// A fresh user (root) node: packet sealed with the root secret, self-signed.
GeneratedKeys generate_user_keys(const Identity& owner, const SecretString& root_secret,
                                 uint32_t iterations);

// Re-seal an item's session key under a new parent. The item keeps its key,
// session key and packet id, so its subtree stays reachable.
MoveResult prepare_move(const MoveRequest& req);

// Descriptor the server would hand back for a freshly generated node. The id
// is the key packet id.
NodeDescriptor to_descriptor(const GeneratedKeys& g, NodeKind kind,
                             const std::string& owner_email);

// msgpack map (str -> bin) sealed with the node's session key.
std::string        seal_xattrs(const ExtendedAttributes& attrs, const SessionKey& session,
                               uint32_t iterations);
ExtendedAttributes open_xattrs(const std::string& armored, const SessionKey& session);

} // namespace node_keygen
