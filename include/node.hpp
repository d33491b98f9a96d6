#pragma once
#include <string>
#include <vector>
#include <map>
#include <cstdint>

enum class NodeKind { User, Share, Folder, File };

// "user", "share", "folder", "file"; the keyType field of a key packet.
std::string node_kind_str(NodeKind k);
NodeKind    node_kind_from_str(const std::string& s);

struct Identity {
    std::string name;
    std::string email;

    // "Name <email>", the user id bound into a node key.
    std::string uid() const;
};

// Key -> opaque value. Sealed under the node's session key.
using ExtendedAttributes = std::map<std::string, std::vector<uint8_t>>;

// Everything the server hands back for one node. All blobs are armored.
struct NodeDescriptor {
    std::string id;
    NodeKind    kind = NodeKind::Folder;
    std::string owner_email;            // claimed owner, checked against signatures
    std::string node_key;               // PRIVATE KEY BLOCK, locked with the session key
    std::string node_passphrase;        // MESSAGE: key packet sealed with the parent secret
    std::string node_passphrase_signature;  // SIGNATURE, empty if absent
    std::string name;                   // MESSAGE sealed to the node key, empty if absent
    std::string content_key_packet;     // files only
    std::string content_key_signature;  // files only
    std::string xattrs;                 // MESSAGE sealed with the session key, optional
};
