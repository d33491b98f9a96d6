#pragma once
#include "node.hpp"
#include "node_key.hpp"
#include "secret.hpp"
#include <vector>
#include <string>
#include <cstdint>

// Plaintext of a node passphrase. Encoded as a msgpack map
//   { "sessionKey", "parentKeyPacketId", "created", "version", "keyType", "id" }
// and sealed with the parent's secret.
struct KeyPacket {
    SessionKey  session_key;
    std::string parent_key_packet_id;
    std::string created;              // ISO 8601 UTC
    uint32_t    version = 1;
    NodeKind    key_type = NodeKind::Folder;
    std::string id;
};

namespace key_packet {

static constexpr uint32_t KEY_PACKET_VERSION = 1;

// 32 random bytes, base64.
SessionKey new_session_key();

// "<base36 ms timestamp>-<8 base36 random chars>"
std::string new_packet_id();

// Fresh packet with a new session key, id and timestamp.
KeyPacket make(NodeKind kind, const std::string& parent_key_packet_id);

std::vector<uint8_t> encode(const KeyPacket& p);

// Throws MalformedInputError on anything but a complete, well-typed map.
KeyPacket decode(const std::vector<uint8_t>& data);

// Password-mode MESSAGE. `p` is left untouched.
std::string seal(const KeyPacket& p, const std::string& parent_secret,
                 uint32_t iterations);

// Wrong secret: DecryptionError. Never returns a partial packet.
KeyPacket unseal(const std::string& armored, const std::string& parent_secret);

// Public-key-mode MESSAGE, for handing a packet to another user.
std::string seal_to(const KeyPacket& p, const node_key::PublicKey& recipient);
KeyPacket   unseal_with(const std::string& armored, const node_key::UnlockedKey& key);

} // namespace key_packet
