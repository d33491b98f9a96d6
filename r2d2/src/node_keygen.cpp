#include "node_keygen.hpp"
#include "content.hpp"
#include "errors.hpp"
#include "key_packet.hpp"
#include "log.hpp"
#include "message.hpp"
#include "name_cipher.hpp"
#include "node_key.hpp"
#include "signature.hpp"
#include <msgpack.hpp>
#include <stdexcept>

namespace node_keygen {

// ── extended attributes ──────────────────────────────────────────────────────

std::string seal_xattrs(const ExtendedAttributes& attrs, const SessionKey& session,
                        uint32_t iterations)
{
    msgpack::sbuffer buf;
    msgpack::packer<msgpack::sbuffer> pk(buf);

    pk.pack_map(static_cast<uint32_t>(attrs.size()));
    for (const auto& kv : attrs) {
        pk.pack(kv.first);
        pk.pack_bin(static_cast<uint32_t>(kv.second.size()));
        pk.pack_bin_body(reinterpret_cast<const char*>(kv.second.data()), kv.second.size());
    }

    SecretBytes plain(reinterpret_cast<const uint8_t*>(buf.data()), buf.size());
    return message::seal_password(plain.bytes(), session.str(), iterations);
}

ExtendedAttributes open_xattrs(const std::string& armored, const SessionKey& session) {
    SecretBytes plain = message::open_password(armored, session.str());

    msgpack::object_handle oh;
    try {
        msgpack::unpack(oh, reinterpret_cast<const char*>(plain.data()), plain.size());
    } catch (const msgpack::unpack_error& e) {
        throw MalformedInputError(std::string("xattrs: ") + e.what());
    }
    const msgpack::object& obj = oh.get();
    if (obj.type != msgpack::type::MAP)
        throw MalformedInputError("xattrs: top-level object must be a map");

    ExtendedAttributes attrs;
    const auto& map = obj.via.map;
    for (uint32_t i = 0; i < map.size; ++i) {
        const auto& kv = map.ptr[i];
        if (kv.key.type != msgpack::type::STR)
            throw MalformedInputError("xattrs: expected string key");
        if (kv.val.type != msgpack::type::BIN)
            throw MalformedInputError("xattrs: expected binary value");
        std::string key(kv.key.via.str.ptr, kv.key.via.str.size);
        const uint8_t* p = reinterpret_cast<const uint8_t*>(kv.val.via.bin.ptr);
        attrs[key] = std::vector<uint8_t>(p, p + kv.val.via.bin.size);
    }
    return attrs;
}

// ── node creation ────────────────────────────────────────────────────────────

// Seals `pkt` under `parent_secret`, generates and locks the node key, and
// encrypts the name. The passphrase signature is left to the caller.
static GeneratedKeys build_node(const KeyPacket& pkt, const Identity& owner,
                                const std::string& name, const std::string& parent_secret,
                                uint32_t iterations, node_key::UnlockedKey& key_out)
{
    key_out = node_key::generate(owner);

    GeneratedKeys g;
    g.session_key     = pkt.session_key;
    g.key_packet_id   = pkt.id;
    g.node_key        = node_key::lock(key_out, pkt.session_key.str(), iterations);
    g.node_passphrase = key_packet::seal(pkt, parent_secret, iterations);

    if (!name.empty()) {
        name_cipher::EncryptedName en = name_cipher::encrypt_name(name, key_out.pub);
        g.folder_name = en.ciphertext;
        g.name_hash   = en.name_hash;
    }
    return g;
}

GeneratedKeys generate_node_keys(const GenerateRequest& req) {
    if (req.kind == NodeKind::User)
        throw std::invalid_argument("generate_node_keys: use generate_user_keys for a user node");
    if (req.parent_key_packet_id.empty())
        throw std::invalid_argument("generate_node_keys: parent key packet id is required");

    node_key::UnlockedKey parent = node_key::unlock(req.parent_private_key,
                                                    req.parent_session_key.str());

    if (!req.parent_passphrase_signature.empty()) {
        node_key::PublicKey signer = req.parent_signer_key.empty()
                                         ? parent.pub
                                         : node_key::read_public(req.parent_signer_key);
        if (!signature::verify(req.parent_passphrase, req.parent_passphrase_signature,
                               signer, signer.key_id))
            throw SignatureInvalidError("parent key packet signature verification failed");
    }

    KeyPacket pkt = key_packet::make(req.kind, req.parent_key_packet_id);

    node_key::UnlockedKey key;
    GeneratedKeys g = build_node(pkt, req.owner, req.name,
                                 req.parent_session_key.str(), req.iterations, key);
    g.node_passphrase_signature = signature::sign(g.node_passphrase, parent);

    if (req.kind == NodeKind::File) {
        g.content_key           = content::new_content_key();
        g.content_key_packet    = content::seal_content_key(g.content_key, key.pub);
        g.content_key_signature = signature::sign(g.content_key_packet, parent);
    }

    if (!req.xattrs.empty())
        g.xattrs = seal_xattrs(req.xattrs, g.session_key, req.iterations);

    logging::debug("generated " + node_kind_str(req.kind) + " key " + key.pub.key_id +
                   " under " + parent.pub.key_id);
    return g;
}

GeneratedKeys generate_user_keys(const Identity& owner, const SecretString& root_secret,
                                 uint32_t iterations)
{
    KeyPacket pkt = key_packet::make(NodeKind::User, "");

    node_key::UnlockedKey key;
    GeneratedKeys g = build_node(pkt, owner, "", root_secret.str(), iterations, key);
    g.node_passphrase_signature = signature::sign(g.node_passphrase, key);

    logging::debug("generated user key " + key.pub.key_id + " for " + owner.uid());
    return g;
}

MoveResult prepare_move(const MoveRequest& req) {
    if (req.item_key_packet_id.empty() || req.target_key_packet_id.empty())
        throw std::invalid_argument("prepare_move: item and target key packet ids are required");

    node_key::UnlockedKey target = node_key::unlock(req.target_private_key,
                                                    req.target_session_key.str());

    KeyPacket pkt = key_packet::make(req.kind, req.target_key_packet_id);
    pkt.session_key = req.item_session_key;
    pkt.id          = req.item_key_packet_id;

    MoveResult r;
    r.node_passphrase           = key_packet::seal(pkt, req.target_session_key.str(),
                                                   req.iterations);
    r.node_passphrase_signature = signature::sign(r.node_passphrase, target);
    r.name_hash                 = name_cipher::name_hash(req.name);
    r.key_packet_id             = pkt.id;
    return r;
}

NodeDescriptor to_descriptor(const GeneratedKeys& g, NodeKind kind,
                             const std::string& owner_email)
{
    NodeDescriptor d;
    d.id                        = g.key_packet_id;
    d.kind                      = kind;
    d.owner_email               = owner_email;
    d.node_key                  = g.node_key;
    d.node_passphrase           = g.node_passphrase;
    d.node_passphrase_signature = g.node_passphrase_signature;
    d.name                      = g.folder_name;
    d.content_key_packet        = g.content_key_packet;
    d.content_key_signature     = g.content_key_signature;
    d.xattrs                    = g.xattrs;
    return d;
}

} // namespace node_keygen
