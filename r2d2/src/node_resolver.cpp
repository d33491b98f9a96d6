#include "node_resolver.hpp"
#include "kdf.hpp"
#include "log.hpp"
#include "name_cipher.hpp"
#include <stdexcept>

const char* node_state_str(NodeState s) {
    switch (s) {
        case NodeState::Locked:            return "locked";
        case NodeState::Unsealing:         return "unsealing";
        case NodeState::Unlocked:          return "unlocked";
        case NodeState::UnlockedUntrusted: return "unlocked-untrusted";
        case NodeState::Failed:            return "failed";
    }
    return "unknown";
}

const std::string& Placeholders::for_kind(NodeKind k) const {
    switch (k) {
        case NodeKind::User:   return root;
        case NodeKind::Share:  return share;
        case NodeKind::Folder: return folder;
        case NodeKind::File:   return file;
    }
    return folder;
}

ParentContext ParentContext::from_root(const SecretString& root_secret) {
    ParentContext ctx;
    ctx.secret = root_secret;
    return ctx;
}

ParentContext ParentContext::from_node(const UnlockedNode& parent) {
    if (!parent.usable())
        throw std::invalid_argument("parent node " + parent.id + " is " +
                                    node_state_str(parent.state));
    ParentContext ctx;
    ctx.secret        = parent.session_key;
    ctx.key_packet_id = parent.key_packet_id;
    ctx.verifier      = std::make_shared<const node_key::PublicKey>(parent.key.pub);
    return ctx;
}

namespace node_resolver {

std::string descriptor_digest(const NodeDescriptor& node) {
    std::string buf;
    for (const std::string* f : {&node.owner_email, &node.node_key, &node.node_passphrase,
                                 &node.node_passphrase_signature, &node.name}) {
        buf += std::to_string(f->size());
        buf += ':';
        buf += *f;
    }
    buf += node_kind_str(node.kind);
    return sha256_hex(buf);
}

signature::Verdict check_passphrase(const NodeDescriptor& node,
                                    const node_key::PublicKey& verifier)
{
    return signature::check(node.node_passphrase, node.node_passphrase_signature,
                            verifier, verifier.key_id, node.owner_email);
}

UnlockedNode resolve(const ParentContext& parent,
                     const NodeDescriptor& node,
                     const ResolveOptions& opts)
{
    UnlockedNode out;
    out.id                = node.id;
    out.kind              = node.kind;
    out.state             = NodeState::Unsealing;
    out.descriptor_digest = descriptor_digest(node);

    // ── key packet ───────────────────────────────────────────────────────────
    KeyPacket pkt = key_packet::unseal(node.node_passphrase, parent.secret.str());

    if (!parent.key_packet_id.empty() &&
        pkt.parent_key_packet_id != parent.key_packet_id)
        throw PacketChainMismatchError("node " + node.id + ": key packet names parent " +
                                       pkt.parent_key_packet_id + ", reached via " +
                                       parent.key_packet_id);
    if (pkt.key_type != node.kind)
        throw MalformedInputError("node " + node.id + ": key packet is for a " +
                                  node_kind_str(pkt.key_type) + ", node is a " +
                                  node_kind_str(node.kind));

    // ── node key ─────────────────────────────────────────────────────────────
    out.key           = node_key::unlock(node.node_key, pkt.session_key.str());
    out.session_key   = pkt.session_key;
    out.key_packet_id = pkt.id;

    // ── passphrase signature ─────────────────────────────────────────────────
    out.state = NodeState::Unlocked;
    if (!node.node_passphrase_signature.empty()) {
        out.has_signature = true;
        const node_key::PublicKey& verifier = parent.verifier ? *parent.verifier
                                                              : out.key.pub;
        out.verdict = check_passphrase(node, verifier);

        if (out.verdict != signature::Verdict::Valid) {
            std::string why = "node " + node.id + ": passphrase signature " +
                              signature::verdict_str(out.verdict);
            if (opts.require_trusted) {
                if (out.verdict == signature::Verdict::WrongKeyId ||
                    out.verdict == signature::Verdict::WrongIdentity)
                    throw IdentityMismatchError(why);
                throw SignatureInvalidError(why);
            }
            logging::warn(why + ", marking untrusted");
            out.state = NodeState::UnlockedUntrusted;
        }
    }

    // ── name ─────────────────────────────────────────────────────────────────
    out.name = name_cipher::decrypt_name_or(node.name, out.key,
                                            opts.placeholders.for_kind(node.kind));

    logging::debug("node " + node.id + " (" + node_kind_str(node.kind) + ") " +
                   node_state_str(out.state) + ", key " + out.key.pub.key_id);
    return out;
}

UnlockedNode resolve_or_fail(const ParentContext& parent,
                             const NodeDescriptor& node,
                             const ResolveOptions& opts)
{
    try {
        return resolve(parent, node, opts);
    } catch (const CryptoError& e) {
        logging::info("node " + node.id + " failed (" + error_kind_str(e.kind()) +
                      "): " + e.what());
        UnlockedNode out;
        out.id            = node.id;
        out.kind          = node.kind;
        out.state         = NodeState::Failed;
        out.error         = e.kind();
        out.error_message     = e.what();
        out.descriptor_digest = descriptor_digest(node);
        return out;
    }
}

} // namespace node_resolver
