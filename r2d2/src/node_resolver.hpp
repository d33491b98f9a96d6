#pragma once
#include "errors.hpp"
#include "key_packet.hpp"
#include "node.hpp"
#include "node_key.hpp"
#include "secret.hpp"
#include "signature.hpp"
#include <memory>
#include <string>

enum class NodeState {
    Locked,
    Unsealing,
    Unlocked,
    UnlockedUntrusted,   // keys recovered, passphrase signature failed
    Failed               // terminal, see UnlockedNode::error
};

const char* node_state_str(NodeState s);

// Display names used when a node's name cannot be decrypted.
struct Placeholders {
    std::string root   = "My Files";
    std::string share  = "Shared";
    std::string folder = "Unnamed Folder";
    std::string file   = "Unnamed File";

    const std::string& for_kind(NodeKind k) const;
};

struct UnlockedNode {
    std::string           id;
    NodeKind              kind = NodeKind::Folder;
    NodeState             state = NodeState::Locked;
    ErrorKind             error = ErrorKind::Internal;   // when Failed
    std::string           error_message;                 // when Failed
    bool                  has_signature = false;
    signature::Verdict    verdict = signature::Verdict::Valid;
    std::string           name;
    std::string           key_packet_id;
    std::string           descriptor_digest;   // of the descriptor it was resolved from
    SessionKey            session_key;
    node_key::UnlockedKey key;

    bool usable()  const { return state == NodeState::Unlocked ||
                                  state == NodeState::UnlockedUntrusted; }
    bool trusted() const { return state == NodeState::Unlocked; }
};

// What a child needs from its already-unlocked parent. For a user node the
// secret is the RootSecret, key_packet_id is empty and there is no verifier.
struct ParentContext {
    SessionKey                                  secret;
    std::string                                 key_packet_id;
    std::shared_ptr<const node_key::PublicKey>  verifier;

    static ParentContext from_root(const SecretString& root_secret);
    static ParentContext from_node(const UnlockedNode& parent);
};

struct ResolveOptions {
    // Throw SignatureInvalidError / IdentityMismatchError instead of
    // returning an UnlockedUntrusted node.
    bool         require_trusted = false;
    Placeholders placeholders;
};

namespace node_resolver {

// Throws DecryptionError, MalformedInputError or PacketChainMismatchError
// when the node cannot be unlocked.
UnlockedNode resolve(const ParentContext& parent,
                     const NodeDescriptor& node,
                     const ResolveOptions& opts = ResolveOptions());

// Same, but a CryptoError becomes a node in the Failed state.
UnlockedNode resolve_or_fail(const ParentContext& parent,
                             const NodeDescriptor& node,
                             const ResolveOptions& opts = ResolveOptions());

// SHA-256 over the descriptor fields that feed resolution: kind, owner,
// node key, passphrase, passphrase signature and name.
std::string descriptor_digest(const NodeDescriptor& node);

// Shared by resolve and the integrity badge: verdict for the node's
// passphrase signature with `verifier` as the expected signer.
signature::Verdict check_passphrase(const NodeDescriptor& node,
                                    const node_key::PublicKey& verifier);

} // namespace node_resolver
