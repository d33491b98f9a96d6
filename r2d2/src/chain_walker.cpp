#include "chain_walker.hpp"
#include "log.hpp"
#include <stdexcept>

ChainWalker::ChainWalker(Executor& exec, NodeRegistry& registry, ResolveOptions opts)
    : exec_(exec), registry_(registry), opts_(std::move(opts)) {}

TaskResult ChainWalker::await(TaskType type, TaskPayload payload) {
    return exec_.submit(type, std::move(payload)).get();
}

// Resolves `node` unless an identical registration exists under the same
// parent. A failure is registered as a Failed node so the caller can see why
// the subtree is unreachable.
NodeRegistry::Index ChainWalker::step(const ParentContext& parent,
                                      NodeRegistry::Index parent_index,
                                      const NodeDescriptor& node, bool& reused)
{
    reused = false;
    std::string digest = node_resolver::descriptor_digest(node);

    NodeRegistry::Index known = registry_.index_of(node.id);
    if (known != NodeRegistry::npos) {
        for (NodeRegistry::Index a = parent_index; a != NodeRegistry::npos;
             a = registry_.parent_of(a))
            if (a == known)
                throw std::invalid_argument("node " + node.id + " is its own ancestor");

        if (registry_.parent_of(known) == parent_index &&
            registry_.at(known).descriptor_digest == digest) {
            reused = true;
            return known;
        }
        logging::warn("node " + node.id + " relisted with another parent or descriptor, "
                      "resolving again");
        registry_.evict(node.id);
    }

    TaskResult r = await(TaskType::UnlockNode, ResolveRequest{parent, node, opts_});

    UnlockedNode out;
    if (r.ok) {
        out = std::move(std::get<UnlockedNode>(r.value));
    } else {
        out.id                = node.id;
        out.kind              = node.kind;
        out.state             = NodeState::Failed;
        out.error             = r.error.kind;
        out.error_message     = r.error.message;
        out.descriptor_digest = digest;
    }
    return registry_.insert(std::move(out), parent_index);
}

WalkResult ChainWalker::walk(const SecretString& root_secret,
                             const std::vector<NodeDescriptor>& path)
{
    WalkResult wr;
    if (path.empty())
        throw std::invalid_argument("walk: empty path");
    if (path.front().kind != NodeKind::User)
        throw std::invalid_argument("walk: path must start at a user node");

    ParentContext       parent       = ParentContext::from_root(root_secret);
    NodeRegistry::Index parent_index = NodeRegistry::npos;

    for (const NodeDescriptor& node : path) {
        bool reused = false;
        NodeRegistry::Index i = step(parent, parent_index, node, reused);
        const UnlockedNode& n = registry_.at(i);
        if (reused)
            ++wr.reused;
        wr.ids.push_back(n.id);
        wr.states.push_back(n.state);

        if (!n.usable()) {
            wr.error         = n.error;
            wr.error_message = n.error_message;
            logging::warn("walk stopped at " + n.id + ": " + n.error_message);
            return wr;
        }
        parent       = ParentContext::from_node(n);
        parent_index = i;
    }
    wr.complete = true;
    return wr;
}

NodeRegistry::Index ChainWalker::unlock_child(const std::string& parent_id,
                                              const NodeDescriptor& child)
{
    ParentContext parent = registry_.parent_context(parent_id);
    bool reused = false;
    return step(parent, registry_.index_of(parent_id), child, reused);
}

SecretBytes ChainWalker::unlock_content_key(const NodeDescriptor& file) {
    const UnlockedNode* n = registry_.find(file.id);
    if (!n)
        throw std::out_of_range("unlock_content_key: file " + file.id + " is not unlocked");
    if (!n->usable())
        throw std::invalid_argument("unlock_content_key: file " + file.id + " is " +
                                    node_state_str(n->state));
    if (file.content_key_packet.empty())
        throw MalformedInputError("unlock_content_key: " + file.id + " has no content key");

    TaskResult r = await(TaskType::UnsealContentKey,
                         ContentKeyRequest{file.content_key_packet, n->key});
    if (!r.ok)
        throw CryptoError(r.error.kind, r.error.message);
    return std::get<SecretBytes>(r.value);
}
