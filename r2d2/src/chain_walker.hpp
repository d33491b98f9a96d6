#pragma once
#include "executor.hpp"
#include "node_registry.hpp"
#include <string>
#include <vector>

struct WalkResult {
    std::vector<std::string> ids;       // nodes visited, root first
    std::vector<NodeState>   states;    // parallel to ids
    bool                     complete = false;
    ErrorKind                error = ErrorKind::Internal;   // when !complete
    std::string              error_message;
    size_t                   reused = 0;   // steps answered from the registry
};

// Walks a root-to-leaf path through the executor, one awaited step at a
// time, registering each node under its parent. A registered node is reused
// only if it sits under the same parent and was resolved from an identical
// descriptor; otherwise it is evicted and resolved again. Stops at the first
// node that fails; an untrusted node does not stop the walk unless the
// options require trust.
class ChainWalker {
public:
    ChainWalker(Executor& exec, NodeRegistry& registry, ResolveOptions opts = ResolveOptions());

    // path[0] is the user node, unlocked with `root_secret`.
    WalkResult walk(const SecretString& root_secret, const std::vector<NodeDescriptor>& path);

    // Resolves one child of an already registered parent. Returns its slot.
    NodeRegistry::Index unlock_child(const std::string& parent_id, const NodeDescriptor& child);

    // Content key of a registered, usable file node.
    SecretBytes unlock_content_key(const NodeDescriptor& file);

private:
    TaskResult await(TaskType type, TaskPayload payload);
    NodeRegistry::Index step(const ParentContext& parent, NodeRegistry::Index parent_index,
                             const NodeDescriptor& node, bool& reused);

    Executor&      exec_;
    NodeRegistry&  registry_;
    ResolveOptions opts_;
};
