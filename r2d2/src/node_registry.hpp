#pragma once
#include "node_resolver.hpp"
#include <string>
#include <unordered_map>
#include <vector>

// In-memory home of unlocked nodes. Records live in a slot arena; children
// refer to their parent by slot index, never by pointer. Evicting a node
// wipes and frees it together with its whole subtree.
class NodeRegistry {
public:
    using Index = size_t;
    static constexpr Index npos = (Index)-1;

    // Throws std::invalid_argument if the id is already registered or the
    // parent index is not live.
    Index insert(UnlockedNode node, Index parent = npos);

    Index index_of(const std::string& id) const;    // npos if absent
    const UnlockedNode* find(const std::string& id) const;

    // Throws std::out_of_range for a dead slot.
    const UnlockedNode& at(Index i) const;
    Index               parent_of(Index i) const;
    std::vector<Index>  children_of(Index i) const;

    // Context for resolving a child of `id`. Throws std::out_of_range if
    // absent, std::invalid_argument if the node is not usable.
    ParentContext parent_context(const std::string& id) const;

    // Number of nodes removed; 0 if `id` is unknown.
    size_t evict(const std::string& id);

    size_t size() const { return by_id_.size(); }
    void   clear();

private:
    struct Slot {
        bool               live = false;
        UnlockedNode       node;
        Index              parent = npos;
        std::vector<Index> children;
    };

    const Slot& live_slot(Index i) const;
    size_t      evict_slot(Index i);

    std::vector<Slot>                      slots_;
    std::unordered_map<std::string, Index> by_id_;
    std::vector<Index>                     free_;
};
