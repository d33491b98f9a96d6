#include "node_registry.hpp"
#include "log.hpp"
#include <algorithm>
#include <stdexcept>

static void wipe_node(UnlockedNode& n) {
    n.session_key.wipe();
    n.key.secret.wipe();
    n = UnlockedNode();
}

const NodeRegistry::Slot& NodeRegistry::live_slot(Index i) const {
    if (i >= slots_.size() || !slots_[i].live)
        throw std::out_of_range("registry: no node in slot " + std::to_string(i));
    return slots_[i];
}

NodeRegistry::Index NodeRegistry::insert(UnlockedNode node, Index parent) {
    if (by_id_.count(node.id))
        throw std::invalid_argument("registry: node " + node.id + " already registered");
    if (parent != npos)
        live_slot(parent);

    Index i;
    if (!free_.empty()) {
        i = free_.back();
        free_.pop_back();
    } else {
        i = slots_.size();
        slots_.emplace_back();
    }

    Slot& s  = slots_[i];
    s.live   = true;
    s.node   = std::move(node);
    s.parent = parent;
    s.children.clear();
    by_id_[s.node.id] = i;

    if (parent != npos)
        slots_[parent].children.push_back(i);
    return i;
}

NodeRegistry::Index NodeRegistry::index_of(const std::string& id) const {
    auto it = by_id_.find(id);
    return it == by_id_.end() ? npos : it->second;
}

const UnlockedNode* NodeRegistry::find(const std::string& id) const {
    Index i = index_of(id);
    return i == npos ? nullptr : &slots_[i].node;
}

const UnlockedNode& NodeRegistry::at(Index i) const {
    return live_slot(i).node;
}

NodeRegistry::Index NodeRegistry::parent_of(Index i) const {
    return live_slot(i).parent;
}

std::vector<NodeRegistry::Index> NodeRegistry::children_of(Index i) const {
    return live_slot(i).children;
}

ParentContext NodeRegistry::parent_context(const std::string& id) const {
    Index i = index_of(id);
    if (i == npos)
        throw std::out_of_range("registry: unknown node " + id);
    return ParentContext::from_node(slots_[i].node);
}

size_t NodeRegistry::evict_slot(Index i) {
    size_t removed = 0;
    std::vector<Index> kids;
    kids.swap(slots_[i].children);
    for (Index c : kids)
        removed += evict_slot(c);

    Slot& s = slots_[i];
    by_id_.erase(s.node.id);
    wipe_node(s.node);
    s.live   = false;
    s.parent = npos;
    free_.push_back(i);
    return removed + 1;
}

size_t NodeRegistry::evict(const std::string& id) {
    Index i = index_of(id);
    if (i == npos)
        return 0;

    Index parent = slots_[i].parent;
    if (parent != npos) {
        auto& sib = slots_[parent].children;
        sib.erase(std::remove(sib.begin(), sib.end(), i), sib.end());
    }

    size_t n = evict_slot(i);
    logging::debug("registry: evicted " + id + " and " + std::to_string(n - 1) +
                   " descendants");
    return n;
}

void NodeRegistry::clear() {
    for (Slot& s : slots_)
        if (s.live)
            wipe_node(s.node);
    slots_.clear();
    by_id_.clear();
    free_.clear();
}
