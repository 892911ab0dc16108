#pragma once

#include "types.hpp"
#include <map>
#include <string>
#include <vector>

namespace graph_alloc {

class TreeGraph;

// One candidate solution: allocated nodes plus the chosen effect of each allocated mastery node
struct Allocation {
    NodeSet nodes;
    std::map<NodeId, EffectId> selections;

    Allocation() = default;
    explicit Allocation(NodeSet nodes_) : nodes(std::move(nodes_)) {}
    Allocation(NodeSet nodes_, std::map<NodeId, EffectId> selections_)
        : nodes(std::move(nodes_)), selections(std::move(selections_)) {}

    [[nodiscard]] size_t size() const { return nodes.size(); }
    [[nodiscard]] bool empty() const { return nodes.empty(); }
    [[nodiscard]] bool contains(NodeId id) const { return nodes.count(id) > 0; }

    // Adds the node; mastery nodes get their first effect unless already selected
    void add(NodeId id, const TreeGraph& graph);
    // Removes the node and its selection
    void remove(NodeId id);
    void select(NodeId id, EffectId effect) { selections[id] = effect; }

    // Drops selections whose node is no longer allocated
    void prune_selections();

    // Order-independent 64-bit hash over nodes and selections
    [[nodiscard]] uint64_t canonical_hash() const;

    bool operator==(const Allocation& other) const = default;
};

struct AllocationDiff {
    std::vector<NodeId> added;
    std::vector<NodeId> removed;
    std::vector<NodeId> reselected;  // nodes kept with a different effect

    [[nodiscard]] bool empty() const { return added.empty() && removed.empty() && reselected.empty(); }
};

[[nodiscard]] AllocationDiff diff(const Allocation& from, const Allocation& to);

[[nodiscard]] std::string to_string(const Allocation& allocation);

}  // namespace graph_alloc
