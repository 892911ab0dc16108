#pragma once

#include "types.hpp"
#include "../random/rng.hpp"
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace graph_alloc {

// Static per-node data. Classification (type, generated subgraph membership)
// is decided once here and consumed everywhere else.
struct NodeMeta {
    NodeId id{INVALID_NODE};
    NodeType type{NodeType::Normal};
    std::string name;
    AttributeArray attributes{};           // attribute points granted when allocated
    std::map<std::string, float> tags;     // free-form numeric stats
    std::vector<EffectId> effects;         // selectable effects (mastery nodes)
    int subgraph{-1};                      // generated subgraph id, -1 for static topology

    [[nodiscard]] bool is_generated() const { return subgraph >= 0; }
    [[nodiscard]] bool has_effects() const { return !effects.empty(); }
    [[nodiscard]] float tag(const std::string& key, float fallback = 0.0f) const {
        auto it = tags.find(key);
        return it == tags.end() ? fallback : it->second;
    }
};

// Undirected node graph. Built once, then only queried.
class TreeGraph {
public:
    TreeGraph() = default;

    // Random connected graph: random spanning tree plus extra_edges chords.
    // Node 0 is the root; node types, attributes, effects and a "weight" tag are drawn from the seed.
    [[nodiscard]] static TreeGraph init_random(int num_nodes, int extra_edges, uint64_t seed);

    void add_node(NodeMeta meta);
    void add_edge(NodeId a, NodeId b);

    // Registers generated nodes (already added with add_node) as one atomic subgraph
    void add_subgraph(int subgraph_id, const std::vector<NodeId>& nodes);

    [[nodiscard]] size_t node_count() const { return nodes_.size(); }
    [[nodiscard]] size_t edge_count() const { return edge_count_; }
    [[nodiscard]] bool has_node(NodeId id) const { return index_.count(id) > 0; }
    [[nodiscard]] const std::vector<NodeId>& node_ids() const { return ids_; }

    // Sorted neighbor ids
    [[nodiscard]] const std::vector<NodeId>& neighbors(NodeId id) const;
    [[nodiscard]] const NodeMeta& metadata(NodeId id) const;
    [[nodiscard]] NodeType node_type(NodeId id) const { return metadata(id).type; }
    [[nodiscard]] bool is_generated(NodeId id) const { return metadata(id).is_generated(); }
    [[nodiscard]] std::vector<NodeId> nodes_of_type(NodeType type) const;
    [[nodiscard]] std::vector<NodeId> subgraph_nodes(int subgraph_id) const;

    // True iff nodes is non-empty, contains root, and its induced subgraph is connected
    [[nodiscard]] bool is_connected(const NodeSet& nodes, NodeId root) const;

    // Members of nodes reachable from root without leaving nodes
    [[nodiscard]] NodeSet reachable_from(const NodeSet& nodes, NodeId root) const;

    // Shortest path from any node of from to any node of targets, moving only
    // through nodes outside avoid. Returned nodes exclude the source and end with
    // the reached target; an empty vector means a target is already in from.
    [[nodiscard]] std::optional<std::vector<NodeId>> shortest_path(
        const NodeSet& from,
        const NodeSet& targets,
        const NodeSet* avoid = nullptr
    ) const;

    [[nodiscard]] std::optional<std::vector<NodeId>> shortest_path(
        const NodeSet& from,
        NodeId to,
        const NodeSet* avoid = nullptr
    ) const {
        return shortest_path(from, NodeSet{to}, avoid);
    }

    // Number of nodes that must be allocated to reach to from from
    [[nodiscard]] std::optional<int> shortest_path_length(const NodeSet& from, NodeId to) const;

    // Frontier: unallocated nodes adjacent to the allocation, sorted by id
    [[nodiscard]] std::vector<NodeId> unallocated_neighbors(const NodeSet& nodes) const;

    // True iff removing node from a connected allocation keeps it connected to root
    [[nodiscard]] bool is_removable(const NodeSet& nodes, NodeId node, NodeId root) const;

    // Random connected allocation of up to size nodes grown from root
    [[nodiscard]] NodeSet grow_connected(NodeId root, size_t size, RNG& rng) const;

private:
    [[nodiscard]] size_t index_of(NodeId id) const;

    std::vector<NodeMeta> nodes_;
    std::vector<NodeId> ids_;
    std::vector<std::vector<NodeId>> adjacency_;
    std::unordered_map<NodeId, size_t> index_;
    size_t edge_count_{0};
};

}  // namespace graph_alloc
