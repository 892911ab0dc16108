#include "graph_alloc/core/tree_graph.hpp"
#include "graph_alloc/core/errors.hpp"
#include <algorithm>
#include <deque>
#include <limits>
#include <string>

namespace graph_alloc {

namespace {
constexpr size_t NO_PARENT = std::numeric_limits<size_t>::max();
}  // namespace

TreeGraph TreeGraph::init_random(int num_nodes, int extra_edges, uint64_t seed) {
    if (num_nodes < 1) {
        throw GraphError("init_random requires at least one node");
    }

    RNG rng(seed);
    TreeGraph graph;

    for (int i = 0; i < num_nodes; ++i) {
        NodeMeta meta;
        meta.id = i;
        meta.name = "node_" + std::to_string(i);

        if (i == 0) {
            meta.type = NodeType::Root;
        } else {
            double r = rng.uniform();
            if (r < 0.04) {
                meta.type = NodeType::Keystone;
            } else if (r < 0.10) {
                meta.type = NodeType::Socket;
            } else if (r < 0.18) {
                meta.type = NodeType::Mastery;
                int n_effects = rng.randint(2, 4);
                for (int k = 1; k <= n_effects; ++k) {
                    meta.effects.push_back(k);
                }
            } else if (r < 0.35) {
                meta.type = NodeType::Notable;
            }
        }

        if (meta.type == NodeType::Normal && rng.bernoulli(0.4)) {
            meta.attributes[static_cast<size_t>(rng.randint(0, 2))] = 10.0f;
        }
        meta.tags["weight"] = i == 0 ? 0.0f : static_cast<float>(rng.uniform(1.0, 10.0));

        graph.add_node(std::move(meta));
    }

    // Attach each node to a recent predecessor: long, branchy paths rather than a star
    for (int i = 1; i < num_nodes; ++i) {
        graph.add_edge(i, rng.randint(std::max(0, i - 8), i - 1));
    }

    for (int e = 0; e < extra_edges && num_nodes > 1; ++e) {
        int a = rng.randint(0, num_nodes - 1);
        int b = rng.randint(0, num_nodes - 1);
        if (a != b) {
            graph.add_edge(a, b);
        }
    }

    return graph;
}

void TreeGraph::add_node(NodeMeta meta) {
    if (index_.count(meta.id)) {
        throw GraphError("Duplicate node id " + std::to_string(meta.id));
    }
    index_[meta.id] = nodes_.size();
    ids_.push_back(meta.id);
    nodes_.push_back(std::move(meta));
    adjacency_.emplace_back();
}

void TreeGraph::add_edge(NodeId a, NodeId b) {
    if (a == b) {
        throw GraphError("Self loop on node " + std::to_string(a));
    }
    auto& adj_a = adjacency_[index_of(a)];
    auto& adj_b = adjacency_[index_of(b)];

    auto it = std::lower_bound(adj_a.begin(), adj_a.end(), b);
    if (it != adj_a.end() && *it == b) {
        return;
    }
    adj_a.insert(it, b);
    adj_b.insert(std::lower_bound(adj_b.begin(), adj_b.end(), a), a);
    ++edge_count_;
}

void TreeGraph::add_subgraph(int subgraph_id, const std::vector<NodeId>& nodes) {
    if (subgraph_id < 0) {
        throw GraphError("Subgraph id must be non-negative");
    }
    for (NodeId id : nodes) {
        nodes_[index_of(id)].subgraph = subgraph_id;
    }
}

size_t TreeGraph::index_of(NodeId id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw GraphError("Unknown node id " + std::to_string(id));
    }
    return it->second;
}

const std::vector<NodeId>& TreeGraph::neighbors(NodeId id) const {
    return adjacency_[index_of(id)];
}

const NodeMeta& TreeGraph::metadata(NodeId id) const {
    return nodes_[index_of(id)];
}

std::vector<NodeId> TreeGraph::nodes_of_type(NodeType type) const {
    std::vector<NodeId> out;
    for (const auto& meta : nodes_) {
        if (meta.type == type) {
            out.push_back(meta.id);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<NodeId> TreeGraph::subgraph_nodes(int subgraph_id) const {
    std::vector<NodeId> out;
    for (const auto& meta : nodes_) {
        if (meta.subgraph == subgraph_id) {
            out.push_back(meta.id);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

NodeSet TreeGraph::reachable_from(const NodeSet& nodes, NodeId root) const {
    NodeSet reached;
    if (!nodes.count(root)) {
        return reached;
    }

    std::vector<char> visited(nodes_.size(), 0);
    std::deque<NodeId> queue;
    queue.push_back(root);
    visited[index_of(root)] = 1;
    reached.insert(root);

    while (!queue.empty()) {
        NodeId current = queue.front();
        queue.pop_front();
        for (NodeId next : neighbors(current)) {
            size_t idx = index_of(next);
            if (visited[idx] || !nodes.count(next)) {
                continue;
            }
            visited[idx] = 1;
            reached.insert(next);
            queue.push_back(next);
        }
    }
    return reached;
}

bool TreeGraph::is_connected(const NodeSet& nodes, NodeId root) const {
    if (nodes.empty() || !nodes.count(root)) {
        return false;
    }

    std::vector<char> visited(nodes_.size(), 0);
    std::deque<NodeId> queue;
    queue.push_back(root);
    visited[index_of(root)] = 1;
    size_t count = 1;

    while (!queue.empty()) {
        NodeId current = queue.front();
        queue.pop_front();
        for (NodeId next : neighbors(current)) {
            size_t idx = index_of(next);
            if (visited[idx] || !nodes.count(next)) {
                continue;
            }
            visited[idx] = 1;
            ++count;
            queue.push_back(next);
        }
    }
    return count == nodes.size();
}

bool TreeGraph::is_removable(const NodeSet& nodes, NodeId node, NodeId root) const {
    if (node == root || !nodes.count(node) || !nodes.count(root)) {
        return false;
    }

    std::vector<char> visited(nodes_.size(), 0);
    visited[index_of(node)] = 1;
    std::deque<NodeId> queue;
    queue.push_back(root);
    visited[index_of(root)] = 1;
    size_t count = 1;

    while (!queue.empty()) {
        NodeId current = queue.front();
        queue.pop_front();
        for (NodeId next : neighbors(current)) {
            size_t idx = index_of(next);
            if (visited[idx] || !nodes.count(next)) {
                continue;
            }
            visited[idx] = 1;
            ++count;
            queue.push_back(next);
        }
    }
    return count == nodes.size() - 1;
}

std::optional<std::vector<NodeId>> TreeGraph::shortest_path(
    const NodeSet& from,
    const NodeSet& targets,
    const NodeSet* avoid
) const {
    if (from.empty() || targets.empty()) {
        return std::nullopt;
    }
    for (NodeId t : targets) {
        if (from.count(t)) {
            return std::vector<NodeId>{};
        }
    }

    std::vector<char> visited(nodes_.size(), 0);
    std::vector<size_t> parent(nodes_.size(), NO_PARENT);
    std::deque<size_t> queue;

    for (NodeId source : from) {
        size_t idx = index_of(source);
        visited[idx] = 1;
        queue.push_back(idx);
    }

    while (!queue.empty()) {
        size_t current = queue.front();
        queue.pop_front();
        for (NodeId next : adjacency_[current]) {
            size_t idx = index_of(next);
            if (visited[idx]) {
                continue;
            }
            bool is_target = targets.count(next) > 0;
            if (!is_target && avoid && avoid->count(next)) {
                continue;
            }
            visited[idx] = 1;
            parent[idx] = current;

            if (is_target) {
                std::vector<NodeId> path;
                for (size_t at = idx; parent[at] != NO_PARENT; at = parent[at]) {
                    path.push_back(nodes_[at].id);
                }
                std::reverse(path.begin(), path.end());
                return path;
            }
            queue.push_back(idx);
        }
    }
    return std::nullopt;
}

std::optional<int> TreeGraph::shortest_path_length(const NodeSet& from, NodeId to) const {
    auto path = shortest_path(from, to);
    if (!path) {
        return std::nullopt;
    }
    return static_cast<int>(path->size());
}

std::vector<NodeId> TreeGraph::unallocated_neighbors(const NodeSet& nodes) const {
    NodeSet frontier;
    for (NodeId id : nodes) {
        for (NodeId next : neighbors(id)) {
            if (!nodes.count(next)) {
                frontier.insert(next);
            }
        }
    }
    return {frontier.begin(), frontier.end()};
}

NodeSet TreeGraph::grow_connected(NodeId root, size_t size, RNG& rng) const {
    NodeSet nodes{root};
    (void)index_of(root);
    while (nodes.size() < size) {
        auto frontier = unallocated_neighbors(nodes);
        if (frontier.empty()) {
            break;
        }
        nodes.insert(rng.pick(frontier));
    }
    return nodes;
}

}  // namespace graph_alloc
