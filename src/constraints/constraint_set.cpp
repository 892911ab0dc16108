#include "graph_alloc/constraints/constraint_set.hpp"
#include "graph_alloc/core/errors.hpp"
#include <algorithm>
#include <sstream>

namespace graph_alloc {

namespace {

// Lower ranks are trimmed first during repair, then lower "weight" tags
int trim_rank(NodeType type) {
    switch (type) {
        case NodeType::Normal: return 0;
        case NodeType::Notable: return 1;
        case NodeType::Mastery: return 2;
        case NodeType::Socket: return 3;
        case NodeType::Keystone: return 4;
        case NodeType::Root: return 5;
    }
    return 0;
}

std::string format_value(float v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

}  // namespace

PointBudget PointBudget::from_level(int level, int min_offset) {
    PointBudget budget;
    budget.max_points = level + 21;
    if (min_offset < 0) {
        budget.min_points = *budget.max_points + min_offset;
    }
    return budget;
}

ConstraintSet::ConstraintSet(const TreeGraph& graph, NodeId root)
    : graph_(graph), root_(root)
{
    if (!graph_.has_node(root_)) {
        throw GraphError("Root node " + std::to_string(root_) + " is not in the graph");
    }
}

void ConstraintSet::set_attribute_requirement(Attribute attribute, float min_value) {
    min_attributes_[static_cast<size_t>(attribute)] = min_value;
}

void ConstraintSet::add_occupied_socket(NodeId socket) {
    if (graph_.node_type(socket) != NodeType::Socket) {
        throw GraphError("Node " + std::to_string(socket) + " is not a socket");
    }
    occupied_sockets_.insert(socket);
}

void ConstraintSet::add_protected_subgraph(int subgraph_id) {
    auto nodes = graph_.subgraph_nodes(subgraph_id);
    if (nodes.empty()) {
        throw GraphError("Unknown subgraph " + std::to_string(subgraph_id));
    }
    subgraph_nodes_.insert(nodes.begin(), nodes.end());
}

AttributeArray ConstraintSet::attribute_totals(const Allocation& allocation) const {
    AttributeArray totals{};
    for (NodeId id : allocation.nodes) {
        const auto& attrs = graph_.metadata(id).attributes;
        for (size_t a = 0; a < NUM_ATTRIBUTES; ++a) {
            totals[a] += attrs[a];
        }
    }
    return totals;
}

int ConstraintSet::socket_count(const Allocation& allocation) const {
    int count = 0;
    for (NodeId id : allocation.nodes) {
        if (graph_.node_type(id) == NodeType::Socket) {
            ++count;
        }
    }
    return count;
}

NodeSet ConstraintSet::protected_nodes(const Allocation& allocation) const {
    NodeSet result = occupied_sockets_;
    result.insert(subgraph_nodes_.begin(), subgraph_nodes_.end());
    for (NodeId id : allocation.nodes) {
        if (graph_.is_generated(id)) {
            result.insert(id);
        }
    }
    return result;
}

ConstraintViolation ConstraintSet::measure(const Allocation& allocation) const {
    ConstraintViolation v;

    int points = point_cost(allocation);
    if (budget_.max_points && points > *budget_.max_points) {
        v.budget_excess = points - *budget_.max_points;
    }
    if (budget_.min_points && points < *budget_.min_points) {
        v.budget_deficit = *budget_.min_points - points;
    }

    auto totals = attribute_totals(allocation);
    for (size_t a = 0; a < NUM_ATTRIBUTES; ++a) {
        if (totals[a] < min_attributes_[a]) {
            v.attribute_deficit += min_attributes_[a] - totals[a];
        }
    }

    int sockets = socket_count(allocation);
    if (sockets < sockets_.min_sockets) {
        v.socket_deviation += sockets_.min_sockets - sockets;
    }
    if (sockets_.max_sockets && sockets > *sockets_.max_sockets) {
        v.socket_deviation += sockets - *sockets_.max_sockets;
    }
    return v;
}

ValidationResult ConstraintSet::validate(const Allocation& allocation) const {
    ValidationResult result;

    int points = point_cost(allocation);
    if (budget_.min_points && points < *budget_.min_points) {
        result.violations.push_back(
            "Too few points: " + std::to_string(points) + " < " + std::to_string(*budget_.min_points));
    }
    if (budget_.max_points && points > *budget_.max_points) {
        result.violations.push_back(
            "Too many points: " + std::to_string(points) + " > " + std::to_string(*budget_.max_points));
    }

    auto totals = attribute_totals(allocation);
    std::vector<std::string> attribute_parts;
    for (size_t a = 0; a < NUM_ATTRIBUTES; ++a) {
        if (totals[a] < min_attributes_[a]) {
            attribute_parts.push_back(
                std::string(attribute_name(static_cast<Attribute>(a))) + ": "
                + format_value(totals[a]) + " < " + format_value(min_attributes_[a]));
        }
    }
    if (!attribute_parts.empty()) {
        std::string msg = "Attribute requirements not met: ";
        for (size_t i = 0; i < attribute_parts.size(); ++i) {
            if (i > 0) msg += ", ";
            msg += attribute_parts[i];
        }
        result.violations.push_back(msg);
    }

    int sockets = socket_count(allocation);
    if (sockets < sockets_.min_sockets) {
        result.violations.push_back(
            "Not enough sockets: " + std::to_string(sockets) + " < " + std::to_string(sockets_.min_sockets));
    }
    if (sockets_.max_sockets && sockets > *sockets_.max_sockets) {
        result.violations.push_back(
            "Too many sockets: " + std::to_string(sockets) + " > " + std::to_string(*sockets_.max_sockets));
    }

    result.ok = result.violations.empty();
    return result;
}

double ConstraintSet::fitness_penalty(const Allocation& allocation) const {
    ConstraintViolation v = measure(allocation);
    return -(weights_.point * (v.budget_excess + v.budget_deficit)
           + weights_.attribute * v.attribute_deficit
           + weights_.socket * v.socket_deviation);
}

bool ConstraintSet::can_add_point(const Allocation& allocation) const {
    return !budget_.max_points || point_cost(allocation) < *budget_.max_points;
}

bool ConstraintSet::can_remove_point(const Allocation& allocation) const {
    return !budget_.min_points || point_cost(allocation) > *budget_.min_points;
}

template <typename Pred>
bool ConstraintSet::extend_towards(Allocation& allocation, const NodeSet& protected_nodes, Pred want) const {
    NodeSet targets;
    for (NodeId id : graph_.node_ids()) {
        if (!allocation.contains(id) && !protected_nodes.count(id) && want(id)) {
            targets.insert(id);
        }
    }
    if (targets.empty()) {
        return false;
    }

    auto path = graph_.shortest_path(allocation.nodes, targets, &protected_nodes);
    if (!path || path->empty()) {
        return false;
    }
    if (budget_.max_points
        && point_cost(allocation) + static_cast<int>(path->size()) > *budget_.max_points) {
        return false;
    }
    for (NodeId id : *path) {
        allocation.add(id, graph_);
    }
    return true;
}

template <typename Pred>
bool ConstraintSet::trim_one(Allocation& allocation, const NodeSet& protected_nodes, Pred allow) const {
    NodeId best = INVALID_NODE;
    int best_rank = 0;
    float best_weight = 0.0f;
    for (NodeId id : allocation.nodes) {
        if (id == root_ || protected_nodes.count(id) || !allow(id)) {
            continue;
        }
        const NodeMeta& meta = graph_.metadata(id);
        int rank = trim_rank(meta.type);
        float weight = meta.tag("weight");
        // Ascending iteration: among equal rank and weight the largest id wins
        if (best != INVALID_NODE
            && (rank > best_rank || (rank == best_rank && weight > best_weight))) {
            continue;
        }
        if (!graph_.is_removable(allocation.nodes, id, root_)) {
            continue;
        }
        best = id;
        best_rank = rank;
        best_weight = weight;
    }
    if (best == INVALID_NODE) {
        return false;
    }
    allocation.remove(best);
    return true;
}

std::optional<Allocation> ConstraintSet::repair(const Allocation& allocation) const {
    if (!graph_.is_connected(allocation.nodes, root_)) {
        return std::nullopt;
    }

    Allocation out = allocation;
    out.prune_selections();
    const NodeSet protected_set = protected_nodes(allocation);

    for (size_t a = 0; a < NUM_ATTRIBUTES; ++a) {
        while (attribute_totals(out)[a] < min_attributes_[a]) {
            bool extended = extend_towards(out, protected_set, [&](NodeId id) {
                return graph_.metadata(id).attributes[a] > 0.0f;
            });
            if (!extended) {
                return std::nullopt;
            }
        }
    }

    while (socket_count(out) < sockets_.min_sockets) {
        bool extended = extend_towards(out, protected_set, [&](NodeId id) {
            return graph_.node_type(id) == NodeType::Socket;
        });
        if (!extended) {
            return std::nullopt;
        }
    }

    while (budget_.min_points && point_cost(out) < *budget_.min_points) {
        if (!extend_towards(out, protected_set, [](NodeId) { return true; })) {
            return std::nullopt;
        }
    }

    while (sockets_.max_sockets && socket_count(out) > *sockets_.max_sockets) {
        bool trimmed = trim_one(out, protected_set, [&](NodeId id) {
            return graph_.node_type(id) == NodeType::Socket;
        });
        if (!trimmed) {
            return std::nullopt;
        }
    }

    while (budget_.max_points && point_cost(out) > *budget_.max_points) {
        auto totals = attribute_totals(out);
        int sockets = socket_count(out);
        bool trimmed = trim_one(out, protected_set, [&](NodeId id) {
            const auto& meta = graph_.metadata(id);
            for (size_t a = 0; a < NUM_ATTRIBUTES; ++a) {
                if (min_attributes_[a] > 0.0f && totals[a] - meta.attributes[a] < min_attributes_[a]) {
                    return false;
                }
            }
            return meta.type != NodeType::Socket || sockets > sockets_.min_sockets;
        });
        if (!trimmed) {
            return std::nullopt;
        }
    }

    if (!validate(out).ok) {
        return std::nullopt;
    }
    return out;
}

}  // namespace graph_alloc
