#pragma once

#include "../core/allocation.hpp"
#include "../core/tree_graph.hpp"
#include <optional>
#include <string>
#include <vector>

namespace graph_alloc {

// Allowed number of allocated points (one point per allocated node)
struct PointBudget {
    std::optional<int> min_points;
    std::optional<int> max_points;

    // Max points for a character level (level + 21); a negative min_offset also sets
    // min_points = max_points + min_offset
    [[nodiscard]] static PointBudget from_level(int level, int min_offset = 0);

    [[nodiscard]] bool contains(int points) const {
        return (!min_points || points >= *min_points) && (!max_points || points <= *max_points);
    }
};

struct SocketRequirement {
    int min_sockets{0};
    std::optional<int> max_sockets;
};

// What to do with candidates that violate constraints
enum class ConstraintPolicy {
    SoftPenalize,  // evaluate anyway, subtract a penalty from fitness
    HardReject,    // do not evaluate, candidate gets minimal fitness
    Repair         // try repair(); reject if it fails
};

// Magnitude of each violated constraint (all zero when satisfied)
struct ConstraintViolation {
    double budget_excess{0.0};
    double budget_deficit{0.0};
    double attribute_deficit{0.0};
    double socket_deviation{0.0};

    [[nodiscard]] bool any() const {
        return budget_excess > 0.0 || budget_deficit > 0.0
            || attribute_deficit > 0.0 || socket_deviation > 0.0;
    }
};

struct PenaltyWeights {
    double point{100.0};
    double attribute{1.0};
    double socket{100.0};
};

struct ValidationResult {
    bool ok{true};
    std::vector<std::string> violations;
};

// Budget, attribute and socket constraints plus the protected-node registry.
// Built once per run; all queries are const.
class ConstraintSet {
public:
    ConstraintSet(const TreeGraph& graph, NodeId root);

    // Configuration
    void set_point_budget(PointBudget budget) { budget_ = budget; }
    void set_attribute_requirement(Attribute attribute, float min_value);
    void set_socket_requirement(SocketRequirement requirement) { sockets_ = requirement; }
    void set_policy(ConstraintPolicy policy) { policy_ = policy; }
    void set_penalty_weights(PenaltyWeights weights) { weights_ = weights; }

    // Socket holding an externally owned object; never vacated or filled by the optimizer
    void add_occupied_socket(NodeId socket);
    // Every node of a generated subgraph becomes protected
    void add_protected_subgraph(int subgraph_id);

    [[nodiscard]] const TreeGraph& graph() const { return graph_; }
    [[nodiscard]] NodeId root() const { return root_; }
    [[nodiscard]] const PointBudget& point_budget() const { return budget_; }
    [[nodiscard]] const AttributeArray& attribute_requirements() const { return min_attributes_; }
    [[nodiscard]] const SocketRequirement& socket_requirement() const { return sockets_; }
    [[nodiscard]] ConstraintPolicy policy() const { return policy_; }
    [[nodiscard]] const PenaltyWeights& penalty_weights() const { return weights_; }
    [[nodiscard]] const NodeSet& occupied_sockets() const { return occupied_sockets_; }

    // Derived quantities
    [[nodiscard]] int point_cost(const Allocation& allocation) const {
        return static_cast<int>(allocation.size());
    }
    [[nodiscard]] AttributeArray attribute_totals(const Allocation& allocation) const;
    [[nodiscard]] int socket_count(const Allocation& allocation) const;

    // Occupied sockets, registered subgraphs, and any allocated generated node
    [[nodiscard]] NodeSet protected_nodes(const Allocation& allocation) const;

    [[nodiscard]] ConstraintViolation measure(const Allocation& allocation) const;
    [[nodiscard]] ValidationResult validate(const Allocation& allocation) const;

    // Linear soft penalty (<= 0) using the configured weights
    [[nodiscard]] double fitness_penalty(const Allocation& allocation) const;

    // Point budget checks for single-node moves
    [[nodiscard]] bool can_add_point(const Allocation& allocation) const;
    [[nodiscard]] bool can_remove_point(const Allocation& allocation) const;

    // Attempts to make the allocation satisfy every constraint without touching
    // protected nodes or breaking connectivity. Returns nullopt if infeasible.
    [[nodiscard]] std::optional<Allocation> repair(const Allocation& allocation) const;

private:
    // Extends along the cheapest path to the nearest node accepted by want
    template <typename Pred>
    bool extend_towards(Allocation& allocation, const NodeSet& protected_nodes, Pred want) const;

    // Removes the removable node accepted by allow with the lowest type rank,
    // then the lowest "weight" tag
    template <typename Pred>
    bool trim_one(Allocation& allocation, const NodeSet& protected_nodes, Pred allow) const;

    const TreeGraph& graph_;
    NodeId root_;

    PointBudget budget_;
    AttributeArray min_attributes_{};
    SocketRequirement sockets_;
    ConstraintPolicy policy_{ConstraintPolicy::SoftPenalize};
    PenaltyWeights weights_;

    NodeSet occupied_sockets_;
    NodeSet subgraph_nodes_;
};

}  // namespace graph_alloc
