#pragma once

#include "../core/allocation.hpp"
#include "../core/problem.hpp"
#include "../random/rng.hpp"
#include <optional>
#include <vector>

namespace graph_alloc {

enum class MutationKind { Add, Remove, Reselect };

// Graph-aware variation operators shared by the single- and multi-objective
// genetic optimizers. Every output is connected to the root and keeps the
// protected set exactly as it was in the parents.
class GeneticOperators {
public:
    struct Config {
        double inherit_probability{0.5};   // chance to keep a node owned by one parent only
        int min_allocation_size{1};        // removal floor
        int max_reattach_cost{4};          // max nodes added to reattach an unprotected orphan branch
    };

    GeneticOperators(const Problem& problem, NodeSet protected_nodes, Config config);

    // Intersection of both parents plus each unique node with inherit_probability;
    // selections come from the fitter parent. Under a hard budget the offspring
    // is trimmed back to max_points. Falls back to a copy of the fitter parent
    // when the offspring cannot be repaired or trimmed.
    [[nodiscard]] Allocation crossover(const Allocation& fitter, const Allocation& other, RNG& rng) const;

    // Applies exactly one applicable mutation. Returns the kind applied, or
    // nullopt when no mutation is possible.
    std::optional<MutationKind> mutate(Allocation& allocation, RNG& rng) const;

    // Seed followed by 1..max_changes random mutations
    [[nodiscard]] Allocation random_variation(const Allocation& seed, int max_changes, RNG& rng) const;

    // Reattaches branches cut off from the root via shortest paths, or drops them.
    // Branches holding protected nodes are always reattached; nullopt if impossible.
    [[nodiscard]] std::optional<Allocation> repair_connectivity(const Allocation& allocation) const;

    // Removes random removable nodes until max_points holds. No-op unless the
    // budget is enforced; false if it cannot be met.
    bool trim_to_budget(Allocation& allocation, RNG& rng) const;

    bool add_random_neighbor(Allocation& allocation, RNG& rng) const;
    bool remove_random_node(Allocation& allocation, RNG& rng) const;
    bool reselect_random_effect(Allocation& allocation, RNG& rng) const;

    [[nodiscard]] std::vector<NodeId> addable_nodes(const Allocation& allocation) const;
    [[nodiscard]] const NodeSet& protected_nodes() const { return protected_; }
    [[nodiscard]] const Config& config() const { return config_; }

private:
    [[nodiscard]] bool hard_budget() const;

    const Problem& problem_;
    NodeSet protected_;
    Config config_;
};

}  // namespace graph_alloc
