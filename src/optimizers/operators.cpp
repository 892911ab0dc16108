#include "graph_alloc/optimizers/operators.hpp"
#include <algorithm>
#include <stdexcept>

namespace graph_alloc {

GeneticOperators::GeneticOperators(const Problem& problem, NodeSet protected_nodes, Config config)
    : problem_(problem), protected_(std::move(protected_nodes)), config_(config)
{
    if (config_.inherit_probability < 0.0 || config_.inherit_probability > 1.0) {
        throw std::invalid_argument("inherit_probability must be in [0, 1]");
    }
}

bool GeneticOperators::hard_budget() const {
    return problem_.constraints().policy() != ConstraintPolicy::SoftPenalize;
}

std::vector<NodeId> GeneticOperators::addable_nodes(const Allocation& allocation) const {
    if (hard_budget() && !problem_.constraints().can_add_point(allocation)) {
        return {};
    }
    std::vector<NodeId> out;
    for (NodeId id : problem_.graph().unallocated_neighbors(allocation.nodes)) {
        if (!protected_.count(id)) {
            out.push_back(id);
        }
    }
    return out;
}

bool GeneticOperators::add_random_neighbor(Allocation& allocation, RNG& rng) const {
    auto candidates = addable_nodes(allocation);
    if (candidates.empty()) {
        return false;
    }
    allocation.add(rng.pick(candidates), problem_.graph());
    return true;
}

bool GeneticOperators::remove_random_node(Allocation& allocation, RNG& rng) const {
    if (static_cast<int>(allocation.size()) <= config_.min_allocation_size) {
        return false;
    }
    if (hard_budget() && !problem_.constraints().can_remove_point(allocation)) {
        return false;
    }

    const NodeId root = problem_.root();
    std::vector<NodeId> candidates;
    for (NodeId id : allocation.nodes) {
        if (id != root && !protected_.count(id)) {
            candidates.push_back(id);
        }
    }
    rng.shuffle(candidates);

    for (NodeId id : candidates) {
        if (problem_.graph().is_removable(allocation.nodes, id, root)) {
            allocation.remove(id);
            return true;
        }
    }
    return false;
}

bool GeneticOperators::reselect_random_effect(Allocation& allocation, RNG& rng) const {
    const TreeGraph& graph = problem_.graph();

    std::vector<NodeId> masteries;
    for (const auto& [node, effect] : allocation.selections) {
        if (!protected_.count(node) && graph.metadata(node).effects.size() > 1) {
            masteries.push_back(node);
        }
    }
    if (masteries.empty()) {
        return false;
    }

    NodeId node = rng.pick(masteries);
    EffectId current = allocation.selections.at(node);
    std::vector<EffectId> alternatives;
    for (EffectId effect : graph.metadata(node).effects) {
        if (effect != current) {
            alternatives.push_back(effect);
        }
    }
    allocation.select(node, rng.pick(alternatives));
    return true;
}

std::optional<MutationKind> GeneticOperators::mutate(Allocation& allocation, RNG& rng) const {
    std::vector<MutationKind> kinds{MutationKind::Add, MutationKind::Remove, MutationKind::Reselect};
    rng.shuffle(kinds);

    for (MutationKind kind : kinds) {
        bool applied = false;
        switch (kind) {
            case MutationKind::Add:
                applied = add_random_neighbor(allocation, rng);
                break;
            case MutationKind::Remove:
                applied = remove_random_node(allocation, rng);
                break;
            case MutationKind::Reselect:
                applied = reselect_random_effect(allocation, rng);
                break;
        }
        if (applied) {
            return kind;
        }
    }
    return std::nullopt;
}

Allocation GeneticOperators::random_variation(const Allocation& seed, int max_changes, RNG& rng) const {
    Allocation out = seed;
    int changes = rng.randint(1, std::max(1, max_changes));
    for (int i = 0; i < changes; ++i) {
        if (!mutate(out, rng)) {
            break;
        }
    }
    return out;
}

Allocation GeneticOperators::crossover(const Allocation& fitter, const Allocation& other, RNG& rng) const {
    const TreeGraph& graph = problem_.graph();
    Allocation child;

    for (NodeId id : fitter.nodes) {
        if (other.contains(id) || protected_.count(id)) {
            child.nodes.insert(id);
        } else if (rng.bernoulli(config_.inherit_probability)) {
            child.nodes.insert(id);
        }
    }
    for (NodeId id : other.nodes) {
        if (fitter.contains(id)) {
            continue;
        }
        if (protected_.count(id) || rng.bernoulli(config_.inherit_probability)) {
            child.nodes.insert(id);
        }
    }

    for (NodeId id : child.nodes) {
        if (!graph.metadata(id).has_effects()) {
            continue;
        }
        auto it = fitter.selections.find(id);
        if (it != fitter.selections.end()) {
            child.selections[id] = it->second;
        } else if ((it = other.selections.find(id)) != other.selections.end()) {
            child.selections[id] = it->second;
        } else {
            child.selections[id] = graph.metadata(id).effects.front();
        }
    }

    auto repaired = repair_connectivity(child);
    if (!repaired || !trim_to_budget(*repaired, rng)) {
        return fitter;
    }
    return std::move(*repaired);
}

bool GeneticOperators::trim_to_budget(Allocation& allocation, RNG& rng) const {
    if (!hard_budget()) {
        return true;
    }
    const PointBudget& budget = problem_.constraints().point_budget();
    if (!budget.max_points) {
        return true;
    }
    while (problem_.constraints().point_cost(allocation) > *budget.max_points) {
        if (!remove_random_node(allocation, rng)) {
            return false;
        }
    }
    return true;
}

std::optional<Allocation> GeneticOperators::repair_connectivity(const Allocation& allocation) const {
    const TreeGraph& graph = problem_.graph();
    const NodeId root = problem_.root();
    if (!allocation.contains(root)) {
        return std::nullopt;
    }

    Allocation out = allocation;
    out.prune_selections();
    NodeSet reached = graph.reachable_from(out.nodes, root);
    if (reached.size() == out.size()) {
        return out;
    }

    NodeSet orphans;
    for (NodeId id : out.nodes) {
        if (!reached.count(id)) {
            orphans.insert(id);
        }
    }

    // Paths may not pass through protected nodes that are not allocated
    NodeSet avoid;
    for (NodeId id : protected_) {
        if (!out.contains(id)) {
            avoid.insert(id);
        }
    }

    while (!orphans.empty()) {
        NodeSet component = graph.reachable_from(orphans, *orphans.begin());
        for (NodeId id : component) {
            orphans.erase(id);
        }

        bool mandatory = std::any_of(component.begin(), component.end(),
            [&](NodeId id) { return protected_.count(id) > 0; });

        auto path = graph.shortest_path(reached, component, &avoid);
        int cost = 0;
        if (path) {
            for (NodeId id : *path) {
                if (!out.contains(id)) ++cost;
            }
        }

        if (path && (mandatory || cost <= config_.max_reattach_cost)) {
            for (NodeId id : *path) {
                if (!out.contains(id)) {
                    out.add(id, graph);
                }
                reached.insert(id);
            }
            reached.insert(component.begin(), component.end());
        } else if (mandatory) {
            return std::nullopt;
        } else {
            for (NodeId id : component) {
                out.remove(id);
            }
        }
    }

    if (!graph.is_connected(out.nodes, root)) {
        return std::nullopt;
    }
    return out;
}

}  // namespace graph_alloc
