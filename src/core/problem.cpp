#include "graph_alloc/core/problem.hpp"
#include "graph_alloc/core/errors.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace graph_alloc {

namespace {

// Wire name of the metric behind a single objective
const char* metric_name(Objective objective) {
    switch (objective) {
        case Objective::Dps: return "dps";
        case Objective::Life: return "life";
        case Objective::Ehp: return "ehp";
        case Objective::Mana: return "mana";
        case Objective::EnergyShield: return "energy_shield";
        case Objective::Block: return "block";
        case Objective::ClearSpeed: return "clear_speed";
        case Objective::Balanced: break;
    }
    return nullptr;
}

}  // namespace

const char* objective_name(Objective objective) {
    if (objective == Objective::Balanced) {
        return "balanced";
    }
    return metric_name(objective);
}

std::optional<Objective> parse_objective(std::string_view name) {
    for (Objective o : {Objective::Dps, Objective::Life, Objective::Ehp, Objective::Mana,
                        Objective::EnergyShield, Objective::Block, Objective::ClearSpeed,
                        Objective::Balanced}) {
        if (name == objective_name(o)) {
            return o;
        }
    }
    if (name == "es") return Objective::EnergyShield;
    return std::nullopt;
}

double relative_change(double value, double baseline) {
    if (baseline == 0.0) {
        baseline = 1.0;
    }
    return (value / baseline - 1.0) * 100.0;
}

Problem::Problem(const TreeGraph& graph, const ConstraintSet& constraints, Objective objective)
    : graph_(graph), constraints_(constraints), objective_(objective)
{
    if (&constraints_.graph() != &graph_) {
        throw std::invalid_argument("ConstraintSet was built for a different graph");
    }
}

void Problem::set_balanced_weights(std::map<Objective, double> weights) {
    if (weights.count(Objective::Balanced)) {
        throw std::invalid_argument("Balanced cannot weight itself");
    }
    balanced_weights_ = std::move(weights);
}

void Problem::validate_seed(const Allocation& seed) const {
    if (seed.empty()) {
        throw InvalidSeed("Seed allocation is empty");
    }
    for (NodeId id : seed.nodes) {
        if (!graph_.has_node(id)) {
            throw InvalidSeed("Seed contains unknown node " + std::to_string(id));
        }
    }
    if (!seed.contains(root())) {
        throw InvalidSeed("Seed does not contain the root node " + std::to_string(root()));
    }
    if (!graph_.is_connected(seed.nodes, root())) {
        throw InvalidSeed("Seed allocation is not connected to the root");
    }
    for (const auto& [node, effect] : seed.selections) {
        if (!seed.contains(node)) {
            throw InvalidSeed("Selection on unallocated node " + std::to_string(node));
        }
        const auto& effects = graph_.metadata(node).effects;
        if (std::find(effects.begin(), effects.end(), effect) == effects.end()) {
            throw InvalidSeed("Node " + std::to_string(node) + " has no effect " + std::to_string(effect));
        }
    }
    if (constraints_.policy() == ConstraintPolicy::HardReject) {
        auto validation = constraints_.validate(seed);
        if (!validation.ok) {
            throw InvalidSeed("Seed violates constraints: " + validation.violations.front());
        }
    }
}

double Problem::objective_value(const Metrics& metrics, const Metrics& baseline, Objective objective) const {
    if (objective == Objective::Balanced) {
        double total = 0.0;
        for (const auto& [part, weight] : balanced_weights_) {
            total += weight * objective_value(metrics, baseline, part);
        }
        return total;
    }

    const char* name = metric_name(objective);
    auto value = metrics.get(name);
    auto base = baseline.get(name);
    if (!value && !base) {
        return 0.0;
    }
    return relative_change(value.value_or(0.0), base.value_or(0.0));
}

double Problem::constraint_penalty(const Allocation& allocation) const {
    ConstraintViolation v = constraints_.measure(allocation);
    const PenaltyWeights& w = constraints_.penalty_weights();
    return compute_constraint_penalty(v.budget_excess + v.budget_deficit, w.point)
         + compute_constraint_penalty(v.attribute_deficit, w.attribute)
         + compute_constraint_penalty(v.socket_deviation, w.socket);
}

double Problem::fitness(
    const Allocation& allocation,
    const EvaluationResult& result,
    const Metrics& baseline
) const {
    if (!result.success()) {
        return FAILED_FITNESS;
    }
    double value = objective_value(result.metrics, baseline, objective_);
    if (constraints_.policy() == ConstraintPolicy::SoftPenalize) {
        value -= constraint_penalty(allocation);
    }
    return value;
}

std::vector<double> Problem::objective_vector(
    const Allocation& allocation,
    const EvaluationResult& result,
    const Metrics& baseline,
    const std::vector<Objective>& objectives
) const {
    std::vector<double> values(objectives.size(), FAILED_FITNESS);
    if (!result.success()) {
        return values;
    }

    double penalty = 0.0;
    if (constraints_.policy() == ConstraintPolicy::SoftPenalize) {
        penalty = constraint_penalty(allocation);
    }
    for (size_t i = 0; i < objectives.size(); ++i) {
        values[i] = objective_value(result.metrics, baseline, objectives[i]) - penalty;
    }
    return values;
}

std::optional<Allocation> Problem::apply_policy(const Allocation& allocation) const {
    switch (constraints_.policy()) {
        case ConstraintPolicy::SoftPenalize:
            return allocation;

        case ConstraintPolicy::HardReject:
            if (!constraints_.validate(allocation).ok) {
                return std::nullopt;
            }
            return allocation;

        case ConstraintPolicy::Repair:
            if (constraints_.validate(allocation).ok) {
                return allocation;
            }
            return constraints_.repair(allocation);
    }
    return allocation;
}

}  // namespace graph_alloc
