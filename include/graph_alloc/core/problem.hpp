#pragma once

#include "allocation.hpp"
#include "tree_graph.hpp"
#include "../constraints/constraint_set.hpp"
#include "../eval/metrics.hpp"
#include <cmath>
#include <map>
#include <optional>
#include <string_view>
#include <vector>

namespace graph_alloc {

// Constraint penalty types
enum class ConstraintPenaltyType {
    Linear,      // mu * violation
    Quadratic,   // mu * violation^2
    Exponential  // mu * (exp(violation / scale) - 1)
};

enum class Objective {
    Dps,
    Life,
    Ehp,
    Mana,
    EnergyShield,
    Block,
    ClearSpeed,
    Balanced     // weighted sum of the dps, life and ehp changes
};

[[nodiscard]] const char* objective_name(Objective objective);
[[nodiscard]] std::optional<Objective> parse_objective(std::string_view name);

// Percentage change of value against baseline; a zero baseline counts as 1
[[nodiscard]] double relative_change(double value, double baseline);

// Binds the graph, the constraint set and the objective, and turns evaluator
// metrics into fitness. Immutable once configured.
class Problem {
public:
    Problem(const TreeGraph& graph, const ConstraintSet& constraints, Objective objective = Objective::Balanced);

    [[nodiscard]] const TreeGraph& graph() const { return graph_; }
    [[nodiscard]] const ConstraintSet& constraints() const { return constraints_; }
    [[nodiscard]] NodeId root() const { return constraints_.root(); }
    [[nodiscard]] Objective objective() const { return objective_; }

    // Throws InvalidSeed when the allocation is unusable as a starting point
    void validate_seed(const Allocation& seed) const;

    // Relative change of one objective against the baseline metrics
    [[nodiscard]] double objective_value(const Metrics& metrics, const Metrics& baseline, Objective objective) const;

    // Scalar fitness: objective change minus the constraint penalty (soft policy only).
    // Failed results map to FAILED_FITNESS.
    [[nodiscard]] double fitness(
        const Allocation& allocation,
        const EvaluationResult& result,
        const Metrics& baseline
    ) const;

    // One relative change per objective, each reduced by the constraint penalty
    [[nodiscard]] std::vector<double> objective_vector(
        const Allocation& allocation,
        const EvaluationResult& result,
        const Metrics& baseline,
        const std::vector<Objective>& objectives
    ) const;

    // Candidate to evaluate under the constraint policy, or nullopt if it must be rejected
    [[nodiscard]] std::optional<Allocation> apply_policy(const Allocation& allocation) const;

    // Total constraint penalty (>= 0) for the allocation
    [[nodiscard]] double constraint_penalty(const Allocation& allocation) const;

    [[nodiscard]] double compute_constraint_penalty(double violation, double mu) const {
        if (violation <= 0.0) {
            return 0.0;
        }

        switch (constraint_penalty_type_) {
            case ConstraintPenaltyType::Linear:
                return mu * violation;

            case ConstraintPenaltyType::Quadratic:
                return mu * violation * violation;

            case ConstraintPenaltyType::Exponential:
                return mu * (std::exp(violation / constraint_exp_scale_) - 1.0);

            default:
                return mu * violation;
        }
    }

    void set_constraint_penalty_type(ConstraintPenaltyType type) { constraint_penalty_type_ = type; }
    void set_constraint_exp_scale(double scale) { constraint_exp_scale_ = scale; }
    [[nodiscard]] ConstraintPenaltyType constraint_penalty_type() const { return constraint_penalty_type_; }
    [[nodiscard]] double constraint_exp_scale() const { return constraint_exp_scale_; }

    // Weights of the Balanced objective (default: equal thirds of dps, life, ehp)
    void set_balanced_weights(std::map<Objective, double> weights);
    [[nodiscard]] const std::map<Objective, double>& balanced_weights() const { return balanced_weights_; }

private:
    const TreeGraph& graph_;
    const ConstraintSet& constraints_;
    Objective objective_;

    ConstraintPenaltyType constraint_penalty_type_{ConstraintPenaltyType::Linear};
    double constraint_exp_scale_{10.0};

    std::map<Objective, double> balanced_weights_{
        {Objective::Dps, 1.0 / 3.0},
        {Objective::Life, 1.0 / 3.0},
        {Objective::Ehp, 1.0 / 3.0}
    };
};

}  // namespace graph_alloc
