#pragma once

#include "operators.hpp"
#include "optimizer.hpp"
#include "../core/individual.hpp"
#include <optional>
#include <string>
#include <vector>

namespace graph_alloc {

using ObjectiveVector = std::vector<double>;

// a dominates b: no worse in every objective and strictly better in at least one
[[nodiscard]] bool dominates(const ObjectiveVector& a, const ObjectiveVector& b);

// Fronts of indices into objectives, rank 0 first
[[nodiscard]] std::vector<std::vector<size_t>> non_dominated_sort(const std::vector<ObjectiveVector>& objectives);

// Crowding distance of each member of front, aligned with front.
// Boundary members and fronts of at most two members get infinity.
[[nodiscard]] std::vector<double> crowding_distance(
    const std::vector<ObjectiveVector>& objectives,
    const std::vector<size_t>& front
);

struct ParetoIndividual {
    Individual individual;
    ObjectiveVector objectives;
    int rank{0};
    double crowding_distance{0.0};
};

// Crowded comparison: lower rank, then larger crowding distance
[[nodiscard]] bool crowded_less(const ParetoIndividual& a, const ParetoIndividual& b);

// Non-dominated trade-offs of a run
class ParetoFrontier {
public:
    ParetoFrontier() = default;
    ParetoFrontier(std::vector<ParetoIndividual> individuals, std::vector<Objective> objectives);

    [[nodiscard]] const std::vector<ParetoIndividual>& individuals() const { return individuals_; }
    [[nodiscard]] const std::vector<Objective>& objectives() const { return objectives_; }
    [[nodiscard]] size_t size() const { return individuals_.size(); }
    [[nodiscard]] bool empty() const { return individuals_.empty(); }

    // Best member for each objective, in objective order
    [[nodiscard]] std::vector<ParetoIndividual> extreme_points() const;

    // Member with the smallest variance across min-max normalized objectives
    [[nodiscard]] std::optional<ParetoIndividual> balanced() const;

private:
    std::vector<ParetoIndividual> individuals_;
    std::vector<Objective> objectives_;
};

// Rank-0 members of individuals with their crowding distance. Failed
// evaluations never make it to the frontier.
[[nodiscard]] ParetoFrontier get_pareto_frontier(
    const std::vector<ParetoIndividual>& individuals,
    const std::vector<Objective>& objectives
);

struct MultiObjectiveResult {
    ParetoFrontier frontier;
    int generations{0};
    std::vector<size_t> frontier_size_history;
    uint64_t evaluations{0};
    uint64_t failed_evaluations{0};
    RunStatus status{RunStatus::Completed};
    std::string message;
};

// NSGA-II over allocations: (mu + lambda) survival by fronts then crowding,
// binary crowded tournament, and the shared graph-aware operators.
class MultiObjectiveOptimizer : public Optimizer {
public:
    struct Config {
        int population_size{30};
        int generations{50};
        double mutation_rate{0.2};
        double crossover_rate{0.8};
        double inherit_probability{0.5};
        int initial_changes{5};
        int min_allocation_size{1};
        int max_reattach_cost{4};
        Millis timeout{30000};
        uint64_t seed{42};
        bool verbose{false};
    };

    MultiObjectiveOptimizer(
        const Problem& problem,
        Evaluator& evaluator,
        std::vector<Objective> objectives,
        Config config
    );
    MultiObjectiveOptimizer(const Problem& problem, Evaluator& evaluator)
        : MultiObjectiveOptimizer(problem, evaluator, {Objective::Dps, Objective::Life, Objective::Ehp}, Config{}) {}

    // Throws InvalidSeed before evaluating anything
    [[nodiscard]] MultiObjectiveResult optimize(const Allocation& seed);

    [[nodiscard]] const Config& config() const { return config_; }
    [[nodiscard]] const std::vector<Objective>& objectives() const { return objectives_; }

private:
    void evaluate(std::vector<ParetoIndividual>& individuals, const Metrics& baseline, uint64_t step);

    // Sets rank and crowding on every member and keeps the best mu
    [[nodiscard]] std::vector<ParetoIndividual> select_survivors(std::vector<ParetoIndividual> combined, size_t mu) const;

    [[nodiscard]] std::vector<ParetoIndividual> make_offspring(
        const std::vector<ParetoIndividual>& parents,
        const GeneticOperators& ops,
        int generation,
        RNG& rng
    ) const;

    std::vector<Objective> objectives_;
    Config config_;
    uint64_t next_id_{1};
};

}  // namespace graph_alloc
