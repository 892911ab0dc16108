#pragma once

#include "operators.hpp"
#include "optimizer.hpp"
#include "../core/individual.hpp"
#include <string>
#include <vector>

namespace graph_alloc {

struct GeneticResult {
    Individual best;
    double best_fitness{FAILED_FITNESS};
    double seed_fitness{FAILED_FITNESS};
    int generations{0};
    std::vector<double> best_fitness_history;
    std::vector<double> avg_fitness_history;
    std::vector<Individual> final_population;   // best first
    uint64_t evaluations{0};
    uint64_t failed_evaluations{0};
    RunStatus status{RunStatus::Completed};
    std::string message;

    [[nodiscard]] double improvement() const { return best_fitness - seed_fitness; }
};

// Generational GA over allocations: elitism, tournament selection and the
// graph-aware operators. Stops at the generation cap or when the best fitness
// has not gained more than convergence_epsilon for convergence_window generations.
class GeneticOptimizer : public Optimizer {
public:
    struct Config {
        int population_size{30};
        int generations{50};
        double mutation_rate{0.2};
        double crossover_rate{0.8};
        int elitism_count{5};
        int tournament_size{3};
        double inherit_probability{0.5};
        int initial_changes{5};
        int min_allocation_size{1};
        int max_reattach_cost{4};
        int convergence_window{10};
        double convergence_epsilon{0.1};
        Millis timeout{30000};
        uint64_t seed{42};
        bool verbose{false};
    };

    GeneticOptimizer(const Problem& problem, Evaluator& evaluator, Config config);
    GeneticOptimizer(const Problem& problem, Evaluator& evaluator)
        : GeneticOptimizer(problem, evaluator, Config{}) {}

    // Throws InvalidSeed before evaluating anything
    [[nodiscard]] GeneticResult optimize(const Allocation& seed);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    void evaluate_population(Population& population, const Metrics& baseline);
    [[nodiscard]] const Individual& tournament(const Population& population, RNG& rng) const;
    [[nodiscard]] std::vector<Individual> breed(const Population& population, const GeneticOperators& ops, RNG& rng) const;

    Config config_;
};

}  // namespace graph_alloc
