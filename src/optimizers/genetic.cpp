#include "graph_alloc/optimizers/genetic.hpp"
#include "graph_alloc/core/errors.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace graph_alloc {

GeneticOptimizer::GeneticOptimizer(const Problem& problem, Evaluator& evaluator, Config config)
    : Optimizer(problem, evaluator, "GeneticOptimizer"), config_(config)
{
    if (config_.population_size < 1) {
        throw std::invalid_argument("population_size must be positive");
    }
    if (config_.tournament_size < 1) {
        throw std::invalid_argument("tournament_size must be positive");
    }
    verbose_ = config_.verbose;
}

void GeneticOptimizer::evaluate_population(Population& population, const Metrics& baseline) {
    std::vector<size_t> pending;
    std::vector<Allocation> candidates;
    for (size_t i = 0; i < population.size(); ++i) {
        const Individual& ind = population.individuals()[i];
        if (!ind.evaluated()) {
            pending.push_back(i);
            candidates.push_back(ind.allocation());
        }
    }
    if (pending.empty()) {
        return;
    }

    auto results = evaluate_candidates(candidates, config_.timeout, static_cast<uint64_t>(population.generation()));

    for (size_t k = 0; k < pending.size(); ++k) {
        Individual& ind = population.individuals()[pending[k]];
        if (!(candidates[k] == ind.allocation())) {
            ind.set_allocation(candidates[k]);
        }
        double fitness = problem_.fitness(candidates[k], results[k], baseline);
        ind.set_evaluation(results[k].status, results[k].metrics, fitness);
    }
}

const Individual& GeneticOptimizer::tournament(const Population& population, RNG& rng) const {
    const auto& individuals = population.individuals();
    const int n = static_cast<int>(individuals.size());

    size_t best = static_cast<size_t>(rng.randint(0, n - 1));
    for (int i = 1; i < config_.tournament_size; ++i) {
        size_t idx = static_cast<size_t>(rng.randint(0, n - 1));
        if (individuals[idx].fitness() > individuals[best].fitness()) {
            best = idx;
        }
    }
    return individuals[best];
}

std::vector<Individual> GeneticOptimizer::breed(const Population& population, const GeneticOperators& ops, RNG& rng) const {
    const auto& current = population.individuals();
    const size_t target = static_cast<size_t>(config_.population_size);
    const size_t elites = std::min(static_cast<size_t>(std::max(0, config_.elitism_count)), current.size());

    // Population is sorted best first; elites carry their evaluation over
    std::vector<Individual> next(current.begin(), current.begin() + static_cast<std::ptrdiff_t>(elites));
    next.reserve(target);

    while (next.size() < target) {
        const Individual& a = tournament(population, rng);
        const Individual& b = tournament(population, rng);
        const Individual& fitter = a.fitness() >= b.fitness() ? a : b;
        const Individual& other = &fitter == &a ? b : a;

        Allocation child = rng.bernoulli(config_.crossover_rate)
            ? ops.crossover(fitter.allocation(), other.allocation(), rng)
            : fitter.allocation();

        if (rng.bernoulli(config_.mutation_rate)) {
            ops.mutate(child, rng);
        }

        Individual offspring(std::move(child), population.generation() + 1);
        offspring.set_parents({a.id(), b.id()});
        next.push_back(std::move(offspring));
    }
    return next;
}

GeneticResult GeneticOptimizer::optimize(const Allocation& seed) {
    problem_.validate_seed(seed);
    evaluations_ = 0;
    failed_evaluations_ = 0;
    consecutive_failed_steps_ = 0;

    GeneticOperators ops(problem_, problem_.constraints().protected_nodes(seed), {
        config_.inherit_probability,
        config_.min_allocation_size,
        config_.max_reattach_cost
    });

    GlobalState state(config_.seed);
    state.set_tolerance(config_.convergence_epsilon);

    GeneticResult result;
    result.best = Individual(seed);
    Population population;

    try {
        EvaluationResult base = evaluator_.evaluate(seed, config_.timeout);
        ++evaluations_;
        if (!base.success()) {
            ++failed_evaluations_;
            result.status = RunStatus::Aborted;
            result.message = "Seed evaluation failed: " + base.error;
            std::cerr << "[GeneticOptimizer] ERROR: " << result.message << "\n";
            result.evaluations = evaluations_;
            result.failed_evaluations = failed_evaluations_;
            return result;
        }

        const Metrics baseline = base.metrics;
        result.seed_fitness = problem_.fitness(seed, base, baseline);

        Individual first(seed);
        first.set_evaluation(EvalStatus::Ok, baseline, result.seed_fitness);
        population.add(std::move(first));
        result.best = population.individuals().front();
        while (population.size() < static_cast<size_t>(config_.population_size)) {
            population.add(Individual(ops.random_variation(seed, config_.initial_changes, state.rng())));
        }

        for (;;) {
            evaluate_population(population, baseline);
            population.sort_by_fitness();
            population.record_generation();

            state.next();
            const Individual& best = population.best();
            state.maybe_update_best(best.fitness(), best.allocation());

            if (verbose_) {
                FitnessStats s = population.stats();
                std::cout << "[GeneticOptimizer] gen=" << population.generation()
                          << " best=" << s.best
                          << " avg=" << s.average
                          << " failed=" << s.failed
                          << " stall=" << state.iters_since_improvement() << "\n";
            }

            if (state.iteration() >= static_cast<uint64_t>(std::max(1, config_.generations))) {
                result.status = RunStatus::Completed;
                result.message = "Generation limit reached";
                break;
            }
            if (config_.convergence_window > 0
                && state.iters_since_improvement() >= static_cast<uint64_t>(config_.convergence_window)) {
                result.status = RunStatus::Converged;
                result.message = "No improvement above epsilon for "
                    + std::to_string(config_.convergence_window) + " generations";
                break;
            }

            population.advance(breed(population, ops, state.rng()));
        }
    } catch (const EvaluatorUnavailable& e) {
        result.status = RunStatus::Aborted;
        result.message = e.what();
        std::cerr << "[GeneticOptimizer] ERROR: aborted at gen=" << population.generation()
                  << ": " << e.what() << "\n";
    }

    if (population.best_ever()) {
        result.best = *population.best_ever();
    }
    result.best_fitness = result.best.evaluated() ? result.best.fitness() : FAILED_FITNESS;
    result.generations = static_cast<int>(state.iteration());
    result.best_fitness_history = population.best_history();
    result.avg_fitness_history = population.average_history();
    result.final_population = population.individuals();
    result.evaluations = evaluations_;
    result.failed_evaluations = failed_evaluations_;

    if (verbose_) {
        std::cout << "[GeneticOptimizer] status=" << run_status_name(result.status)
                  << " generations=" << result.generations
                  << " best=" << result.best_fitness
                  << " improvement=" << result.improvement()
                  << " evaluations=" << result.evaluations << "\n";
    }
    return result;
}

}  // namespace graph_alloc
