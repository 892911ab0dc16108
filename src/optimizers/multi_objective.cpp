#include "graph_alloc/optimizers/multi_objective.hpp"
#include "graph_alloc/core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <iterator>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace graph_alloc {

namespace {
constexpr double INF = std::numeric_limits<double>::infinity();

bool all_failed(const ObjectiveVector& v) {
    return std::all_of(v.begin(), v.end(), [](double x) { return x == FAILED_FITNESS; });
}
}

bool dominates(const ObjectiveVector& a, const ObjectiveVector& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("dominates: objective vectors differ in length");
    }
    bool strictly_better = false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i] < b[i]) {
            return false;
        }
        if (a[i] > b[i]) {
            strictly_better = true;
        }
    }
    return strictly_better;
}

std::vector<std::vector<size_t>> non_dominated_sort(const std::vector<ObjectiveVector>& objectives) {
    const size_t n = objectives.size();
    std::vector<std::vector<size_t>> dominated(n);
    std::vector<int> domination_count(n, 0);
    std::vector<std::vector<size_t>> fronts;

    std::vector<size_t> current;
    for (size_t p = 0; p < n; ++p) {
        for (size_t q = 0; q < n; ++q) {
            if (p == q) continue;
            if (dominates(objectives[p], objectives[q])) {
                dominated[p].push_back(q);
            } else if (dominates(objectives[q], objectives[p])) {
                ++domination_count[p];
            }
        }
        if (domination_count[p] == 0) {
            current.push_back(p);
        }
    }

    while (!current.empty()) {
        std::vector<size_t> next;
        for (size_t p : current) {
            for (size_t q : dominated[p]) {
                if (--domination_count[q] == 0) {
                    next.push_back(q);
                }
            }
        }
        std::sort(next.begin(), next.end());
        fronts.push_back(std::move(current));
        current = std::move(next);
    }
    return fronts;
}

std::vector<double> crowding_distance(
    const std::vector<ObjectiveVector>& objectives,
    const std::vector<size_t>& front
) {
    const size_t n = front.size();
    if (n <= 2) {
        return std::vector<double>(n, INF);
    }

    std::vector<double> distance(n, 0.0);
    const size_t m = objectives[front[0]].size();
    std::vector<size_t> order(n);

    for (size_t obj = 0; obj < m; ++obj) {
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            return objectives[front[a]][obj] < objectives[front[b]][obj];
        });

        distance[order.front()] = INF;
        distance[order.back()] = INF;

        double lo = objectives[front[order.front()]][obj];
        double hi = objectives[front[order.back()]][obj];
        double range = hi - lo;
        if (range == 0.0 || !std::isfinite(range)) {
            continue;
        }

        for (size_t i = 1; i + 1 < n; ++i) {
            if (distance[order[i]] == INF) continue;
            double prev = objectives[front[order[i - 1]]][obj];
            double next = objectives[front[order[i + 1]]][obj];
            distance[order[i]] += (next - prev) / range;
        }
    }
    return distance;
}

bool crowded_less(const ParetoIndividual& a, const ParetoIndividual& b) {
    if (a.rank != b.rank) {
        return a.rank < b.rank;
    }
    return a.crowding_distance > b.crowding_distance;
}

ParetoFrontier::ParetoFrontier(std::vector<ParetoIndividual> individuals, std::vector<Objective> objectives)
    : individuals_(std::move(individuals)), objectives_(std::move(objectives)) {}

std::vector<ParetoIndividual> ParetoFrontier::extreme_points() const {
    std::vector<ParetoIndividual> out;
    if (individuals_.empty()) {
        return out;
    }
    const size_t m = individuals_.front().objectives.size();
    for (size_t obj = 0; obj < m; ++obj) {
        auto it = std::max_element(individuals_.begin(), individuals_.end(),
            [obj](const ParetoIndividual& a, const ParetoIndividual& b) {
                return a.objectives[obj] < b.objectives[obj];
            });
        out.push_back(*it);
    }
    return out;
}

std::optional<ParetoIndividual> ParetoFrontier::balanced() const {
    if (individuals_.empty()) {
        return std::nullopt;
    }
    const size_t m = individuals_.front().objectives.size();
    if (m == 0) {
        return individuals_.front();
    }

    std::vector<double> lo(m, INF), hi(m, -INF);
    for (const auto& ind : individuals_) {
        for (size_t k = 0; k < m; ++k) {
            lo[k] = std::min(lo[k], ind.objectives[k]);
            hi[k] = std::max(hi[k], ind.objectives[k]);
        }
    }

    size_t best = 0;
    double best_variance = INF;
    for (size_t i = 0; i < individuals_.size(); ++i) {
        std::vector<double> norm(m, 0.0);
        double mean = 0.0;
        for (size_t k = 0; k < m; ++k) {
            double range = hi[k] - lo[k];
            norm[k] = range > 0.0 ? (individuals_[i].objectives[k] - lo[k]) / range : 0.0;
            mean += norm[k];
        }
        mean /= static_cast<double>(m);

        double variance = 0.0;
        for (double v : norm) {
            variance += (v - mean) * (v - mean);
        }
        variance /= static_cast<double>(m);

        if (variance < best_variance) {
            best_variance = variance;
            best = i;
        }
    }
    return individuals_[best];
}

ParetoFrontier get_pareto_frontier(
    const std::vector<ParetoIndividual>& individuals,
    const std::vector<Objective>& objectives
) {
    std::vector<ParetoIndividual> usable;
    for (const auto& ind : individuals) {
        if (!ind.objectives.empty() && !all_failed(ind.objectives)) {
            usable.push_back(ind);
        }
    }
    if (usable.empty()) {
        return ParetoFrontier({}, objectives);
    }

    std::vector<ObjectiveVector> values;
    for (const auto& ind : usable) {
        values.push_back(ind.objectives);
    }
    auto fronts = non_dominated_sort(values);
    const auto& first = fronts.front();
    auto distance = crowding_distance(values, first);

    std::vector<ParetoIndividual> members;
    for (size_t k = 0; k < first.size(); ++k) {
        ParetoIndividual member = usable[first[k]];
        member.rank = 0;
        member.crowding_distance = distance[k];
        members.push_back(std::move(member));
    }
    return ParetoFrontier(std::move(members), objectives);
}

MultiObjectiveOptimizer::MultiObjectiveOptimizer(
    const Problem& problem,
    Evaluator& evaluator,
    std::vector<Objective> objectives,
    Config config
) : Optimizer(problem, evaluator, "MultiObjectiveOptimizer"),
    objectives_(std::move(objectives)),
    config_(config)
{
    if (objectives_.empty()) {
        throw std::invalid_argument("MultiObjectiveOptimizer needs at least one objective");
    }
    if (config_.population_size < 2) {
        throw std::invalid_argument("population_size must be at least 2");
    }
    verbose_ = config_.verbose;
}

void MultiObjectiveOptimizer::evaluate(std::vector<ParetoIndividual>& individuals, const Metrics& baseline, uint64_t step) {
    std::vector<size_t> pending;
    std::vector<Allocation> candidates;
    for (size_t i = 0; i < individuals.size(); ++i) {
        if (!individuals[i].individual.evaluated()) {
            pending.push_back(i);
            candidates.push_back(individuals[i].individual.allocation());
        }
    }
    if (pending.empty()) {
        return;
    }

    auto results = evaluate_candidates(candidates, config_.timeout, step);

    for (size_t k = 0; k < pending.size(); ++k) {
        ParetoIndividual& pi = individuals[pending[k]];
        Individual& ind = pi.individual;
        if (!(candidates[k] == ind.allocation())) {
            ind.set_allocation(candidates[k]);
        }
        ind.set_evaluation(results[k].status, results[k].metrics,
                           problem_.fitness(candidates[k], results[k], baseline));
        pi.objectives = problem_.objective_vector(candidates[k], results[k], baseline, objectives_);
        ind.set_objectives(pi.objectives);
    }
}

std::vector<ParetoIndividual> MultiObjectiveOptimizer::select_survivors(std::vector<ParetoIndividual> combined, size_t mu) const {
    std::vector<ObjectiveVector> values;
    values.reserve(combined.size());
    for (const auto& ind : combined) {
        values.push_back(ind.objectives);
    }

    std::vector<ParetoIndividual> survivors;
    survivors.reserve(mu);
    auto fronts = non_dominated_sort(values);

    for (size_t r = 0; r < fronts.size() && survivors.size() < mu; ++r) {
        const auto& front = fronts[r];
        auto distance = crowding_distance(values, front);

        std::vector<size_t> order(front.size());
        std::iota(order.begin(), order.end(), 0);
        if (survivors.size() + front.size() > mu) {
            std::stable_sort(order.begin(), order.end(),
                [&](size_t a, size_t b) { return distance[a] > distance[b]; });
        }

        for (size_t k : order) {
            if (survivors.size() >= mu) break;
            ParetoIndividual& ind = combined[front[k]];
            ind.rank = static_cast<int>(r);
            ind.crowding_distance = distance[k];
            survivors.push_back(std::move(ind));
        }
    }
    return survivors;
}

std::vector<ParetoIndividual> MultiObjectiveOptimizer::make_offspring(
    const std::vector<ParetoIndividual>& parents,
    const GeneticOperators& ops,
    int generation,
    RNG& rng
) const {
    const int n = static_cast<int>(parents.size());
    auto binary_tournament = [&]() -> const ParetoIndividual& {
        const ParetoIndividual& a = parents[static_cast<size_t>(rng.randint(0, n - 1))];
        const ParetoIndividual& b = parents[static_cast<size_t>(rng.randint(0, n - 1))];
        return crowded_less(b, a) ? b : a;
    };

    std::vector<ParetoIndividual> offspring;
    offspring.reserve(static_cast<size_t>(config_.population_size));
    while (offspring.size() < static_cast<size_t>(config_.population_size)) {
        const ParetoIndividual& a = binary_tournament();
        const ParetoIndividual& b = binary_tournament();
        const ParetoIndividual& fitter = crowded_less(b, a) ? b : a;
        const ParetoIndividual& other = &fitter == &a ? b : a;

        Allocation child = rng.bernoulli(config_.crossover_rate)
            ? ops.crossover(fitter.individual.allocation(), other.individual.allocation(), rng)
            : fitter.individual.allocation();
        if (rng.bernoulli(config_.mutation_rate)) {
            ops.mutate(child, rng);
        }

        ParetoIndividual pi;
        pi.individual = Individual(std::move(child), generation);
        pi.individual.set_parents({a.individual.id(), b.individual.id()});
        offspring.push_back(std::move(pi));
    }
    return offspring;
}

MultiObjectiveResult MultiObjectiveOptimizer::optimize(const Allocation& seed) {
    problem_.validate_seed(seed);
    evaluations_ = 0;
    failed_evaluations_ = 0;
    consecutive_failed_steps_ = 0;
    next_id_ = 1;

    GeneticOperators ops(problem_, problem_.constraints().protected_nodes(seed), {
        config_.inherit_probability,
        config_.min_allocation_size,
        config_.max_reattach_cost
    });

    GlobalState state(config_.seed);
    MultiObjectiveResult result;
    std::vector<ParetoIndividual> parents;
    const size_t mu = static_cast<size_t>(config_.population_size);

    auto assign_ids = [this](std::vector<ParetoIndividual>& individuals) {
        for (auto& pi : individuals) {
            if (pi.individual.id() == 0) {
                pi.individual.set_id(next_id_++);
            }
        }
    };
    auto front_size = [](const std::vector<ParetoIndividual>& population) {
        return static_cast<size_t>(std::count_if(population.begin(), population.end(),
            [](const ParetoIndividual& pi) { return pi.rank == 0; }));
    };

    try {
        EvaluationResult base = evaluator_.evaluate(seed, config_.timeout);
        ++evaluations_;
        if (!base.success()) {
            ++failed_evaluations_;
            result.status = RunStatus::Aborted;
            result.message = "Seed evaluation failed: " + base.error;
            std::cerr << "[MultiObjectiveOptimizer] ERROR: " << result.message << "\n";
            result.evaluations = evaluations_;
            result.failed_evaluations = failed_evaluations_;
            return result;
        }
        const Metrics baseline = base.metrics;

        ParetoIndividual first;
        first.individual = Individual(seed);
        first.individual.set_evaluation(EvalStatus::Ok, baseline, problem_.fitness(seed, base, baseline));
        first.objectives = problem_.objective_vector(seed, base, baseline, objectives_);
        first.individual.set_objectives(first.objectives);
        parents.push_back(std::move(first));
        while (parents.size() < mu) {
            ParetoIndividual pi;
            pi.individual = Individual(ops.random_variation(seed, config_.initial_changes, state.rng()));
            parents.push_back(std::move(pi));
        }
        assign_ids(parents);

        evaluate(parents, baseline, 0);
        parents = select_survivors(std::move(parents), mu);
        result.frontier_size_history.push_back(front_size(parents));
        state.next();

        while (state.iteration() < static_cast<uint64_t>(std::max(1, config_.generations))) {
            const int generation = static_cast<int>(state.iteration());
            auto offspring = make_offspring(parents, ops, generation, state.rng());
            assign_ids(offspring);
            evaluate(offspring, baseline, state.iteration());

            std::vector<ParetoIndividual> combined = std::move(parents);
            combined.insert(combined.end(),
                            std::make_move_iterator(offspring.begin()),
                            std::make_move_iterator(offspring.end()));
            parents = select_survivors(std::move(combined), mu);
            state.next();

            result.frontier_size_history.push_back(front_size(parents));

            if (verbose_) {
                std::cout << "[MultiObjectiveOptimizer] gen=" << generation
                          << " front0=" << result.frontier_size_history.back()
                          << " evaluations=" << evaluations_
                          << " failed=" << failed_evaluations_ << "\n";
            }
        }
        result.status = RunStatus::Completed;
        result.message = "Generation limit reached";
    } catch (const EvaluatorUnavailable& e) {
        result.status = RunStatus::Aborted;
        result.message = e.what();
        std::cerr << "[MultiObjectiveOptimizer] ERROR: aborted at gen=" << state.iteration()
                  << ": " << e.what() << "\n";
    }

    result.frontier = get_pareto_frontier(parents, objectives_);
    result.generations = static_cast<int>(state.iteration());
    result.evaluations = evaluations_;
    result.failed_evaluations = failed_evaluations_;

    if (verbose_) {
        std::cout << "[MultiObjectiveOptimizer] status=" << run_status_name(result.status)
                  << " generations=" << result.generations
                  << " frontier=" << result.frontier.size()
                  << " evaluations=" << result.evaluations << "\n";
    }
    return result;
}

}  // namespace graph_alloc
