#include "graph_alloc/optimizers/greedy.hpp"
#include "graph_alloc/core/errors.hpp"
#include <algorithm>
#include <iostream>

namespace graph_alloc {

const char* modification_kind_name(Modification::Kind kind) {
    switch (kind) {
        case Modification::Kind::Add: return "add";
        case Modification::Kind::Remove: return "remove";
        case Modification::Kind::Select: return "select";
    }
    return "unknown";
}

GreedyOptimizer::GreedyOptimizer(const Problem& problem, Evaluator& evaluator, Config config)
    : Optimizer(problem, evaluator, "GreedyOptimizer"), config_(config)
{
    verbose_ = config_.verbose;
}

std::vector<GreedyOptimizer::Move> GreedyOptimizer::generate_moves(const Allocation& current, RNG& rng) const {
    const TreeGraph& graph = problem_.graph();
    const ConstraintSet& constraints = problem_.constraints();
    const NodeId root = problem_.root();
    const size_t k = static_cast<size_t>(std::max(0, config_.max_candidates));

    std::vector<NodeId> removable;
    if (constraints.can_remove_point(current)) {
        for (NodeId id : current.nodes) {
            if (id != root && !protected_.count(id) && graph.is_removable(current.nodes, id, root)) {
                removable.push_back(id);
            }
        }
    }

    std::vector<NodeId> addable;
    if (constraints.can_add_point(current)) {
        for (NodeId id : graph.unallocated_neighbors(current.nodes)) {
            if (!protected_.count(id)) {
                addable.push_back(id);
            }
        }
    }

    if (removable.size() > k) {
        removable = rng.sample(removable, k);
        std::sort(removable.begin(), removable.end());
    }
    if (addable.size() > k) {
        addable = rng.sample(addable, k);
        std::sort(addable.begin(), addable.end());
    }

    std::vector<Move> moves;
    for (NodeId id : removable) {
        moves.push_back({Modification::Kind::Remove, id, 0});
    }
    for (NodeId id : addable) {
        moves.push_back({Modification::Kind::Add, id, 0});
    }
    return moves;
}

Allocation GreedyOptimizer::apply_move(const Allocation& current, const Move& move) const {
    Allocation next = current;
    switch (move.kind) {
        case Modification::Kind::Add:
            next.add(move.node, problem_.graph());
            break;
        case Modification::Kind::Remove:
            next.remove(move.node);
            break;
        case Modification::Kind::Select:
            next.select(move.node, move.effect);
            break;
    }
    return next;
}

std::optional<size_t> GreedyOptimizer::pick_best(
    const std::vector<Move>& moves,
    const std::vector<double>& fitness,
    double current_fitness
) const {
    const double threshold = std::max(0.0, config_.min_improvement);
    std::optional<size_t> best;

    for (size_t i = 0; i < moves.size(); ++i) {
        if (fitness[i] == FAILED_FITNESS || fitness[i] - current_fitness <= threshold) {
            continue;
        }
        if (!best) {
            best = i;
            continue;
        }

        const Move& a = moves[i];
        const Move& b = moves[*best];
        int delta_a = Modification{a.kind}.point_delta();
        int delta_b = Modification{b.kind}.point_delta();
        if (fitness[i] != fitness[*best]) {
            if (fitness[i] > fitness[*best]) best = i;
        } else if (delta_a != delta_b) {
            if (delta_a < delta_b) best = i;
        } else if (a.node != b.node) {
            if (a.node < b.node) best = i;
        } else if (a.effect < b.effect) {
            best = i;
        }
    }
    return best;
}

bool GreedyOptimizer::step(
    GreedyResult& result,
    std::vector<Move> moves,
    const Metrics& baseline,
    uint64_t iteration
) {
    std::vector<Allocation> candidates;
    candidates.reserve(moves.size());
    for (const auto& move : moves) {
        candidates.push_back(apply_move(result.allocation, move));
    }

    auto results = evaluate_candidates(candidates, config_.timeout, iteration);

    std::vector<double> fitness(candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i) {
        fitness[i] = problem_.fitness(candidates[i], results[i], baseline);
    }

    auto best = pick_best(moves, fitness, result.fitness);
    if (!best) {
        return false;
    }

    const Move& move = moves[*best];
    result.allocation = std::move(candidates[*best]);
    result.fitness = fitness[*best];
    result.metrics = results[*best].metrics;
    result.modifications.push_back({move.kind, move.node, move.effect, iteration, result.fitness});
    result.fitness_history.push_back(result.fitness);

    if (verbose_) {
        std::cout << "[GreedyOptimizer] iter=" << iteration
                  << " move=" << modification_kind_name(move.kind) << ":" << move.node
                  << " fitness=" << result.fitness
                  << " nodes=" << result.allocation.size() << "\n";
    }
    return true;
}

void GreedyOptimizer::selection_pass(GreedyResult& result, const Metrics& baseline, uint64_t iteration) {
    const TreeGraph& graph = problem_.graph();

    std::vector<NodeId> masteries;
    for (const auto& [node, effect] : result.allocation.selections) {
        if (!protected_.count(node) && graph.metadata(node).effects.size() > 1) {
            masteries.push_back(node);
        }
    }

    int changed = 0;
    for (NodeId node : masteries) {
        EffectId current = result.allocation.selections.at(node);
        std::vector<Move> moves;
        for (EffectId effect : graph.metadata(node).effects) {
            if (effect != current) {
                moves.push_back({Modification::Kind::Select, node, effect});
            }
        }
        if (step(result, std::move(moves), baseline, iteration)) {
            ++changed;
        }
    }

    if (verbose_) {
        std::cout << "[GreedyOptimizer] selection pass masteries=" << masteries.size()
                  << " changed=" << changed << "\n";
    }
}

GreedyResult GreedyOptimizer::optimize(const Allocation& seed) {
    problem_.validate_seed(seed);
    protected_ = problem_.constraints().protected_nodes(seed);
    evaluations_ = 0;
    failed_evaluations_ = 0;
    consecutive_failed_steps_ = 0;

    GlobalState state(config_.seed);
    GreedyResult result;
    result.allocation = seed;

    try {
        EvaluationResult base = evaluator_.evaluate(seed, config_.timeout);
        ++evaluations_;
        if (!base.success()) {
            ++failed_evaluations_;
            result.status = RunStatus::Aborted;
            result.message = "Seed evaluation failed: " + base.error;
            std::cerr << "[GreedyOptimizer] ERROR: " << result.message << "\n";
            result.evaluations = evaluations_;
            result.failed_evaluations = failed_evaluations_;
            return result;
        }

        const Metrics baseline = base.metrics;
        result.metrics = baseline;
        result.seed_fitness = problem_.fitness(seed, base, baseline);
        result.fitness = result.seed_fitness;
        result.fitness_history.push_back(result.fitness);
        state.maybe_update_best(result.fitness, seed);

        bool converged = false;
        while (state.iteration() < static_cast<uint64_t>(std::max(0, config_.max_iterations))) {
            auto moves = generate_moves(result.allocation, state.rng());
            state.next();
            if (moves.empty() || !step(result, std::move(moves), baseline, state.iteration())) {
                converged = true;
                break;
            }
            state.maybe_update_best(result.fitness, result.allocation);
        }
        result.iterations = state.iteration();

        if (config_.optimize_selections) {
            selection_pass(result, baseline, result.iterations);
        }

        result.status = converged ? RunStatus::Converged : RunStatus::Completed;
        result.message = converged ? "No improving move" : "Iteration limit reached";
    } catch (const EvaluatorUnavailable& e) {
        result.iterations = state.iteration();
        result.status = RunStatus::Aborted;
        result.message = e.what();
        std::cerr << "[GreedyOptimizer] ERROR: aborted: " << e.what() << "\n";
    }

    result.evaluations = evaluations_;
    result.failed_evaluations = failed_evaluations_;

    if (verbose_) {
        std::cout << "[GreedyOptimizer] status=" << run_status_name(result.status)
                  << " iterations=" << result.iterations
                  << " fitness=" << result.fitness
                  << " improvement=" << result.improvement()
                  << " evaluations=" << result.evaluations << "\n";
    }
    return result;
}

}  // namespace graph_alloc
