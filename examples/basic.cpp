#include <iostream>
#include <iomanip>
#include <memory>
#include "graph_alloc/graph_alloc.hpp"

using namespace graph_alloc;

// Usage: graph_alloc_basic [worker command...]
// Without a command the metrics come from an in-process function.
int main(int argc, char** argv) {
    std::cout << "Graph Allocation Optimization Example\n";
    std::cout << "=====================================\n\n";

    // Create problem
    const uint64_t seed = 42;
    TreeGraph graph = TreeGraph::init_random(400, 40, seed);

    ConstraintSet constraints(graph, 0);
    constraints.set_point_budget(PointBudget::from_level(70));
    Problem problem(graph, constraints, Objective::Dps);

    RNG rng(seed);
    Allocation initial;
    for (NodeId id : graph.grow_connected(0, 60, rng)) {
        initial.add(id, graph);
    }

    std::cout << "Created graph with " << graph.node_count() << " nodes and "
              << graph.edge_count() << " edges\n";
    std::cout << "Initial allocation:\n";
    std::cout << "  Nodes: " << initial.size() << "\n";
    std::cout << "  Masteries: " << initial.selections.size() << "\n";
    std::cout << "  Budget: " << *constraints.point_budget().max_points << "\n\n";

    // Create evaluator
    std::unique_ptr<WorkerPool> pool;
    std::unique_ptr<FunctionEvaluator> function;
    Evaluator* evaluator = nullptr;

    if (argc > 1) {
        WorkerPool::Config config;
        config.num_workers = 4;
        config.command.assign(argv + 1, argv + argc);
        config.verbose = true;
        try {
            pool = std::make_unique<WorkerPool>(config);
        } catch (const EvaluatorUnavailable& e) {
            std::cerr << "ERROR: " << e.what() << "\n";
            return 1;
        }
        evaluator = pool.get();
    } else {
        function = std::make_unique<FunctionEvaluator>([&graph](const Allocation& allocation) {
            Metrics m;
            double dps = 0.0;
            for (NodeId id : allocation.nodes) {
                dps += graph.metadata(id).tag("weight");
            }
            for (const auto& [node, effect] : allocation.selections) {
                dps += 0.5 * effect;
            }
            m.dps = dps;
            m.life = 12.0 * static_cast<double>(allocation.size());
            return EvaluationResult::ok(m);
        });
        evaluator = function.get();
    }
    CachingEvaluator cache(*evaluator);

    std::cout << std::fixed << std::setprecision(3);

    // Greedy hill climbing
    GreedyOptimizer::Config greedy_config;
    greedy_config.max_iterations = 30;
    greedy_config.max_candidates = 15;
    GreedyOptimizer greedy(problem, cache, greedy_config);

    std::cout << "Running greedy...\n";
    GreedyResult greedy_result = greedy.optimize(initial);
    std::cout << "  Status: " << run_status_name(greedy_result.status) << "\n";
    std::cout << "  Iterations: " << greedy_result.iterations << "\n";
    std::cout << "  Improvement: " << greedy_result.improvement() << "%\n";
    std::cout << "  Modifications: " << greedy_result.modifications.size() << "\n";
    std::cout << "  Evaluations: " << greedy_result.evaluations << "\n\n";

    // Genetic algorithm, seeded from the greedy result
    GeneticOptimizer::Config ga_config;
    ga_config.population_size = 24;
    ga_config.generations = 30;
    ga_config.seed = seed;
    GeneticOptimizer ga(problem, cache, ga_config);

    std::cout << "Running genetic algorithm...\n";
    GeneticResult ga_result = ga.optimize(greedy_result.allocation);
    std::cout << "  Status: " << run_status_name(ga_result.status) << "\n";
    std::cout << "  Generations: " << ga_result.generations << "\n";
    std::cout << "  Improvement: " << ga_result.improvement() << "%\n";
    std::cout << "  Evaluations: " << ga_result.evaluations
              << " (" << ga_result.failed_evaluations << " failed)\n";

    std::cout << "\nBest fitness per generation:\n";
    for (size_t i = 0; i < ga_result.best_fitness_history.size(); i += 5) {
        std::cout << "  Gen " << std::setw(3) << i
                  << " | Best: " << ga_result.best_fitness_history[i]
                  << " | Avg: " << ga_result.avg_fitness_history[i] << "\n";
    }

    AllocationDiff d = diff(initial, ga_result.best.allocation());
    std::cout << "\nChanges from the initial allocation:\n";
    std::cout << "  Added: " << d.added.size() << "\n";
    std::cout << "  Removed: " << d.removed.size() << "\n";
    std::cout << "  Reselected: " << d.reselected.size() << "\n";
    std::cout << "  Cache hits: " << cache.hits() << " / " << (cache.hits() + cache.misses()) << "\n";

    return 0;
}
