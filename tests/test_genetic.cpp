#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "fixtures.hpp"

#include <algorithm>

using namespace graph_alloc;
using graph_alloc::testing::LimitedEvaluator;
using graph_alloc::testing::make_small_graph;
using graph_alloc::testing::make_weight_evaluator;
using Catch::Approx;

namespace {

Allocation grown_seed(const TreeGraph& graph, size_t size, uint64_t seed) {
    RNG rng(seed);
    Allocation allocation;
    for (NodeId id : graph.grow_connected(0, size, rng)) {
        allocation.add(id, graph);
    }
    return allocation;
}

GeneticOptimizer::Config small_config() {
    GeneticOptimizer::Config config;
    config.population_size = 16;
    config.generations = 15;
    config.elitism_count = 2;
    config.convergence_window = 0;
    return config;
}

}  // namespace

TEST_CASE("GeneticOptimizer run", "[genetic]") {
    TreeGraph graph = TreeGraph::init_random(200, 20, 7);
    ConstraintSet constraints(graph, 0);
    PointBudget budget;
    budget.max_points = 45;
    constraints.set_point_budget(budget);
    Problem problem(graph, constraints, Objective::Dps);
    FunctionEvaluator evaluator = make_weight_evaluator(graph);

    const Allocation seed = grown_seed(graph, 30, 5);
    GeneticOptimizer ga(problem, evaluator, small_config());
    GeneticResult result = ga.optimize(seed);

    SECTION("Runs every generation") {
        REQUIRE(result.status == RunStatus::Completed);
        REQUIRE(result.generations == 15);
        REQUIRE(result.best_fitness_history.size() == 15);
        REQUIRE(result.avg_fitness_history.size() == 15);
        REQUIRE(result.final_population.size() == 16);
    }

    SECTION("Elitism keeps the best fitness from going down") {
        REQUIRE(std::is_sorted(result.best_fitness_history.begin(), result.best_fitness_history.end()));
        REQUIRE(result.best_fitness >= result.seed_fitness);
        REQUIRE(result.best_fitness == result.best_fitness_history.back());
        REQUIRE(result.best.fitness() == result.best_fitness);
        for (size_t i = 0; i < result.avg_fitness_history.size(); ++i) {
            REQUIRE(result.avg_fitness_history[i] <= result.best_fitness_history[i]);
        }
    }

    SECTION("Every individual is a connected allocation") {
        for (const auto& ind : result.final_population) {
            REQUIRE(ind.evaluated());
            REQUIRE(ind.allocation().contains(0));
            REQUIRE(graph.is_connected(ind.allocation().nodes, 0));
        }
        REQUIRE(graph.is_connected(result.best.allocation().nodes, 0));
    }

    SECTION("Same seed, same result") {
        GeneticOptimizer again(problem, evaluator, small_config());
        GeneticResult replay = again.optimize(seed);
        REQUIRE(replay.best.allocation() == result.best.allocation());
        REQUIRE(replay.best_fitness_history == result.best_fitness_history);
    }
}

TEST_CASE("GeneticOptimizer under a hard budget", "[genetic]") {
    TreeGraph graph = TreeGraph::init_random(200, 20, 11);
    ConstraintSet constraints(graph, 0);
    PointBudget budget;
    budget.max_points = 30;
    constraints.set_point_budget(budget);
    constraints.set_policy(ConstraintPolicy::HardReject);
    Problem problem(graph, constraints, Objective::Dps);
    FunctionEvaluator evaluator = make_weight_evaluator(graph);

    GeneticOptimizer::Config config = small_config();
    config.generations = 10;
    config.inherit_probability = 0.9;
    config.crossover_rate = 1.0;
    GeneticOptimizer ga(problem, evaluator, config);
    GeneticResult result = ga.optimize(grown_seed(graph, 30, 6));

    REQUIRE(result.status == RunStatus::Completed);
    REQUIRE(result.failed_evaluations == 0);
    REQUIRE(result.final_population.size() == 16);
    for (const auto& ind : result.final_population) {
        REQUIRE(ind.allocation().size() <= 30);
        REQUIRE_FALSE(ind.failed());
        REQUIRE(graph.is_connected(ind.allocation().nodes, 0));
    }
    REQUIRE(result.best.allocation().size() <= 30);
}

TEST_CASE("GeneticOptimizer stopping", "[genetic]") {
    TreeGraph graph = make_small_graph();
    ConstraintSet constraints(graph, 0);
    Problem problem(graph, constraints, Objective::Dps);
    FunctionEvaluator evaluator = make_weight_evaluator(graph);

    SECTION("Converges when nothing beats the seed") {
        // Every node allocated with the strongest effect: only losses are possible
        Allocation full(NodeSet{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}, {{5, 3}});

        GeneticOptimizer::Config config;
        config.population_size = 8;
        config.generations = 50;
        config.elitism_count = 1;
        config.convergence_window = 3;
        GeneticOptimizer ga(problem, evaluator, config);

        GeneticResult result = ga.optimize(full);
        REQUIRE(result.status == RunStatus::Converged);
        REQUIRE(result.generations < 50);
        REQUIRE(result.best_fitness == Approx(0.0));
        REQUIRE(result.best.allocation() == full);
    }

    SECTION("Invalid seeds are refused before evaluation") {
        GeneticOptimizer ga(problem, evaluator, small_config());
        REQUIRE_THROWS_AS(ga.optimize(Allocation(NodeSet{0, 3})), InvalidSeed);
        REQUIRE(evaluator.calls() == 0);
    }

    SECTION("Losing the evaluator returns the best so far") {
        LimitedEvaluator limited(evaluator, 30);
        GeneticOptimizer::Config config = small_config();
        config.population_size = 8;
        GeneticOptimizer ga(problem, limited, config);

        GeneticResult result = ga.optimize(Allocation(NodeSet{0, 1, 2}));
        REQUIRE(result.status == RunStatus::Aborted);
        REQUIRE(result.best.evaluated());
        REQUIRE(result.best_fitness >= result.seed_fitness);
        REQUIRE(graph.is_connected(result.best.allocation().nodes, 0));
    }

    SECTION("Bad configuration") {
        GeneticOptimizer::Config config;
        config.population_size = 0;
        REQUIRE_THROWS_AS(GeneticOptimizer(problem, evaluator, config), std::invalid_argument);
        config.population_size = 10;
        config.tournament_size = 0;
        REQUIRE_THROWS_AS(GeneticOptimizer(problem, evaluator, config), std::invalid_argument);
    }
}
