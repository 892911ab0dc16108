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
PointBudget max_budget(int max_points) {
    PointBudget budget;
    budget.max_points = max_points;
    return budget;
}
}  // namespace

TEST_CASE("GreedyOptimizer on the small graph", "[greedy]") {
    TreeGraph graph = make_small_graph();
    ConstraintSet constraints(graph, 0);
    FunctionEvaluator evaluator = make_weight_evaluator(graph);

    SECTION("Climbs to the heaviest allocation the budget allows") {
        constraints.set_point_budget(max_budget(7));
        Problem problem(graph, constraints, Objective::Dps);
        GreedyOptimizer greedy(problem, evaluator);

        GreedyResult result = greedy.optimize(Allocation(NodeSet{0}));

        REQUIRE(result.status == RunStatus::Converged);
        REQUIRE(result.allocation.nodes == NodeSet{0, 4, 5, 6, 7, 8, 9});
        REQUIRE(result.allocation.selections.at(5) == 3);
        REQUIRE(result.metrics.dps == 42.0);
        REQUIRE(result.seed_fitness == Approx(-100.0));
        REQUIRE(result.fitness == Approx(4100.0));

        std::vector<NodeId> added;
        for (const auto& m : result.modifications) {
            if (m.kind == Modification::Kind::Add) {
                added.push_back(m.node);
            }
        }
        REQUIRE(added == std::vector<NodeId>{7, 8, 9, 4, 5, 6});
        REQUIRE(result.modifications.back().kind == Modification::Kind::Select);
        REQUIRE(result.modifications.back().effect == 3);
        REQUIRE(result.fitness_history.size() == result.modifications.size() + 1);
        REQUIRE(std::is_sorted(result.fitness_history.begin(), result.fitness_history.end()));
    }

    SECTION("Sheds points over budget but never protected nodes") {
        graph.add_subgraph(1, {8});
        constraints.set_point_budget(max_budget(3));
        Problem problem(graph, constraints, Objective::Dps);
        GreedyOptimizer greedy(problem, evaluator);

        GreedyResult result = greedy.optimize(Allocation(NodeSet{0, 7, 8, 9}));

        REQUIRE(result.allocation.nodes == NodeSet{0, 7, 8});
        REQUIRE(result.modifications.size() == 1);
        REQUIRE(result.modifications[0].kind == Modification::Kind::Remove);
        REQUIRE(result.modifications[0].node == 9);
        REQUIRE(result.seed_fitness == Approx(-100.0));
        REQUIRE(result.fitness == Approx(-37.5));
        REQUIRE(result.improvement() > 0.0);
    }

    SECTION("Invalid seeds are refused before evaluation") {
        Problem problem(graph, constraints, Objective::Dps);
        GreedyOptimizer greedy(problem, evaluator);
        REQUIRE_THROWS_AS(greedy.optimize(Allocation(NodeSet{1, 2})), InvalidSeed);
        REQUIRE(evaluator.calls() == 0);
    }

    SECTION("A failed seed evaluation aborts the run") {
        Problem problem(graph, constraints, Objective::Dps);
        FunctionEvaluator broken([](const Allocation&) {
            return EvaluationResult::failure(EvalStatus::Rejected, "no build");
        });
        GreedyOptimizer greedy(problem, broken);

        GreedyResult result = greedy.optimize(Allocation(NodeSet{0, 1}));
        REQUIRE(result.status == RunStatus::Aborted);
        REQUIRE(result.allocation.nodes == NodeSet{0, 1});
        REQUIRE(result.evaluations == 1);
        REQUIRE(result.failed_evaluations == 1);
    }

    SECTION("Losing the evaluator keeps the best allocation found so far") {
        Problem problem(graph, constraints, Objective::Dps);
        LimitedEvaluator limited(evaluator, 5);
        GreedyOptimizer greedy(problem, limited);

        GreedyResult result = greedy.optimize(Allocation(NodeSet{0}));
        REQUIRE(result.status == RunStatus::Aborted);
        REQUIRE(result.message == "evaluator went away");
        REQUIRE(result.allocation.nodes == NodeSet{0, 7});
        REQUIRE(graph.is_connected(result.allocation.nodes, 0));
    }
}

TEST_CASE("GreedyOptimizer on a generated graph", "[greedy]") {
    TreeGraph graph = TreeGraph::init_random(200, 20, 7);
    RNG rng(5);
    Allocation seed;
    for (NodeId id : graph.grow_connected(0, 50, rng)) {
        seed.add(id, graph);
    }

    ConstraintSet constraints(graph, 0);
    constraints.set_point_budget(max_budget(60));
    Problem problem(graph, constraints, Objective::Dps);
    FunctionEvaluator evaluator = make_weight_evaluator(graph);

    GreedyOptimizer::Config config;
    config.max_iterations = 20;
    config.max_candidates = 10;
    GreedyOptimizer greedy(problem, evaluator, config);

    GreedyResult result = greedy.optimize(seed);

    REQUIRE(result.status != RunStatus::Aborted);
    REQUIRE(result.fitness >= result.seed_fitness);
    REQUIRE(result.allocation.size() <= 60);
    REQUIRE(result.allocation.contains(0));
    REQUIRE(graph.is_connected(result.allocation.nodes, 0));
    REQUIRE(result.iterations <= 20);
    REQUIRE(std::is_sorted(result.fitness_history.begin(), result.fitness_history.end()));
    REQUIRE(result.evaluations == evaluator.calls());

    for (const auto& [node, effect] : result.allocation.selections) {
        const auto& effects = graph.metadata(node).effects;
        REQUIRE(std::find(effects.begin(), effects.end(), effect) != effects.end());
    }
}
