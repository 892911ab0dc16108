#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "fixtures.hpp"

#include <cmath>
#include <limits>

using namespace graph_alloc;
using graph_alloc::testing::make_weight_evaluator;
using Catch::Approx;

namespace {

ParetoIndividual candidate(NodeId marker, ObjectiveVector objectives) {
    ParetoIndividual pi;
    pi.individual = Individual(Allocation(NodeSet{0, marker}));
    pi.objectives = std::move(objectives);
    return pi;
}

NodeId marker(const ParetoIndividual& pi) {
    return *pi.individual.allocation().nodes.rbegin();
}

}  // namespace

TEST_CASE("Pareto dominance", "[multi_objective]") {
    REQUIRE(dominates({5, 3, 4}, {4, 2, 3}));
    REQUIRE(dominates({5, 3, 4}, {5, 3, 3}));
    REQUIRE_FALSE(dominates({5, 3, 4}, {5, 3, 4}));
    REQUIRE_FALSE(dominates({10, 2, 3}, {3, 9, 8}));
    REQUIRE_FALSE(dominates({3, 9, 8}, {10, 2, 3}));
    REQUIRE_THROWS_AS(dominates({1, 2}, {1, 2, 3}), std::invalid_argument);
}

TEST_CASE("Non-dominated sorting", "[multi_objective]") {
    std::vector<ObjectiveVector> values{
        {10, 2, 3},
        {3, 9, 8},
        {5, 5, 5},
        {4, 4, 4},
        {1, 1, 10},
        {3, 3, 3},
    };
    auto fronts = non_dominated_sort(values);
    REQUIRE(fronts.size() == 3);
    REQUIRE(fronts[0] == std::vector<size_t>{0, 1, 2, 4});
    REQUIRE(fronts[1] == std::vector<size_t>{3});
    REQUIRE(fronts[2] == std::vector<size_t>{5});

    REQUIRE(non_dominated_sort({}).empty());
}

TEST_CASE("Crowding distance", "[multi_objective]") {
    const double inf = std::numeric_limits<double>::infinity();

    SECTION("Small fronts are all boundary") {
        std::vector<ObjectiveVector> values{{1, 2}, {2, 1}};
        auto d = crowding_distance(values, {0, 1});
        REQUIRE(d == std::vector<double>{inf, inf});
    }

    SECTION("Interior members sum normalized neighbour gaps") {
        std::vector<ObjectiveVector> values{{0, 4}, {1, 3}, {3, 1}, {4, 0}};
        auto d = crowding_distance(values, {0, 1, 2, 3});
        REQUIRE(std::isinf(d[0]));
        REQUIRE(std::isinf(d[3]));
        REQUIRE(d[1] == Approx(1.5));
        REQUIRE(d[2] == Approx(1.5));
    }

    SECTION("Flat objectives add nothing") {
        std::vector<ObjectiveVector> values{{0, 7}, {2, 7}, {4, 7}};
        auto d = crowding_distance(values, {0, 1, 2});
        REQUIRE(d[1] == Approx(1.0));
    }

    SECTION("Crowded comparison") {
        ParetoIndividual a = candidate(1, {1, 1});
        ParetoIndividual b = candidate(2, {1, 1});
        a.rank = 0;
        b.rank = 1;
        b.crowding_distance = inf;
        REQUIRE(crowded_less(a, b));
        b.rank = 0;
        REQUIRE(crowded_less(b, a));
    }
}

TEST_CASE("Pareto frontier", "[multi_objective]") {
    const std::vector<Objective> objectives{Objective::Dps, Objective::Life, Objective::Ehp};
    std::vector<ParetoIndividual> individuals{
        candidate(1, {10, 2, 3}),
        candidate(2, {3, 9, 8}),
        candidate(3, {5, 5, 5}),
        candidate(4, {4, 4, 4}),
        candidate(5, {1, 1, 10}),
        candidate(6, {FAILED_FITNESS, FAILED_FITNESS, FAILED_FITNESS}),
        candidate(7, {}),
    };

    ParetoFrontier frontier = get_pareto_frontier(individuals, objectives);
    REQUIRE(frontier.size() == 4);
    REQUIRE(frontier.objectives() == objectives);
    for (const auto& a : frontier.individuals()) {
        REQUIRE(a.rank == 0);
        for (const auto& b : frontier.individuals()) {
            REQUIRE_FALSE(dominates(a.objectives, b.objectives));
        }
    }

    SECTION("Extreme points follow objective order") {
        auto extremes = frontier.extreme_points();
        REQUIRE(extremes.size() == 3);
        REQUIRE(marker(extremes[0]) == 1);
        REQUIRE(marker(extremes[1]) == 2);
        REQUIRE(marker(extremes[2]) == 5);
    }

    SECTION("Balanced pick has the flattest normalized profile") {
        auto balanced = frontier.balanced();
        REQUIRE(balanced);
        REQUIRE(marker(*balanced) == 3);
    }

    SECTION("Empty input") {
        ParetoFrontier empty = get_pareto_frontier({}, objectives);
        REQUIRE(empty.empty());
        REQUIRE(empty.extreme_points().empty());
        REQUIRE_FALSE(empty.balanced());
    }
}

TEST_CASE("MultiObjectiveOptimizer run", "[multi_objective]") {
    TreeGraph graph = TreeGraph::init_random(150, 15, 13);
    RNG rng(8);
    Allocation seed;
    for (NodeId id : graph.grow_connected(0, 25, rng)) {
        seed.add(id, graph);
    }

    ConstraintSet constraints(graph, 0);
    PointBudget budget;
    budget.max_points = 30;
    constraints.set_point_budget(budget);
    constraints.set_policy(ConstraintPolicy::HardReject);
    Problem problem(graph, constraints, Objective::Dps);
    FunctionEvaluator evaluator = make_weight_evaluator(graph);

    MultiObjectiveOptimizer::Config config;
    config.population_size = 12;
    config.generations = 8;
    MultiObjectiveOptimizer moo(problem, evaluator, {Objective::Dps, Objective::Ehp}, config);

    MultiObjectiveResult result = moo.optimize(seed);

    REQUIRE(result.status == RunStatus::Completed);
    REQUIRE(result.generations == 8);
    REQUIRE(result.frontier_size_history.size() == 8);
    REQUIRE_FALSE(result.frontier.empty());
    REQUIRE(result.frontier.size() <= 12);

    for (const auto& a : result.frontier.individuals()) {
        REQUIRE(a.objectives.size() == 2);
        REQUIRE(a.individual.allocation().size() <= 30);
        REQUIRE(graph.is_connected(a.individual.allocation().nodes, 0));
        for (const auto& b : result.frontier.individuals()) {
            REQUIRE_FALSE(dominates(a.objectives, b.objectives));
        }
    }

    SECTION("Bad configuration") {
        REQUIRE_THROWS_AS(MultiObjectiveOptimizer(problem, evaluator, {}, config), std::invalid_argument);
        config.population_size = 1;
        REQUIRE_THROWS_AS(
            MultiObjectiveOptimizer(problem, evaluator, {Objective::Dps}, config),
            std::invalid_argument);
    }

    SECTION("Invalid seeds are refused") {
        REQUIRE_THROWS_AS(moo.optimize(Allocation(NodeSet{5})), InvalidSeed);
    }
}
