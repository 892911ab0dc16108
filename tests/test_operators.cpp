#include <catch2/catch_test_macros.hpp>
#include "fixtures.hpp"

using namespace graph_alloc;
using graph_alloc::testing::make_small_graph;

TEST_CASE("GeneticOperators connectivity repair", "[operators]") {
    TreeGraph graph = make_small_graph();
    ConstraintSet constraints(graph, 0);
    Problem problem(graph, constraints, Objective::Dps);

    SECTION("Cheap orphan branches are reattached") {
        GeneticOperators ops(problem, {}, {0.5, 1, 4});
        auto repaired = ops.repair_connectivity(Allocation(NodeSet{0, 1, 3}));
        REQUIRE(repaired);
        REQUIRE(repaired->nodes == NodeSet{0, 1, 2, 3});
    }

    SECTION("Expensive orphan branches are dropped") {
        GeneticOperators ops(problem, {}, {0.5, 1, 0});
        auto repaired = ops.repair_connectivity(Allocation(NodeSet{0, 1, 3}));
        REQUIRE(repaired);
        REQUIRE(repaired->nodes == NodeSet{0, 1});
    }

    SECTION("Orphaned masteries lose their selection when dropped") {
        GeneticOperators ops(problem, {}, {0.5, 1, 0});
        auto repaired = ops.repair_connectivity(Allocation(NodeSet{0, 5, 6}, {{5, 2}}));
        REQUIRE(repaired);
        REQUIRE(repaired->nodes == NodeSet{0});
        REQUIRE(repaired->selections.empty());
    }

    SECTION("Protected branches are always reattached, around unallocated protected nodes") {
        GeneticOperators ops(problem, NodeSet{2, 3}, {0.5, 1, 0});
        auto repaired = ops.repair_connectivity(Allocation(NodeSet{0, 1, 3}));
        REQUIRE(repaired);
        REQUIRE(repaired->nodes == NodeSet{0, 1, 3, 7, 8, 9});
    }

    SECTION("Unreachable protected branches fail the repair") {
        GeneticOperators ops(problem, NodeSet{2, 3, 9}, {0.5, 1, 4});
        REQUIRE_FALSE(ops.repair_connectivity(Allocation(NodeSet{0, 1, 3})));
    }

    SECTION("Missing root fails the repair") {
        GeneticOperators ops(problem, {}, {0.5, 1, 4});
        REQUIRE_FALSE(ops.repair_connectivity(Allocation(NodeSet{1, 2})));
    }
}

TEST_CASE("GeneticOperators crossover", "[operators]") {
    TreeGraph graph = make_small_graph();
    ConstraintSet constraints(graph, 0);
    Problem problem(graph, constraints, Objective::Dps);
    RNG rng(42);

    const Allocation left(NodeSet{0, 1, 2, 3, 4, 5}, {{5, 3}});
    const Allocation right(NodeSet{0, 4, 5, 7, 8}, {{5, 2}});

    SECTION("Identical parents give the same child") {
        GeneticOperators ops(problem, {}, {0.5, 1, 4});
        REQUIRE(ops.crossover(left, left, rng) == left);
    }

    SECTION("inherit_probability 0 keeps only the shared nodes") {
        GeneticOperators ops(problem, {}, {0.0, 1, 4});
        Allocation child = ops.crossover(left, right, rng);
        REQUIRE(child.nodes == NodeSet{0, 4, 5});
        REQUIRE(child.selections.at(5) == 3);
    }

    SECTION("inherit_probability 1 keeps the union") {
        GeneticOperators ops(problem, {}, {1.0, 1, 4});
        Allocation child = ops.crossover(right, left, rng);
        REQUIRE(child.nodes == NodeSet{0, 1, 2, 3, 4, 5, 7, 8});
        REQUIRE(child.selections.at(5) == 2);
    }

    SECTION("Out of range inherit_probability is refused") {
        REQUIRE_THROWS_AS(GeneticOperators(problem, {}, {1.5, 1, 4}), std::invalid_argument);
    }
}

TEST_CASE("GeneticOperators mutation", "[operators]") {
    TreeGraph graph = make_small_graph();
    ConstraintSet constraints(graph, 0);
    Problem problem(graph, constraints, Objective::Dps);
    RNG rng(7);

    SECTION("Reselect picks a different effect") {
        GeneticOperators ops(problem, {}, {0.5, 1, 4});
        for (int i = 0; i < 20; ++i) {
            Allocation a(NodeSet{0, 4, 5}, {{5, 1}});
            REQUIRE(ops.reselect_random_effect(a, rng));
            REQUIRE(a.selections.at(5) != 1);
            REQUIRE(a.nodes == NodeSet{0, 4, 5});
        }
    }

    SECTION("Protected masteries keep their effect") {
        GeneticOperators ops(problem, NodeSet{5}, {0.5, 1, 4});
        Allocation a(NodeSet{0, 4, 5}, {{5, 1}});
        REQUIRE_FALSE(ops.reselect_random_effect(a, rng));
    }

    SECTION("Removal respects min_allocation_size") {
        GeneticOperators ops(problem, {}, {0.5, 2, 4});
        Allocation a(NodeSet{0, 1});
        REQUIRE_FALSE(ops.remove_random_node(a, rng));
        REQUIRE(a.size() == 2);
    }

    SECTION("Hard budgets stop additions at the maximum") {
        PointBudget budget;
        budget.max_points = 3;
        constraints.set_point_budget(budget);
        constraints.set_policy(ConstraintPolicy::HardReject);
        GeneticOperators ops(problem, {}, {0.5, 1, 4});

        Allocation a(NodeSet{0, 1, 2});
        REQUIRE(ops.addable_nodes(a).empty());
        for (int i = 0; i < 50; ++i) {
            Allocation b = a;
            ops.mutate(b, rng);
            REQUIRE(b.size() <= 3);
        }
    }

    SECTION("Nothing applicable returns nullopt") {
        GeneticOperators ops(problem, NodeSet{1, 4, 7}, {0.5, 1, 4});
        Allocation a(NodeSet{0});
        REQUIRE_FALSE(ops.mutate(a, rng));
        REQUIRE(a.nodes == NodeSet{0});
    }
}

TEST_CASE("GeneticOperators preserve connectivity and protection", "[operators]") {
    TreeGraph graph = TreeGraph::init_random(200, 20, 11);
    RNG setup(3);
    NodeSet seed_nodes = graph.grow_connected(0, 40, setup);

    // Three allocated and two unallocated nodes belong to protected subgraphs
    std::vector<NodeId> inside(seed_nodes.begin(), seed_nodes.end());
    graph.add_subgraph(1, {inside[5], inside[17], inside[31]});
    auto frontier = graph.unallocated_neighbors(seed_nodes);
    graph.add_subgraph(2, {frontier[0], frontier[1]});

    ConstraintSet constraints(graph, 0);
    constraints.add_protected_subgraph(2);
    Problem problem(graph, constraints, Objective::Dps);

    Allocation seed;
    for (NodeId id : seed_nodes) {
        seed.add(id, graph);
    }
    const NodeSet protected_nodes = constraints.protected_nodes(seed);
    REQUIRE(protected_nodes.size() == 5);

    GeneticOperators ops(problem, protected_nodes, {0.5, 1, 4});
    RNG rng(2024);

    auto check = [&](const Allocation& a) {
        REQUIRE(graph.is_connected(a.nodes, 0));
        for (NodeId id : protected_nodes) {
            REQUIRE(a.contains(id) == seed.contains(id));
        }
        for (const auto& [node, effect] : a.selections) {
            REQUIRE(a.contains(node));
        }
    };

    SECTION("Random variations") {
        for (int i = 0; i < 200; ++i) {
            check(ops.random_variation(seed, 8, rng));
        }
    }

    SECTION("Crossover of mutated parents") {
        for (int i = 0; i < 200; ++i) {
            Allocation a = ops.random_variation(seed, 10, rng);
            Allocation b = ops.random_variation(seed, 10, rng);
            Allocation child = ops.crossover(a, b, rng);
            check(child);
            ops.mutate(child, rng);
            check(child);
        }
    }
}

TEST_CASE("GeneticOperators crossover under a hard budget", "[operators]") {
    TreeGraph graph = TreeGraph::init_random(200, 20, 11);
    RNG setup(6);
    Allocation seed;
    for (NodeId id : graph.grow_connected(0, 30, setup)) {
        seed.add(id, graph);
    }

    ConstraintSet constraints(graph, 0);
    PointBudget budget;
    budget.max_points = 30;
    constraints.set_point_budget(budget);
    constraints.set_policy(ConstraintPolicy::HardReject);
    Problem problem(graph, constraints, Objective::Dps);

    GeneticOperators ops(problem, {}, {1.0, 1, 4});
    RNG rng(77);

    int oversized_unions = 0;
    for (int i = 0; i < 200; ++i) {
        Allocation a = ops.random_variation(seed, 6, rng);
        Allocation b = ops.random_variation(seed, 6, rng);
        REQUIRE(a.size() <= 30);
        REQUIRE(b.size() <= 30);

        NodeSet both = a.nodes;
        both.insert(b.nodes.begin(), b.nodes.end());
        if (both.size() > 30) {
            ++oversized_unions;
        }

        Allocation child = ops.crossover(a, b, rng);
        REQUIRE(child.size() <= 30);
        REQUIRE(graph.is_connected(child.nodes, 0));
        REQUIRE(constraints.validate(child).ok);
    }
    REQUIRE(oversized_unions > 0);

    SECTION("Soft budgets leave the union alone") {
        constraints.set_policy(ConstraintPolicy::SoftPenalize);
        const Allocation a = ops.random_variation(seed, 6, rng);
        Allocation b = seed;
        for (int k = 0; k < 4; ++k) {
            REQUIRE(ops.add_random_neighbor(b, rng));
        }
        REQUIRE(b.size() == 34);
        Allocation child = ops.crossover(a, b, rng);
        REQUIRE(child.size() >= 34);
    }
}
