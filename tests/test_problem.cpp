#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "fixtures.hpp"

#include <cmath>
#include <limits>

using namespace graph_alloc;
using graph_alloc::testing::make_small_graph;
using Catch::Approx;

namespace {
Metrics dps_life(double dps, double life) {
    Metrics m;
    m.dps = dps;
    m.life = life;
    return m;
}
}  // namespace

TEST_CASE("Objectives", "[problem]") {
    SECTION("relative_change") {
        REQUIRE(relative_change(110.0, 100.0) == Approx(10.0));
        REQUIRE(relative_change(90.0, 100.0) == Approx(-10.0));
        REQUIRE(relative_change(5.0, 0.0) == Approx(400.0));
    }

    SECTION("parse_objective") {
        REQUIRE(parse_objective("dps") == Objective::Dps);
        REQUIRE(parse_objective("energy_shield") == Objective::EnergyShield);
        REQUIRE(parse_objective("es") == Objective::EnergyShield);
        REQUIRE(parse_objective("balanced") == Objective::Balanced);
        REQUIRE_FALSE(parse_objective("crit"));
        REQUIRE(std::string(objective_name(Objective::ClearSpeed)) == "clear_speed");
    }
}

TEST_CASE("Metrics parsing", "[problem]") {
    std::string error;

    SECTION("Known and extra metrics") {
        auto metrics = Metrics::parse(nlohmann::json{{"dps", 1.5}, {"life", 200}, {"crit", 0.25}}, error);
        REQUIRE(metrics);
        REQUIRE(metrics->dps == 1.5);
        REQUIRE(metrics->life == 200.0);
        REQUIRE(metrics->extra.at("crit") == 0.25);
        REQUIRE(metrics->get("crit") == 0.25);
        REQUIRE_FALSE(metrics->get("mana"));
    }

    SECTION("Invalid payloads") {
        REQUIRE_FALSE(Metrics::parse(nlohmann::json::array({1, 2}), error));
        REQUIRE_FALSE(error.empty());

        error.clear();
        REQUIRE_FALSE(Metrics::parse(nlohmann::json{{"dps", "fast"}}, error));
        REQUIRE(error.find("dps") != std::string::npos);
    }

    SECTION("JSON round trip keeps the values") {
        Metrics m = dps_life(12.0, 34.0);
        m.set("crit", 0.5);
        auto back = Metrics::parse(m.to_json(), error);
        REQUIRE(back);
        REQUIRE(*back == m);
    }
}

TEST_CASE("Problem seed validation", "[problem]") {
    TreeGraph graph = make_small_graph();
    ConstraintSet constraints(graph, 0);
    Problem problem(graph, constraints, Objective::Dps);

    REQUIRE_NOTHROW(problem.validate_seed(Allocation(NodeSet{0, 1, 2})));

    REQUIRE_THROWS_AS(problem.validate_seed(Allocation{}), InvalidSeed);
    REQUIRE_THROWS_AS(problem.validate_seed(Allocation(NodeSet{1, 2})), InvalidSeed);
    REQUIRE_THROWS_AS(problem.validate_seed(Allocation(NodeSet{0, 2})), InvalidSeed);
    REQUIRE_THROWS_AS(problem.validate_seed(Allocation(NodeSet{0, 42})), InvalidSeed);
    REQUIRE_THROWS_AS(problem.validate_seed(Allocation(NodeSet{0, 1}, {{2, 1}})), InvalidSeed);
    REQUIRE_THROWS_AS(problem.validate_seed(Allocation(NodeSet{0, 4, 5}, {{5, 9}})), InvalidSeed);

    SECTION("Constraint violations only matter under HardReject") {
        PointBudget budget;
        budget.max_points = 2;
        constraints.set_point_budget(budget);
        REQUIRE_NOTHROW(problem.validate_seed(Allocation(NodeSet{0, 1, 2})));

        constraints.set_policy(ConstraintPolicy::HardReject);
        REQUIRE_THROWS_AS(problem.validate_seed(Allocation(NodeSet{0, 1, 2})), InvalidSeed);
    }

    SECTION("Constraints built for another graph are refused") {
        TreeGraph other = make_small_graph();
        ConstraintSet foreign(other, 0);
        REQUIRE_THROWS_AS(Problem(graph, foreign), std::invalid_argument);
    }
}

TEST_CASE("Problem fitness", "[problem]") {
    TreeGraph graph = make_small_graph();
    ConstraintSet constraints(graph, 0);
    const Metrics baseline = dps_life(100.0, 50.0);
    const Allocation small(NodeSet{0, 1, 2});

    SECTION("Single objective") {
        Problem problem(graph, constraints, Objective::Dps);
        auto result = EvaluationResult::ok(dps_life(120.0, 50.0));
        REQUIRE(problem.fitness(small, result, baseline) == Approx(20.0));
    }

    SECTION("Failed evaluations get the minimal fitness") {
        Problem problem(graph, constraints, Objective::Dps);
        auto result = EvaluationResult::failure(EvalStatus::Timeout, "late");
        REQUIRE(problem.fitness(small, result, baseline) == FAILED_FITNESS);
        REQUIRE(problem.fitness(small, result, baseline) == std::numeric_limits<double>::lowest());
    }

    SECTION("Balanced is the mean of dps, life and ehp changes") {
        Problem problem(graph, constraints, Objective::Balanced);
        Metrics base = dps_life(100.0, 50.0);
        base.ehp = 200.0;
        Metrics now = dps_life(130.0, 50.0);
        now.ehp = 200.0;
        REQUIRE(problem.fitness(small, EvaluationResult::ok(now), base) == Approx(10.0));
    }

    SECTION("Soft policy subtracts the constraint penalty") {
        PointBudget budget;
        budget.max_points = 2;
        constraints.set_point_budget(budget);
        Problem problem(graph, constraints, Objective::Dps);
        auto result = EvaluationResult::ok(dps_life(120.0, 50.0));
        REQUIRE(problem.constraint_penalty(small) == Approx(100.0));
        REQUIRE(problem.fitness(small, result, baseline) == Approx(-80.0));

        problem.set_constraint_penalty_type(ConstraintPenaltyType::Quadratic);
        REQUIRE(problem.constraint_penalty(Allocation(NodeSet{0, 1, 2, 3})) == Approx(400.0));
    }

    SECTION("Objective vector") {
        Problem problem(graph, constraints, Objective::Dps);
        auto values = problem.objective_vector(
            small, EvaluationResult::ok(dps_life(110.0, 75.0)), baseline,
            {Objective::Dps, Objective::Life});
        REQUIRE(values.size() == 2);
        REQUIRE(values[0] == Approx(10.0));
        REQUIRE(values[1] == Approx(50.0));
    }
}

TEST_CASE("Problem constraint policy", "[problem]") {
    TreeGraph graph = make_small_graph();
    ConstraintSet constraints(graph, 0);
    constraints.set_attribute_requirement(Attribute::Strength, 10.0f);
    Problem problem(graph, constraints, Objective::Dps);
    const Allocation weak(NodeSet{0, 4});

    SECTION("SoftPenalize evaluates as is") {
        auto prepared = problem.apply_policy(weak);
        REQUIRE(prepared);
        REQUIRE(*prepared == weak);
    }

    SECTION("HardReject refuses invalid candidates") {
        constraints.set_policy(ConstraintPolicy::HardReject);
        REQUIRE_FALSE(problem.apply_policy(weak));
        REQUIRE(problem.apply_policy(Allocation(NodeSet{0, 1})));
    }

    SECTION("Repair fixes what it can") {
        constraints.set_policy(ConstraintPolicy::Repair);
        auto prepared = problem.apply_policy(weak);
        REQUIRE(prepared);
        REQUIRE(prepared->nodes == NodeSet{0, 1, 4});
    }
}
