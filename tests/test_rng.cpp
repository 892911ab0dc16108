#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "graph_alloc/random/rng.hpp"
#include "graph_alloc/core/global_state.hpp"

#include <algorithm>
#include <set>

using namespace graph_alloc;
using Catch::Approx;

TEST_CASE("RNG", "[rng]") {
    SECTION("Reproducibility") {
        RNG rng1(42);
        RNG rng2(42);

        for (int i = 0; i < 100; ++i) {
            REQUIRE(rng1.next() == rng2.next());
        }
    }

    SECTION("Uniform distribution") {
        RNG rng(123);
        double sum = 0.0;
        int n = 10000;

        for (int i = 0; i < n; ++i) {
            double v = rng.uniform();
            REQUIRE(v >= 0.0);
            REQUIRE(v < 1.0);
            sum += v;
        }

        // Mean should be close to 0.5
        REQUIRE(sum / n == Approx(0.5).margin(0.05));
    }

    SECTION("randint bounds are inclusive") {
        RNG rng(7);
        std::set<int> seen;
        for (int i = 0; i < 1000; ++i) {
            int v = rng.randint(2, 5);
            REQUIRE(v >= 2);
            REQUIRE(v <= 5);
            seen.insert(v);
        }
        REQUIRE(seen.size() == 4);
    }

    SECTION("Permutation") {
        RNG rng(42);
        auto perm = rng.permutation(10);

        REQUIRE(perm.size() == 10);

        std::vector<bool> found(10, false);
        for (int i : perm) {
            REQUIRE(i >= 0);
            REQUIRE(i < 10);
            found[i] = true;
        }
        for (bool f : found) {
            REQUIRE(f);
        }
    }

    SECTION("Sample draws distinct elements") {
        RNG rng(3);
        std::vector<int> items{10, 20, 30, 40, 50, 60};
        auto picked = rng.sample(items, 4);
        REQUIRE(picked.size() == 4);
        REQUIRE(std::set<int>(picked.begin(), picked.end()).size() == 4);

        REQUIRE(rng.sample(items, 10).size() == items.size());
    }

    SECTION("Pick on empty vector throws") {
        RNG rng(1);
        std::vector<int> empty;
        REQUIRE_THROWS_AS(rng.pick(empty), std::out_of_range);
    }

    SECTION("Split streams are independent of later parent draws") {
        RNG parent(99);
        RNG child = parent.split();
        RNG replay(99);
        RNG child_replay = replay.split();
        for (int i = 0; i < 10; ++i) {
            REQUIRE(child.next() == child_replay.next());
        }
    }
}

TEST_CASE("GlobalState best tracking", "[rng]") {
    GlobalState state(42);
    state.set_tolerance(0.5);
    Allocation a(NodeSet{0, 1});
    Allocation b(NodeSet{0, 1, 2});

    REQUIRE(state.best_allocation() == nullptr);
    REQUIRE(state.maybe_update_best(10.0, a));
    REQUIRE(state.best_score() == 10.0);

    state.next();
    state.next();
    REQUIRE(state.iteration() == 2);
    REQUIRE(state.iters_since_improvement() == 2);

    SECTION("Gain below tolerance is recorded but does not reset the stall counter") {
        REQUIRE(state.maybe_update_best(10.2, b));
        REQUIRE(state.best_score() == 10.2);
        REQUIRE(*state.best_allocation() == b);
        REQUIRE(state.iters_since_improvement() == 2);
    }

    SECTION("Gain above tolerance resets the stall counter") {
        REQUIRE(state.maybe_update_best(11.0, b));
        REQUIRE(state.iters_since_improvement() == 0);
    }

    SECTION("Worse scores are ignored") {
        REQUIRE_FALSE(state.maybe_update_best(9.0, b));
        REQUIRE(*state.best_allocation() == a);
    }
}

TEST_CASE("GlobalState run RNG", "[rng]") {
    GlobalState state(42);
    RNG reference(42);
    for (int i = 0; i < 10; ++i) {
        REQUIRE(state.rng().next() == reference.next());
    }
    REQUIRE(state.iteration() == 0);
}
