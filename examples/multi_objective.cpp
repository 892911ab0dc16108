#include <algorithm>
#include <iostream>
#include <iomanip>
#include "graph_alloc/graph_alloc.hpp"

using namespace graph_alloc;

namespace {

void print_member(const char* label, const ParetoIndividual& member, const std::vector<Objective>& objectives) {
    std::cout << "  " << std::setw(10) << label << " |";
    for (size_t k = 0; k < objectives.size(); ++k) {
        std::cout << " " << objective_name(objectives[k]) << "=" << std::setw(8) << member.objectives[k];
    }
    std::cout << " | nodes=" << member.individual.allocation().size() << "\n";
}

}  // namespace

int main() {
    std::cout << "Multi-Objective Allocation Example\n";
    std::cout << "==================================\n\n";

    const uint64_t seed = 7;
    TreeGraph graph = TreeGraph::init_random(300, 30, seed);

    ConstraintSet constraints(graph, 0);
    constraints.set_point_budget(PointBudget::from_level(40, -10));
    constraints.set_policy(ConstraintPolicy::HardReject);
    Problem problem(graph, constraints, Objective::Balanced);

    RNG rng(seed);
    Allocation initial;
    for (NodeId id : graph.grow_connected(0, 55, rng)) {
        initial.add(id, graph);
    }

    // Damage and defence pull in different directions: weighted nodes raise dps,
    // keystones and notables raise ehp, everything raises life.
    FunctionEvaluator evaluator([&graph](const Allocation& allocation) {
        Metrics m;
        double dps = 0.0;
        double ehp = 0.0;
        for (NodeId id : allocation.nodes) {
            const NodeMeta& meta = graph.metadata(id);
            switch (meta.type) {
                case NodeType::Keystone: ehp += 40.0; dps -= 5.0; break;
                case NodeType::Notable: ehp += 15.0; break;
                default: dps += meta.tag("weight"); break;
            }
        }
        for (const auto& [node, effect] : allocation.selections) {
            dps += effect;
        }
        m.dps = std::max(dps, 1.0);
        m.life = 10.0 * static_cast<double>(allocation.size());
        m.ehp = 100.0 + ehp;
        return EvaluationResult::ok(m);
    });

    const std::vector<Objective> objectives{Objective::Dps, Objective::Life, Objective::Ehp};
    MultiObjectiveOptimizer::Config config;
    config.population_size = 40;
    config.generations = 40;
    config.seed = seed;
    config.verbose = false;
    MultiObjectiveOptimizer nsga(problem, evaluator, objectives, config);

    std::cout << "Running NSGA-II (" << config.population_size << " x "
              << config.generations << ")...\n";
    MultiObjectiveResult result = nsga.optimize(initial);

    std::cout << "  Status: " << run_status_name(result.status) << "\n";
    std::cout << "  Evaluations: " << result.evaluations << "\n";
    std::cout << "  Frontier size: " << result.frontier.size() << "\n\n";

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Frontier (% change from the initial allocation):\n";
    for (const auto& member : result.frontier.individuals()) {
        print_member("member", member, objectives);
    }

    std::cout << "\nExtreme points:\n";
    auto extremes = result.frontier.extreme_points();
    for (size_t k = 0; k < extremes.size(); ++k) {
        print_member(objective_name(objectives[k]), extremes[k], objectives);
    }

    if (auto balanced = result.frontier.balanced()) {
        std::cout << "\nBalanced pick:\n";
        print_member("balanced", *balanced, objectives);
    }

    return 0;
}
