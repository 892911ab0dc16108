#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include "graph_alloc/graph_alloc.hpp"

namespace py = pybind11;
using namespace graph_alloc;

namespace {
py::dict metrics_to_dict(const Metrics& metrics) {
    py::dict out;
    for (const char* name : {"dps", "life", "ehp", "mana", "energy_shield", "block", "clear_speed"}) {
        if (auto value = metrics.get(name)) {
            out[name] = *value;
        }
    }
    for (const auto& [name, value] : metrics.extra) {
        out[py::str(name)] = value;
    }
    return out;
}

Metrics metrics_from_dict(const py::dict& values) {
    Metrics metrics;
    for (auto item : values) {
        metrics.set(item.first.cast<std::string>(), item.second.cast<double>());
    }
    return metrics;
}

// Python callable (Allocation -> dict of metrics, or None to reject) as an evaluator
std::unique_ptr<FunctionEvaluator> make_python_evaluator(py::function fn) {
    return std::make_unique<FunctionEvaluator>([fn](const Allocation& allocation) {
        py::gil_scoped_acquire gil;
        py::object out = fn(allocation);
        if (out.is_none()) {
            return EvaluationResult::failure(EvalStatus::Rejected, "callable returned None");
        }
        return EvaluationResult::ok(metrics_from_dict(out.cast<py::dict>()));
    });
}
}  // namespace

PYBIND11_MODULE(graph_alloc_cpp, m) {
    m.doc() = "C++ implementation of graph allocation optimization";

    py::register_exception<GraphError>(m, "GraphError");
    py::register_exception<InvalidSeed>(m, "InvalidSeed");
    py::register_exception<EvaluatorUnavailable>(m, "EvaluatorUnavailable");
    py::register_exception<WorkerError>(m, "WorkerError");

    // Enums
    py::enum_<NodeType>(m, "NodeType")
        .value("Normal", NodeType::Normal)
        .value("Notable", NodeType::Notable)
        .value("Keystone", NodeType::Keystone)
        .value("Socket", NodeType::Socket)
        .value("Mastery", NodeType::Mastery)
        .value("Root", NodeType::Root);

    py::enum_<Attribute>(m, "Attribute")
        .value("Strength", Attribute::Strength)
        .value("Dexterity", Attribute::Dexterity)
        .value("Intelligence", Attribute::Intelligence);

    py::enum_<RunStatus>(m, "RunStatus")
        .value("Completed", RunStatus::Completed)
        .value("Converged", RunStatus::Converged)
        .value("Aborted", RunStatus::Aborted);

    py::enum_<EvalStatus>(m, "EvalStatus")
        .value("Ok", EvalStatus::Ok)
        .value("Timeout", EvalStatus::Timeout)
        .value("WorkerDied", EvalStatus::WorkerDied)
        .value("BadResponse", EvalStatus::BadResponse)
        .value("Rejected", EvalStatus::Rejected);

    py::enum_<ConstraintPolicy>(m, "ConstraintPolicy")
        .value("SoftPenalize", ConstraintPolicy::SoftPenalize)
        .value("HardReject", ConstraintPolicy::HardReject)
        .value("Repair", ConstraintPolicy::Repair);

    py::enum_<ConstraintPenaltyType>(m, "ConstraintPenaltyType")
        .value("Linear", ConstraintPenaltyType::Linear)
        .value("Quadratic", ConstraintPenaltyType::Quadratic)
        .value("Exponential", ConstraintPenaltyType::Exponential);

    py::enum_<Objective>(m, "Objective")
        .value("Dps", Objective::Dps)
        .value("Life", Objective::Life)
        .value("Ehp", Objective::Ehp)
        .value("Mana", Objective::Mana)
        .value("EnergyShield", Objective::EnergyShield)
        .value("Block", Objective::Block)
        .value("ClearSpeed", Objective::ClearSpeed)
        .value("Balanced", Objective::Balanced);

    m.def("parse_objective", &parse_objective);
    m.def("relative_change", &relative_change);

    // NodeMeta
    py::class_<NodeMeta>(m, "NodeMeta")
        .def(py::init<>())
        .def_readwrite("id", &NodeMeta::id)
        .def_readwrite("type", &NodeMeta::type)
        .def_readwrite("name", &NodeMeta::name)
        .def_readwrite("attributes", &NodeMeta::attributes)
        .def_readwrite("tags", &NodeMeta::tags)
        .def_readwrite("effects", &NodeMeta::effects)
        .def_readwrite("subgraph", &NodeMeta::subgraph)
        .def("is_generated", &NodeMeta::is_generated)
        .def("tag", &NodeMeta::tag, py::arg("key"), py::arg("fallback") = 0.0f);

    // TreeGraph
    py::class_<TreeGraph>(m, "TreeGraph")
        .def(py::init<>())
        .def_static("init_random", &TreeGraph::init_random,
            py::arg("num_nodes"), py::arg("extra_edges") = 0, py::arg("seed") = 42)
        .def("add_node", &TreeGraph::add_node)
        .def("add_edge", &TreeGraph::add_edge)
        .def("add_subgraph", &TreeGraph::add_subgraph)
        .def("node_count", &TreeGraph::node_count)
        .def("edge_count", &TreeGraph::edge_count)
        .def("has_node", &TreeGraph::has_node)
        .def("node_ids", &TreeGraph::node_ids)
        .def("neighbors", &TreeGraph::neighbors)
        .def("metadata", &TreeGraph::metadata, py::return_value_policy::reference_internal)
        .def("nodes_of_type", &TreeGraph::nodes_of_type)
        .def("is_connected", &TreeGraph::is_connected)
        .def("shortest_path", [](const TreeGraph& self, const NodeSet& from, NodeId to) {
            return self.shortest_path(from, to);
        })
        .def("shortest_path_length", &TreeGraph::shortest_path_length)
        .def("unallocated_neighbors", &TreeGraph::unallocated_neighbors)
        .def("grow_connected", [](const TreeGraph& self, NodeId root, size_t size, uint64_t seed) {
            RNG rng(seed);
            return self.grow_connected(root, size, rng);
        }, py::arg("root"), py::arg("size"), py::arg("seed") = 42);

    // Allocation
    py::class_<Allocation>(m, "Allocation")
        .def(py::init<>())
        .def(py::init<NodeSet>())
        .def(py::init<NodeSet, std::map<NodeId, EffectId>>())
        .def_readwrite("nodes", &Allocation::nodes)
        .def_readwrite("selections", &Allocation::selections)
        .def("size", &Allocation::size)
        .def("contains", &Allocation::contains)
        .def("add", &Allocation::add)
        .def("remove", &Allocation::remove)
        .def("select", &Allocation::select)
        .def("canonical_hash", &Allocation::canonical_hash)
        .def("__eq__", [](const Allocation& a, const Allocation& b) { return a == b; })
        .def("__repr__", [](const Allocation& a) { return to_string(a); });

    // Constraints
    py::class_<PointBudget>(m, "PointBudget")
        .def(py::init<>())
        .def_readwrite("min_points", &PointBudget::min_points)
        .def_readwrite("max_points", &PointBudget::max_points)
        .def_static("from_level", &PointBudget::from_level, py::arg("level"), py::arg("min_offset") = 0);

    py::class_<SocketRequirement>(m, "SocketRequirement")
        .def(py::init<>())
        .def_readwrite("min_sockets", &SocketRequirement::min_sockets)
        .def_readwrite("max_sockets", &SocketRequirement::max_sockets);

    py::class_<ValidationResult>(m, "ValidationResult")
        .def_readonly("ok", &ValidationResult::ok)
        .def_readonly("violations", &ValidationResult::violations);

    py::class_<ConstraintSet>(m, "ConstraintSet")
        .def(py::init<const TreeGraph&, NodeId>(), py::keep_alive<1, 2>())
        .def("set_point_budget", &ConstraintSet::set_point_budget)
        .def("set_attribute_requirement", &ConstraintSet::set_attribute_requirement)
        .def("set_socket_requirement", &ConstraintSet::set_socket_requirement)
        .def("set_policy", &ConstraintSet::set_policy)
        .def("add_occupied_socket", &ConstraintSet::add_occupied_socket)
        .def("add_protected_subgraph", &ConstraintSet::add_protected_subgraph)
        .def("protected_nodes", &ConstraintSet::protected_nodes)
        .def("validate", &ConstraintSet::validate)
        .def("fitness_penalty", &ConstraintSet::fitness_penalty)
        .def("repair", &ConstraintSet::repair);

    // Problem
    py::class_<Problem>(m, "Problem")
        .def(py::init<const TreeGraph&, const ConstraintSet&, Objective>(),
            py::arg("graph"), py::arg("constraints"), py::arg("objective") = Objective::Balanced,
            py::keep_alive<1, 2>(), py::keep_alive<1, 3>())
        .def("validate_seed", &Problem::validate_seed)
        .def("constraint_penalty", &Problem::constraint_penalty)
        .def("set_constraint_penalty_type", &Problem::set_constraint_penalty_type)
        .def("set_balanced_weights", &Problem::set_balanced_weights)
        .def("objective", &Problem::objective);

    // Evaluation
    py::class_<EvaluationResult>(m, "EvaluationResult")
        .def_readonly("status", &EvaluationResult::status)
        .def_readonly("error", &EvaluationResult::error)
        .def("success", &EvaluationResult::success)
        .def_property_readonly("metrics", [](const EvaluationResult& self) {
            return metrics_to_dict(self.metrics);
        });

    py::class_<Evaluator>(m, "Evaluator")
        .def("evaluate", &Evaluator::evaluate,
            py::arg("allocation"), py::arg("timeout") = Millis(30000),
            py::call_guard<py::gil_scoped_release>())
        .def("evaluate_batch", &Evaluator::evaluate_batch,
            py::arg("allocations"), py::arg("timeout") = Millis(30000),
            py::call_guard<py::gil_scoped_release>());

    py::class_<FunctionEvaluator, Evaluator>(m, "FunctionEvaluator")
        .def(py::init(&make_python_evaluator))
        .def("calls", &FunctionEvaluator::calls);

    py::class_<CachingEvaluator, Evaluator>(m, "CachingEvaluator")
        .def(py::init<Evaluator&>(), py::keep_alive<1, 2>())
        .def("hits", &CachingEvaluator::hits)
        .def("misses", &CachingEvaluator::misses)
        .def("size", &CachingEvaluator::size)
        .def("clear", &CachingEvaluator::clear);

    py::class_<WorkerPool::Config>(m, "WorkerPoolConfig")
        .def(py::init<>())
        .def_readwrite("num_workers", &WorkerPool::Config::num_workers)
        .def_readwrite("command", &WorkerPool::Config::command)
        .def_readwrite("startup_timeout", &WorkerPool::Config::startup_timeout)
        .def_readwrite("default_timeout", &WorkerPool::Config::default_timeout)
        .def_readwrite("ping_timeout", &WorkerPool::Config::ping_timeout)
        .def_readwrite("verbose", &WorkerPool::Config::verbose);

    py::class_<WorkerPool::Stats>(m, "WorkerPoolStats")
        .def_readonly("total", &WorkerPool::Stats::total)
        .def_readonly("alive", &WorkerPool::Stats::alive)
        .def_readonly("busy", &WorkerPool::Stats::busy)
        .def_readonly("dead", &WorkerPool::Stats::dead)
        .def_readonly("restarted", &WorkerPool::Stats::restarted)
        .def_readonly("requests", &WorkerPool::Stats::requests)
        .def_readonly("failures", &WorkerPool::Stats::failures)
        .def_readonly("retries", &WorkerPool::Stats::retries);

    py::class_<WorkerPool, Evaluator>(m, "WorkerPool")
        .def(py::init<WorkerPool::Config>(), py::call_guard<py::gil_scoped_release>())
        .def("health_check", [](WorkerPool& self) {
            py::gil_scoped_release release;
            auto report = self.health_check();
            return py::make_tuple(report.alive, report.restarted, report.restart_failures);
        })
        .def("shutdown", &WorkerPool::shutdown, py::call_guard<py::gil_scoped_release>())
        .def("stats", &WorkerPool::stats)
        .def("worker_pids", &WorkerPool::worker_pids);

    // Individuals
    py::class_<Individual>(m, "Individual")
        .def("allocation", &Individual::allocation, py::return_value_policy::reference_internal)
        .def("fitness", &Individual::fitness)
        .def("failed", &Individual::failed)
        .def("status", &Individual::status)
        .def("objectives", &Individual::objectives)
        .def("id", &Individual::id)
        .def("generation", &Individual::generation)
        .def("parents", &Individual::parents)
        .def_property_readonly("metrics", [](const Individual& self) {
            return metrics_to_dict(self.metrics());
        });

    // GreedyOptimizer
    py::class_<Modification>(m, "Modification")
        .def_property_readonly("kind", [](const Modification& self) {
            return std::string(modification_kind_name(self.kind));
        })
        .def_readonly("node", &Modification::node)
        .def_readonly("effect", &Modification::effect)
        .def_readonly("iteration", &Modification::iteration)
        .def_readonly("fitness", &Modification::fitness);

    py::class_<GreedyResult>(m, "GreedyResult")
        .def_readonly("allocation", &GreedyResult::allocation)
        .def_readonly("fitness", &GreedyResult::fitness)
        .def_readonly("seed_fitness", &GreedyResult::seed_fitness)
        .def_readonly("iterations", &GreedyResult::iterations)
        .def_readonly("evaluations", &GreedyResult::evaluations)
        .def_readonly("failed_evaluations", &GreedyResult::failed_evaluations)
        .def_readonly("modifications", &GreedyResult::modifications)
        .def_readonly("fitness_history", &GreedyResult::fitness_history)
        .def_readonly("status", &GreedyResult::status)
        .def_readonly("message", &GreedyResult::message)
        .def("improvement", &GreedyResult::improvement);

    py::class_<GreedyOptimizer::Config>(m, "GreedyConfig")
        .def(py::init<>())
        .def_readwrite("max_iterations", &GreedyOptimizer::Config::max_iterations)
        .def_readwrite("max_candidates", &GreedyOptimizer::Config::max_candidates)
        .def_readwrite("min_improvement", &GreedyOptimizer::Config::min_improvement)
        .def_readwrite("optimize_selections", &GreedyOptimizer::Config::optimize_selections)
        .def_readwrite("timeout", &GreedyOptimizer::Config::timeout)
        .def_readwrite("seed", &GreedyOptimizer::Config::seed)
        .def_readwrite("verbose", &GreedyOptimizer::Config::verbose);

    py::class_<GreedyOptimizer>(m, "GreedyOptimizer")
        .def(py::init<const Problem&, Evaluator&, GreedyOptimizer::Config>(),
            py::arg("problem"), py::arg("evaluator"), py::arg("config") = GreedyOptimizer::Config{},
            py::keep_alive<1, 2>(), py::keep_alive<1, 3>())
        .def("optimize", &GreedyOptimizer::optimize, py::call_guard<py::gil_scoped_release>());

    // GeneticOptimizer
    py::class_<GeneticResult>(m, "GeneticResult")
        .def_readonly("best", &GeneticResult::best)
        .def_readonly("best_fitness", &GeneticResult::best_fitness)
        .def_readonly("seed_fitness", &GeneticResult::seed_fitness)
        .def_readonly("generations", &GeneticResult::generations)
        .def_readonly("best_fitness_history", &GeneticResult::best_fitness_history)
        .def_readonly("avg_fitness_history", &GeneticResult::avg_fitness_history)
        .def_readonly("final_population", &GeneticResult::final_population)
        .def_readonly("evaluations", &GeneticResult::evaluations)
        .def_readonly("failed_evaluations", &GeneticResult::failed_evaluations)
        .def_readonly("status", &GeneticResult::status)
        .def_readonly("message", &GeneticResult::message);

    py::class_<GeneticOptimizer::Config>(m, "GeneticConfig")
        .def(py::init<>())
        .def_readwrite("population_size", &GeneticOptimizer::Config::population_size)
        .def_readwrite("generations", &GeneticOptimizer::Config::generations)
        .def_readwrite("mutation_rate", &GeneticOptimizer::Config::mutation_rate)
        .def_readwrite("crossover_rate", &GeneticOptimizer::Config::crossover_rate)
        .def_readwrite("elitism_count", &GeneticOptimizer::Config::elitism_count)
        .def_readwrite("tournament_size", &GeneticOptimizer::Config::tournament_size)
        .def_readwrite("inherit_probability", &GeneticOptimizer::Config::inherit_probability)
        .def_readwrite("initial_changes", &GeneticOptimizer::Config::initial_changes)
        .def_readwrite("min_allocation_size", &GeneticOptimizer::Config::min_allocation_size)
        .def_readwrite("max_reattach_cost", &GeneticOptimizer::Config::max_reattach_cost)
        .def_readwrite("convergence_window", &GeneticOptimizer::Config::convergence_window)
        .def_readwrite("convergence_epsilon", &GeneticOptimizer::Config::convergence_epsilon)
        .def_readwrite("timeout", &GeneticOptimizer::Config::timeout)
        .def_readwrite("seed", &GeneticOptimizer::Config::seed)
        .def_readwrite("verbose", &GeneticOptimizer::Config::verbose);

    py::class_<GeneticOptimizer>(m, "GeneticOptimizer")
        .def(py::init<const Problem&, Evaluator&, GeneticOptimizer::Config>(),
            py::arg("problem"), py::arg("evaluator"), py::arg("config") = GeneticOptimizer::Config{},
            py::keep_alive<1, 2>(), py::keep_alive<1, 3>())
        .def("optimize", &GeneticOptimizer::optimize, py::call_guard<py::gil_scoped_release>());

    // MultiObjectiveOptimizer
    py::class_<ParetoIndividual>(m, "ParetoIndividual")
        .def_readonly("individual", &ParetoIndividual::individual)
        .def_readonly("objectives", &ParetoIndividual::objectives)
        .def_readonly("rank", &ParetoIndividual::rank)
        .def_readonly("crowding_distance", &ParetoIndividual::crowding_distance);

    py::class_<ParetoFrontier>(m, "ParetoFrontier")
        .def("individuals", &ParetoFrontier::individuals)
        .def("objectives", &ParetoFrontier::objectives)
        .def("size", &ParetoFrontier::size)
        .def("extreme_points", &ParetoFrontier::extreme_points)
        .def("balanced", &ParetoFrontier::balanced);

    py::class_<MultiObjectiveResult>(m, "MultiObjectiveResult")
        .def_readonly("frontier", &MultiObjectiveResult::frontier)
        .def_readonly("generations", &MultiObjectiveResult::generations)
        .def_readonly("frontier_size_history", &MultiObjectiveResult::frontier_size_history)
        .def_readonly("evaluations", &MultiObjectiveResult::evaluations)
        .def_readonly("failed_evaluations", &MultiObjectiveResult::failed_evaluations)
        .def_readonly("status", &MultiObjectiveResult::status)
        .def_readonly("message", &MultiObjectiveResult::message);

    py::class_<MultiObjectiveOptimizer::Config>(m, "MultiObjectiveConfig")
        .def(py::init<>())
        .def_readwrite("population_size", &MultiObjectiveOptimizer::Config::population_size)
        .def_readwrite("generations", &MultiObjectiveOptimizer::Config::generations)
        .def_readwrite("mutation_rate", &MultiObjectiveOptimizer::Config::mutation_rate)
        .def_readwrite("crossover_rate", &MultiObjectiveOptimizer::Config::crossover_rate)
        .def_readwrite("inherit_probability", &MultiObjectiveOptimizer::Config::inherit_probability)
        .def_readwrite("initial_changes", &MultiObjectiveOptimizer::Config::initial_changes)
        .def_readwrite("min_allocation_size", &MultiObjectiveOptimizer::Config::min_allocation_size)
        .def_readwrite("max_reattach_cost", &MultiObjectiveOptimizer::Config::max_reattach_cost)
        .def_readwrite("timeout", &MultiObjectiveOptimizer::Config::timeout)
        .def_readwrite("seed", &MultiObjectiveOptimizer::Config::seed)
        .def_readwrite("verbose", &MultiObjectiveOptimizer::Config::verbose);

    py::class_<MultiObjectiveOptimizer>(m, "MultiObjectiveOptimizer")
        .def(py::init<const Problem&, Evaluator&, std::vector<Objective>, MultiObjectiveOptimizer::Config>(),
            py::arg("problem"), py::arg("evaluator"),
            py::arg("objectives") = std::vector<Objective>{Objective::Dps, Objective::Life, Objective::Ehp},
            py::arg("config") = MultiObjectiveOptimizer::Config{},
            py::keep_alive<1, 2>(), py::keep_alive<1, 3>())
        .def("optimize", &MultiObjectiveOptimizer::optimize, py::call_guard<py::gil_scoped_release>());

    m.def("dominates", &dominates);
    m.def("non_dominated_sort", &non_dominated_sort);

    // Constants
    m.attr("FAILED_FITNESS") = FAILED_FITNESS;
    m.attr("INVALID_NODE") = INVALID_NODE;
}
