#pragma once

#include "optimizer.hpp"
#include <optional>
#include <string>
#include <vector>

namespace graph_alloc {

struct Modification {
    enum class Kind { Add, Remove, Select };

    Kind kind{Kind::Add};
    NodeId node{INVALID_NODE};
    EffectId effect{0};         // Select only
    uint64_t iteration{0};
    double fitness{0.0};        // fitness after the change

    [[nodiscard]] int point_delta() const {
        return kind == Kind::Add ? 1 : (kind == Kind::Remove ? -1 : 0);
    }
};

[[nodiscard]] const char* modification_kind_name(Modification::Kind kind);

struct GreedyResult {
    Allocation allocation;
    double fitness{FAILED_FITNESS};
    double seed_fitness{FAILED_FITNESS};
    Metrics metrics;
    uint64_t iterations{0};
    uint64_t evaluations{0};
    uint64_t failed_evaluations{0};
    std::vector<Modification> modifications;
    std::vector<double> fitness_history;   // seed first, then after every accepted change
    RunStatus status{RunStatus::Completed};
    std::string message;

    [[nodiscard]] double improvement() const { return fitness - seed_fitness; }
};

// Hill climbing over single-node additions and removals, followed by a pass
// over the effect selection of every allocated mastery node.
class GreedyOptimizer : public Optimizer {
public:
    struct Config {
        int max_iterations{100};
        int max_candidates{20};          // per move kind and iteration
        double min_improvement{0.0};     // accepted changes must gain more than this
        bool optimize_selections{true};
        Millis timeout{30000};
        uint64_t seed{42};
        bool verbose{false};
    };

    GreedyOptimizer(const Problem& problem, Evaluator& evaluator, Config config);
    GreedyOptimizer(const Problem& problem, Evaluator& evaluator)
        : GreedyOptimizer(problem, evaluator, Config{}) {}

    // Throws InvalidSeed before evaluating anything
    [[nodiscard]] GreedyResult optimize(const Allocation& seed);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    struct Move {
        Modification::Kind kind;
        NodeId node;
        EffectId effect;
    };

    [[nodiscard]] std::vector<Move> generate_moves(const Allocation& current, RNG& rng) const;
    [[nodiscard]] Allocation apply_move(const Allocation& current, const Move& move) const;

    // Index of the best strictly improving candidate
    [[nodiscard]] std::optional<size_t> pick_best(
        const std::vector<Move>& moves,
        const std::vector<double>& fitness,
        double current_fitness
    ) const;

    // Evaluates the moves and accepts the best one; false if nothing improved
    bool step(
        GreedyResult& result,
        std::vector<Move> moves,
        const Metrics& baseline,
        uint64_t iteration
    );

    void selection_pass(GreedyResult& result, const Metrics& baseline, uint64_t iteration);

    Config config_;
    NodeSet protected_;
};

}  // namespace graph_alloc
