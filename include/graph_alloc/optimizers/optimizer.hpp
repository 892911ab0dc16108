#pragma once

#include "../core/allocation.hpp"
#include "../core/global_state.hpp"
#include "../core/problem.hpp"
#include "../eval/evaluator.hpp"
#include <string>
#include <vector>

namespace graph_alloc {

// Base of the allocation optimizers: holds the injected problem and evaluator
// and funnels every candidate through the constraint policy and the evaluator.
class Optimizer {
public:
    Optimizer(const Problem& problem, Evaluator& evaluator, std::string name);
    virtual ~Optimizer() = default;

    Optimizer(const Optimizer&) = delete;
    Optimizer& operator=(const Optimizer&) = delete;

    [[nodiscard]] const Problem& problem() const { return problem_; }
    [[nodiscard]] const std::string& name() const { return name_; }

protected:
    // Applies the constraint policy to each candidate (repaired candidates are
    // replaced in place) and evaluates the survivors in one batch. Rejected
    // candidates get a Rejected result without reaching the evaluator.
    // Throws EvaluatorUnavailable.
    [[nodiscard]] std::vector<EvaluationResult> evaluate_candidates(
        std::vector<Allocation>& candidates,
        Millis timeout,
        uint64_t step
    );

    const Problem& problem_;
    Evaluator& evaluator_;
    std::string name_;
    bool verbose_{false};

    uint64_t evaluations_{0};
    uint64_t failed_evaluations_{0};
    uint64_t consecutive_failed_steps_{0};
};

}  // namespace graph_alloc
