#include "graph_alloc/optimizers/optimizer.hpp"
#include <iostream>

namespace graph_alloc {

Optimizer::Optimizer(const Problem& problem, Evaluator& evaluator, std::string name)
    : problem_(problem), evaluator_(evaluator), name_(std::move(name)) {}

std::vector<EvaluationResult> Optimizer::evaluate_candidates(
    std::vector<Allocation>& candidates,
    Millis timeout,
    uint64_t step
) {
    std::vector<EvaluationResult> results(candidates.size());
    std::vector<Allocation> batch;
    std::vector<size_t> batch_index;

    for (size_t i = 0; i < candidates.size(); ++i) {
        auto prepared = problem_.apply_policy(candidates[i]);
        if (!prepared) {
            results[i] = EvaluationResult::failure(EvalStatus::Rejected, "constraint violation");
            continue;
        }
        candidates[i] = std::move(*prepared);
        batch.push_back(candidates[i]);
        batch_index.push_back(i);
    }

    evaluator_.maintain();
    if (!batch.empty()) {
        auto fresh = evaluator_.evaluate_batch(batch, timeout);
        for (size_t b = 0; b < batch.size(); ++b) {
            results[batch_index[b]] = std::move(fresh[b]);
        }
    }

    size_t failed = 0;
    for (size_t b = 0; b < batch.size(); ++b) {
        if (!results[batch_index[b]].success()) {
            ++failed;
        }
    }
    evaluations_ += batch.size();
    failed_evaluations_ += failed;

    if (failed > 0) {
        ++consecutive_failed_steps_;
        std::cerr << "[" << name_ << "] WARNING: step=" << step
                  << " failed evaluations=" << failed << "/" << batch.size();
        if (consecutive_failed_steps_ > 1) {
            std::cerr << " (failures in " << consecutive_failed_steps_ << " consecutive steps)";
        }
        std::cerr << "\n";
    } else {
        consecutive_failed_steps_ = 0;
    }
    return results;
}

}  // namespace graph_alloc
