#include "graph_alloc/core/global_state.hpp"

namespace graph_alloc {

GlobalState::GlobalState(uint64_t seed) : rng_(seed) {}

void GlobalState::next() {
    ++t_;
    ++iters_since_improvement_;
}

bool GlobalState::maybe_update_best(double fitness, const Allocation& allocation) {
    if (best_allocation_ && fitness <= best_score_) {
        return false;
    }

    if (!best_allocation_ || fitness - best_score_ > tol_) {
        iters_since_improvement_ = 0;
    }
    best_score_ = fitness;
    best_allocation_ = allocation;
    return true;
}

}  // namespace graph_alloc
