#pragma once

#include "allocation.hpp"
#include "types.hpp"
#include "../random/rng.hpp"
#include <cstdint>
#include <optional>

namespace graph_alloc {

// Per-run optimization state: RNG, iteration counters and best-allocation tracking.
// Fitness is maximized.
class GlobalState {
public:
    GlobalState() = default;
    explicit GlobalState(uint64_t seed);

    [[nodiscard]] RNG& rng() { return rng_; }

    // Iteration tracking
    void next();

    // Records the allocation if it beats the best so far. The stall counter is
    // only reset when the gain exceeds the tolerance. Returns true if recorded.
    bool maybe_update_best(double fitness, const Allocation& allocation);

    [[nodiscard]] uint64_t iteration() const { return t_; }
    [[nodiscard]] uint64_t iters_since_improvement() const { return iters_since_improvement_; }

    [[nodiscard]] double best_score() const { return best_score_; }
    [[nodiscard]] const Allocation* best_allocation() const {
        return best_allocation_ ? &(*best_allocation_) : nullptr;
    }

    // Minimum gain that counts as an improvement
    [[nodiscard]] double tolerance() const { return tol_; }
    void set_tolerance(double tol) { tol_ = tol; }

private:
    RNG rng_;
    uint64_t t_{0};
    uint64_t iters_since_improvement_{0};

    double best_score_{FAILED_FITNESS};
    std::optional<Allocation> best_allocation_;

    double tol_{0.0};
};

}  // namespace graph_alloc
