#pragma once

#include "metrics.hpp"
#include "../core/allocation.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace graph_alloc {

using Millis = std::chrono::milliseconds;

class Evaluator;

using EvaluatorPtr = std::unique_ptr<Evaluator>;

// Black-box oracle mapping an allocation to metrics.
// Implementations must be safe to call concurrently.
class Evaluator {
public:
    virtual ~Evaluator() = default;

    // Per-candidate failures are reported in the result; only systemic
    // failure (EvaluatorUnavailable) is thrown.
    [[nodiscard]] virtual EvaluationResult evaluate(const Allocation& allocation, Millis timeout) = 0;

    // One result per allocation, in input order. Default: sequential.
    [[nodiscard]] virtual std::vector<EvaluationResult> evaluate_batch(
        const std::vector<Allocation>& allocations,
        Millis timeout
    );

    // Called by optimizers between batches (e.g. to restore lost capacity)
    virtual void maintain() {}
};

// Wraps an in-process callable. Exceptions thrown by the callable become Rejected results.
class FunctionEvaluator : public Evaluator {
public:
    using Function = std::function<EvaluationResult(const Allocation&)>;

    explicit FunctionEvaluator(Function fn);

    [[nodiscard]] EvaluationResult evaluate(const Allocation& allocation, Millis timeout) override;

    [[nodiscard]] uint64_t calls() const { return calls_.load(); }

private:
    Function fn_;
    std::atomic<uint64_t> calls_{0};
};

// Memoizes successful results keyed by the allocation's canonical hash.
// Failed results are not cached so the candidate can be retried later.
class CachingEvaluator : public Evaluator {
public:
    explicit CachingEvaluator(Evaluator& inner);

    [[nodiscard]] EvaluationResult evaluate(const Allocation& allocation, Millis timeout) override;

    // Forwards each distinct uncached allocation to the inner evaluator once
    [[nodiscard]] std::vector<EvaluationResult> evaluate_batch(
        const std::vector<Allocation>& allocations,
        Millis timeout
    ) override;

    void maintain() override { inner_.maintain(); }

    [[nodiscard]] uint64_t hits() const;
    [[nodiscard]] uint64_t misses() const;
    [[nodiscard]] size_t size() const;
    void clear();

private:
    struct Entry {
        Allocation allocation;
        Metrics metrics;
    };

    [[nodiscard]] std::optional<Metrics> lookup(const Allocation& allocation, uint64_t hash);
    void store(const Allocation& allocation, uint64_t hash, const EvaluationResult& result);

    Evaluator& inner_;

    mutable std::mutex mutex_;
    std::unordered_map<uint64_t, std::vector<Entry>> entries_;
    uint64_t hits_{0};
    uint64_t misses_{0};
    size_t size_{0};
};

}  // namespace graph_alloc
