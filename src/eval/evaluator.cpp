#include "graph_alloc/eval/evaluator.hpp"
#include <stdexcept>

namespace graph_alloc {

std::vector<EvaluationResult> Evaluator::evaluate_batch(
    const std::vector<Allocation>& allocations,
    Millis timeout
) {
    std::vector<EvaluationResult> results;
    results.reserve(allocations.size());
    for (const auto& allocation : allocations) {
        results.push_back(evaluate(allocation, timeout));
    }
    return results;
}

FunctionEvaluator::FunctionEvaluator(Function fn) : fn_(std::move(fn)) {
    if (!fn_) {
        throw std::invalid_argument("FunctionEvaluator requires a callable");
    }
}

EvaluationResult FunctionEvaluator::evaluate(const Allocation& allocation, Millis timeout) {
    (void)timeout;
    ++calls_;
    try {
        return fn_(allocation);
    } catch (const std::exception& e) {
        return EvaluationResult::failure(EvalStatus::Rejected, e.what());
    }
}

CachingEvaluator::CachingEvaluator(Evaluator& inner) : inner_(inner) {}

std::optional<Metrics> CachingEvaluator::lookup(const Allocation& allocation, uint64_t hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(hash);
    if (it != entries_.end()) {
        for (const auto& entry : it->second) {
            if (entry.allocation == allocation) {
                ++hits_;
                return entry.metrics;
            }
        }
    }
    ++misses_;
    return std::nullopt;
}

void CachingEvaluator::store(const Allocation& allocation, uint64_t hash, const EvaluationResult& result) {
    if (!result.success()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto& bucket = entries_[hash];
    for (const auto& entry : bucket) {
        if (entry.allocation == allocation) {
            return;
        }
    }
    bucket.push_back({allocation, result.metrics});
    ++size_;
}

EvaluationResult CachingEvaluator::evaluate(const Allocation& allocation, Millis timeout) {
    uint64_t hash = allocation.canonical_hash();
    if (auto cached = lookup(allocation, hash)) {
        return EvaluationResult::ok(std::move(*cached));
    }
    EvaluationResult result = inner_.evaluate(allocation, timeout);
    store(allocation, hash, result);
    return result;
}

std::vector<EvaluationResult> CachingEvaluator::evaluate_batch(
    const std::vector<Allocation>& allocations,
    Millis timeout
) {
    std::vector<EvaluationResult> results(allocations.size());
    std::vector<Allocation> pending;
    std::vector<uint64_t> pending_hashes;
    // Input index -> position in pending
    std::vector<size_t> slot(allocations.size(), 0);
    std::vector<char> cached(allocations.size(), 0);

    for (size_t i = 0; i < allocations.size(); ++i) {
        uint64_t hash = allocations[i].canonical_hash();
        if (auto metrics = lookup(allocations[i], hash)) {
            results[i] = EvaluationResult::ok(std::move(*metrics));
            cached[i] = 1;
            continue;
        }

        size_t found = pending.size();
        for (size_t p = 0; p < pending.size(); ++p) {
            if (pending_hashes[p] == hash && pending[p] == allocations[i]) {
                found = p;
                break;
            }
        }
        if (found == pending.size()) {
            pending.push_back(allocations[i]);
            pending_hashes.push_back(hash);
        }
        slot[i] = found;
    }

    if (pending.empty()) {
        return results;
    }

    auto fresh = inner_.evaluate_batch(pending, timeout);
    for (size_t p = 0; p < pending.size(); ++p) {
        store(pending[p], pending_hashes[p], fresh[p]);
    }
    for (size_t i = 0; i < allocations.size(); ++i) {
        if (!cached[i]) {
            results[i] = fresh[slot[i]];
        }
    }
    return results;
}

uint64_t CachingEvaluator::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

uint64_t CachingEvaluator::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

size_t CachingEvaluator::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return size_;
}

void CachingEvaluator::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    size_ = 0;
    hits_ = 0;
    misses_ = 0;
}

}  // namespace graph_alloc
