#pragma once

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace graph_alloc {

// PCG random number generator (permuted congruential generator)
// Fast, splittable, and identical across platforms so runs are reproducible
class RNG {
public:
    RNG() : state_(0x853c49e6748fea9bULL), inc_(0xda3e39cb94b95bdbULL) {}
    explicit RNG(uint64_t seed) : state_(0), inc_(seed | 1) {
        (void)next();
        state_ += seed;
        (void)next();
    }

    [[nodiscard]] uint64_t next() {
        uint64_t oldstate = state_;
        state_ = oldstate * 6364136223846793005ULL + inc_;
        uint32_t xorshifted = static_cast<uint32_t>(((oldstate >> 18u) ^ oldstate) >> 27u);
        uint32_t rot = static_cast<uint32_t>(oldstate >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((-rot) & 31));
    }

    // Uniform double in [0, 1)
    [[nodiscard]] double uniform() {
        return static_cast<double>(next()) / static_cast<double>(1ULL << 32);
    }

    [[nodiscard]] double uniform(double min, double max) {
        return min + uniform() * (max - min);
    }

    [[nodiscard]] bool bernoulli(double p) {
        return uniform() < p;
    }

    // Random integer in [min, max] (inclusive)
    [[nodiscard]] int randint(int min, int max) {
        if (min > max) std::swap(min, max);
        uint64_t range = static_cast<uint64_t>(max - min) + 1;
        return min + static_cast<int>(next() % range);
    }

    [[nodiscard]] std::vector<int> permutation(int n) {
        std::vector<int> result(n);
        for (int i = 0; i < n; ++i) result[i] = i;
        for (int i = n - 1; i > 0; --i) {
            int j = randint(0, i);
            std::swap(result[i], result[j]);
        }
        return result;
    }

    // k random indices from [0, n) without replacement
    [[nodiscard]] std::vector<int> choice(int n, int k) {
        if (k > n) k = n;
        auto perm = permutation(n);
        perm.resize(k);
        return perm;
    }

    template <typename T>
    [[nodiscard]] const T& pick(const std::vector<T>& items) {
        if (items.empty()) {
            throw std::out_of_range("RNG::pick on empty vector");
        }
        return items[static_cast<size_t>(randint(0, static_cast<int>(items.size()) - 1))];
    }

    // k distinct elements, in the order they were drawn
    template <typename T>
    [[nodiscard]] std::vector<T> sample(const std::vector<T>& items, size_t k) {
        std::vector<T> out;
        for (int idx : choice(static_cast<int>(items.size()), static_cast<int>(k))) {
            out.push_back(items[static_cast<size_t>(idx)]);
        }
        return out;
    }

    template <typename T>
    void shuffle(std::vector<T>& items) {
        for (int i = static_cast<int>(items.size()) - 1; i > 0; --i) {
            int j = randint(0, i);
            std::swap(items[static_cast<size_t>(i)], items[static_cast<size_t>(j)]);
        }
    }

    // Independent generator seeded from the current state
    [[nodiscard]] RNG split() {
        return RNG(next());
    }

    [[nodiscard]] uint64_t state() const { return state_; }
    [[nodiscard]] uint64_t increment() const { return inc_; }

private:
    uint64_t state_;
    uint64_t inc_;
};

}  // namespace graph_alloc
