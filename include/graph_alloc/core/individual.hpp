#pragma once

#include "allocation.hpp"
#include "../eval/metrics.hpp"
#include <optional>
#include <vector>

namespace graph_alloc {

// Cheap derived state of an allocation, computed on first use
struct AllocationSummary {
    size_t node_count{0};
    size_t selection_count{0};
    uint64_t hash{0};
};

// An allocation plus its evaluation outcome and lineage
class Individual {
public:
    Individual() = default;
    explicit Individual(Allocation allocation, int generation = 0)
        : allocation_(std::move(allocation)), generation_(generation) {}

    [[nodiscard]] const Allocation& allocation() const { return allocation_; }

    // Replaces the allocation and clears every cached or evaluated value
    void set_allocation(Allocation allocation);

    [[nodiscard]] const AllocationSummary& summary() const;

    // Evaluation outcome
    void set_evaluation(EvalStatus status, Metrics metrics, double fitness);
    void set_objectives(std::vector<double> objectives) { objectives_ = std::move(objectives); }
    [[nodiscard]] bool evaluated() const { return evaluated_; }
    [[nodiscard]] bool failed() const { return evaluated_ && status_ != EvalStatus::Ok; }
    [[nodiscard]] EvalStatus status() const { return status_; }
    [[nodiscard]] double fitness() const { return fitness_; }
    [[nodiscard]] const std::vector<double>& objectives() const { return objectives_; }
    [[nodiscard]] const Metrics& metrics() const { return metrics_; }

    // Lineage
    [[nodiscard]] uint64_t id() const { return id_; }
    void set_id(uint64_t id) { id_ = id; }
    [[nodiscard]] int generation() const { return generation_; }
    [[nodiscard]] const std::vector<uint64_t>& parents() const { return parents_; }
    void set_parents(std::vector<uint64_t> parents) { parents_ = std::move(parents); }

private:
    Allocation allocation_;
    mutable std::optional<AllocationSummary> summary_;

    bool evaluated_{false};
    EvalStatus status_{EvalStatus::Rejected};
    double fitness_{FAILED_FITNESS};
    std::vector<double> objectives_;
    Metrics metrics_;

    uint64_t id_{0};
    int generation_{0};
    std::vector<uint64_t> parents_;
};

struct FitnessStats {
    double best{FAILED_FITNESS};
    double worst{FAILED_FITNESS};
    double average{FAILED_FITNESS};
    double median{FAILED_FITNESS};
    size_t evaluated{0};
    size_t failed{0};
};

// Individuals of the current generation plus best-ever tracking and history.
// Failed individuals are excluded from average/median.
class Population {
public:
    Population() = default;

    [[nodiscard]] std::vector<Individual>& individuals() { return individuals_; }
    [[nodiscard]] const std::vector<Individual>& individuals() const { return individuals_; }
    [[nodiscard]] size_t size() const { return individuals_.size(); }
    [[nodiscard]] bool empty() const { return individuals_.empty(); }
    [[nodiscard]] int generation() const { return generation_; }

    // Assigns a fresh id and appends
    void add(Individual individual);

    // Replaces the individuals and advances the generation counter
    void advance(std::vector<Individual> next);

    // Highest fitness first; stable so equal fitness keeps insertion order
    void sort_by_fitness();

    [[nodiscard]] const Individual& best() const;
    [[nodiscard]] const std::optional<Individual>& best_ever() const { return best_ever_; }

    [[nodiscard]] FitnessStats stats() const;

    // Appends this generation's best/average to the history and updates best-ever
    void record_generation();

    [[nodiscard]] const std::vector<double>& best_history() const { return best_history_; }
    [[nodiscard]] const std::vector<double>& average_history() const { return average_history_; }

    [[nodiscard]] uint64_t next_id() { return next_id_++; }

private:
    std::vector<Individual> individuals_;
    int generation_{0};
    uint64_t next_id_{1};

    std::optional<Individual> best_ever_;
    std::vector<double> best_history_;
    std::vector<double> average_history_;
};

}  // namespace graph_alloc
