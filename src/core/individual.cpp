#include "graph_alloc/core/individual.hpp"
#include <algorithm>
#include <stdexcept>

namespace graph_alloc {

void Individual::set_allocation(Allocation allocation) {
    allocation_ = std::move(allocation);
    summary_.reset();
    evaluated_ = false;
    status_ = EvalStatus::Rejected;
    fitness_ = FAILED_FITNESS;
    objectives_.clear();
    metrics_ = Metrics{};
}

const AllocationSummary& Individual::summary() const {
    if (!summary_) {
        summary_ = AllocationSummary{
            allocation_.size(),
            allocation_.selections.size(),
            allocation_.canonical_hash()
        };
    }
    return *summary_;
}

void Individual::set_evaluation(EvalStatus status, Metrics metrics, double fitness) {
    evaluated_ = true;
    status_ = status;
    metrics_ = std::move(metrics);
    fitness_ = status == EvalStatus::Ok ? fitness : FAILED_FITNESS;
}

void Population::add(Individual individual) {
    if (individual.id() == 0) {
        individual.set_id(next_id());
    }
    individuals_.push_back(std::move(individual));
}

void Population::advance(std::vector<Individual> next) {
    individuals_.clear();
    for (auto& ind : next) {
        add(std::move(ind));
    }
    ++generation_;
}

void Population::sort_by_fitness() {
    std::stable_sort(individuals_.begin(), individuals_.end(),
        [](const Individual& a, const Individual& b) {
            return a.fitness() > b.fitness();
        });
}

const Individual& Population::best() const {
    if (individuals_.empty()) {
        throw std::logic_error("Population::best on empty population");
    }
    return *std::max_element(individuals_.begin(), individuals_.end(),
        [](const Individual& a, const Individual& b) {
            return a.fitness() < b.fitness();
        });
}

FitnessStats Population::stats() const {
    FitnessStats s;
    std::vector<double> values;
    for (const auto& ind : individuals_) {
        if (!ind.evaluated()) {
            continue;
        }
        ++s.evaluated;
        if (ind.failed()) {
            ++s.failed;
            continue;
        }
        values.push_back(ind.fitness());
    }
    if (values.empty()) {
        return s;
    }

    std::sort(values.begin(), values.end());
    s.worst = values.front();
    s.best = values.back();

    double sum = 0.0;
    for (double v : values) sum += v;
    s.average = sum / static_cast<double>(values.size());

    size_t mid = values.size() / 2;
    s.median = values.size() % 2 == 1 ? values[mid] : 0.5 * (values[mid - 1] + values[mid]);
    return s;
}

void Population::record_generation() {
    if (individuals_.empty()) {
        return;
    }
    const Individual& current = best();
    if (!best_ever_ || current.fitness() > best_ever_->fitness()) {
        best_ever_ = current;
    }

    FitnessStats s = stats();
    best_history_.push_back(s.best);
    average_history_.push_back(s.average);
}

}  // namespace graph_alloc
