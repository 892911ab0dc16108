#pragma once

#include "evaluator.hpp"
#include "worker.hpp"
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace graph_alloc {

// Evaluator backed by N persistent worker processes.
//
// Dispatch is round-robin over idle healthy workers; callers queue when every
// worker is busy. A timed-out or crashed worker is marked dead and the call is
// retried once on a different worker. When no worker is left alive the call
// throws EvaluatorUnavailable. health_check() restarts dead workers.
//
// The registry mutex only guards slot bookkeeping and is never held during an
// exchange with a worker process.
class WorkerPool : public Evaluator {
public:
    struct Config {
        int num_workers{4};
        std::vector<std::string> command;
        Millis startup_timeout{10000};
        Millis default_timeout{30000};
        Millis ping_timeout{2000};
        bool verbose{false};
    };

    struct Stats {
        int total{0};
        int alive{0};           // idle or busy
        int busy{0};
        int dead{0};
        int restarted{0};
        int restart_failures{0};
        uint64_t requests{0};
        uint64_t failures{0};   // worker failures (timeouts, crashes)
        uint64_t retries{0};
    };

    struct HealthReport {
        int checked{0};
        int alive{0};
        int restarted{0};
        int restart_failures{0};
    };

    // Starts every worker. Workers that fail to start are left dead;
    // throws EvaluatorUnavailable if none started.
    explicit WorkerPool(Config config);
    ~WorkerPool() override;

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    [[nodiscard]] EvaluationResult evaluate(const Allocation& allocation, Millis timeout) override;

    // Overload using Config::default_timeout
    [[nodiscard]] EvaluationResult evaluate(const Allocation& allocation) {
        return evaluate(allocation, config_.default_timeout);
    }

    // Concurrent evaluation, at most num_workers in flight
    [[nodiscard]] std::vector<EvaluationResult> evaluate_batch(
        const std::vector<Allocation>& allocations,
        Millis timeout
    ) override;

    // Restarts dead workers if any
    void maintain() override;

    // Pings idle workers (busy ones count as alive), restarts dead or unresponsive ones
    HealthReport health_check();

    // Sends EXIT to every worker, kills stragglers. Later calls throw EvaluatorUnavailable.
    void shutdown();

    [[nodiscard]] Stats stats() const;
    [[nodiscard]] size_t size() const { return slots_.size(); }
    [[nodiscard]] const Config& config() const { return config_; }

    // Process ids by slot (-1 for dead workers)
    [[nodiscard]] std::vector<pid_t> worker_pids() const;

private:
    enum class SlotState { Idle, Busy, Dead, Restarting };

    struct Slot {
        std::unique_ptr<Worker> worker;
        SlotState state{SlotState::Dead};
    };

    // Reserves the next idle worker other than exclude, waiting while all are busy.
    // Throws EvaluatorUnavailable when no candidate worker is alive.
    [[nodiscard]] size_t acquire(int exclude);

    // Returns a worker to the pool after an exchange
    void release(size_t index, bool healthy);

    [[nodiscard]] EvaluationResult run_on(size_t index, const Allocation& allocation, Millis timeout);

    [[nodiscard]] bool restart(size_t index);

    Config config_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::vector<Slot> slots_;
    size_t cursor_{0};
    bool shut_down_{false};

    int restarted_{0};
    int restart_failures_{0};
    uint64_t requests_{0};
    uint64_t failures_{0};
    uint64_t retries_{0};
};

}  // namespace graph_alloc
