#include "graph_alloc/eval/worker_pool.hpp"
#include "graph_alloc/core/errors.hpp"
#include <algorithm>
#include <exception>
#include <iostream>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace graph_alloc {

WorkerPool::WorkerPool(Config config) : config_(std::move(config)) {
    if (config_.num_workers < 1) {
        throw std::invalid_argument("WorkerPool needs at least one worker");
    }
    if (config_.command.empty()) {
        throw std::invalid_argument("WorkerPool command is empty");
    }

    Worker::Config worker_config;
    worker_config.command = config_.command;
    worker_config.startup_timeout = config_.startup_timeout;
    worker_config.verbose = config_.verbose;

    int started = 0;
    slots_.resize(static_cast<size_t>(config_.num_workers));
    for (size_t i = 0; i < slots_.size(); ++i) {
        slots_[i].worker = std::make_unique<Worker>(static_cast<int>(i), worker_config);
        try {
            slots_[i].worker->start();
            slots_[i].state = SlotState::Idle;
            ++started;
        } catch (const WorkerError& e) {
            std::cerr << "[WorkerPool] ERROR: worker " << i << " failed to start: " << e.what() << "\n";
            slots_[i].state = SlotState::Dead;
        }
    }

    if (started == 0) {
        throw EvaluatorUnavailable("No worker process could be started");
    }
    if (config_.verbose) {
        std::cout << "[WorkerPool] started=" << started << "/" << slots_.size() << "\n";
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

size_t WorkerPool::acquire(int exclude) {
    std::unique_lock<std::mutex> lock(mutex_);
    const size_t n = slots_.size();
    for (;;) {
        if (shut_down_) {
            throw EvaluatorUnavailable("Worker pool is shut down");
        }

        bool any_candidate = false;
        for (size_t k = 0; k < n; ++k) {
            size_t i = (cursor_ + k) % n;
            if (static_cast<int>(i) == exclude || slots_[i].state == SlotState::Dead) {
                continue;
            }
            any_candidate = true;
            if (slots_[i].state == SlotState::Idle) {
                slots_[i].state = SlotState::Busy;
                cursor_ = (i + 1) % n;
                ++requests_;
                return i;
            }
        }

        if (!any_candidate) {
            throw EvaluatorUnavailable("All " + std::to_string(n) + " workers are dead");
        }
        available_.wait(lock);
    }
}

void WorkerPool::release(size_t index, bool healthy) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        slots_[index].state = healthy ? SlotState::Idle : SlotState::Dead;
        if (!healthy) {
            ++failures_;
        }
    }
    available_.notify_all();
}

EvaluationResult WorkerPool::run_on(size_t index, const Allocation& allocation, Millis timeout) {
    Worker& worker = *slots_[index].worker;
    EvaluationResult result = worker.evaluate(allocation, timeout);

    bool healthy = !result.is_worker_failure();
    if (!healthy) {
        // A late response would desynchronize the channel: discard the process
        worker.terminate();
        std::cerr << "[WorkerPool] WARNING: worker " << index << " marked dead ("
                  << eval_status_name(result.status) << ": " << result.error << ")\n";
    }
    release(index, healthy);
    return result;
}

EvaluationResult WorkerPool::evaluate(const Allocation& allocation, Millis timeout) {
    size_t first = acquire(-1);
    EvaluationResult result = run_on(first, allocation, timeout);
    if (!result.is_worker_failure()) {
        return result;
    }

    size_t second = 0;
    try {
        second = acquire(static_cast<int>(first));
    } catch (const EvaluatorUnavailable&) {
        // No other live worker to retry on: the failure stays with this candidate
        return result;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++retries_;
    }
    return run_on(second, allocation, timeout);
}

std::vector<EvaluationResult> WorkerPool::evaluate_batch(
    const std::vector<Allocation>& allocations,
    Millis timeout
) {
    std::vector<EvaluationResult> results(allocations.size());
    if (allocations.empty()) {
        return results;
    }

    const int n = static_cast<int>(allocations.size());
    std::exception_ptr error;

#ifdef _OPENMP
    const int n_threads = std::max(1, std::min(static_cast<int>(slots_.size()), n));
    #pragma omp parallel for schedule(dynamic) num_threads(n_threads)
#endif
    for (int i = 0; i < n; ++i) {
        try {
            results[static_cast<size_t>(i)] = evaluate(allocations[static_cast<size_t>(i)], timeout);
        } catch (const std::exception&) {
#ifdef _OPENMP
            #pragma omp critical(graph_alloc_worker_pool_error)
#endif
            {
                if (!error) {
                    error = std::current_exception();
                }
            }
        }
    }

    if (error) {
        std::rethrow_exception(error);
    }
    return results;
}

bool WorkerPool::restart(size_t index) {
    try {
        slots_[index].worker->start();
        return true;
    } catch (const WorkerError& e) {
        std::cerr << "[WorkerPool] ERROR: restart of worker " << index << " failed: " << e.what() << "\n";
        return false;
    }
}

void WorkerPool::maintain() {
    bool any_dead = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return;
        }
        for (const auto& slot : slots_) {
            any_dead = any_dead || slot.state == SlotState::Dead;
        }
    }
    if (any_dead) {
        (void)health_check();
    }
}

WorkerPool::HealthReport WorkerPool::health_check() {
    HealthReport report;
    std::vector<size_t> to_ping;
    std::vector<size_t> to_restart;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return report;
        }
        report.checked = static_cast<int>(slots_.size());
        for (size_t i = 0; i < slots_.size(); ++i) {
            switch (slots_[i].state) {
                case SlotState::Idle:
                    slots_[i].state = SlotState::Busy;
                    to_ping.push_back(i);
                    break;
                case SlotState::Dead:
                    slots_[i].state = SlotState::Restarting;
                    to_restart.push_back(i);
                    break;
                case SlotState::Busy:
                    ++report.alive;
                    break;
                case SlotState::Restarting:
                    break;
            }
        }
    }

    std::vector<std::pair<size_t, bool>> outcome;
    for (size_t i : to_ping) {
        Worker& worker = *slots_[i].worker;
        if (worker.ping(config_.ping_timeout) && worker.is_running()) {
            ++report.alive;
            outcome.emplace_back(i, true);
        } else {
            std::cerr << "[WorkerPool] WARNING: worker " << i << " did not answer ping\n";
            worker.terminate();
            to_restart.push_back(i);
        }
    }
    for (size_t i : to_restart) {
        bool ok = restart(i);
        if (ok) {
            ++report.restarted;
            ++report.alive;
        } else {
            ++report.restart_failures;
        }
        outcome.emplace_back(i, ok);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [i, ok] : outcome) {
            slots_[i].state = ok ? SlotState::Idle : SlotState::Dead;
        }
        restarted_ += report.restarted;
        restart_failures_ += report.restart_failures;
    }
    available_.notify_all();

    if (config_.verbose) {
        std::cout << "[WorkerPool] health checked=" << report.checked
                  << " alive=" << report.alive
                  << " restarted=" << report.restarted
                  << " restart_failures=" << report.restart_failures << "\n";
    }
    return report;
}

void WorkerPool::shutdown() {
    uint64_t requests = 0;
    uint64_t failures = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        requests = requests_;
        failures = failures_;
    }
    available_.notify_all();

    for (auto& slot : slots_) {
        if (slot.worker) {
            slot.worker->stop();
        }
    }
    if (config_.verbose) {
        std::cout << "[WorkerPool] shutdown requests=" << requests << " failures=" << failures << "\n";
    }
}

WorkerPool::Stats WorkerPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats s;
    s.total = static_cast<int>(slots_.size());
    for (const auto& slot : slots_) {
        switch (slot.state) {
            case SlotState::Idle: ++s.alive; break;
            case SlotState::Busy: ++s.alive; ++s.busy; break;
            case SlotState::Dead: ++s.dead; break;
            case SlotState::Restarting: break;
        }
    }
    s.restarted = restarted_;
    s.restart_failures = restart_failures_;
    s.requests = requests_;
    s.failures = failures_;
    s.retries = retries_;
    return s;
}

std::vector<pid_t> WorkerPool::worker_pids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<pid_t> pids;
    for (const auto& slot : slots_) {
        bool alive = slot.state == SlotState::Idle || slot.state == SlotState::Busy;
        pids.push_back(alive ? slot.worker->pid() : -1);
    }
    return pids;
}

}  // namespace graph_alloc
