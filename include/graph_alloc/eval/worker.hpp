#pragma once

#include "evaluator.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace graph_alloc {

// One persistent evaluator process reached over a JSON-lines channel on its stdin/stdout.
//
// Protocol:
//   worker -> {"ready":true}                              once, after startup
//   {"id":n,"allocation":[...],"selections":{"id":e}}
//          -> {"id":n,"success":true,"metrics":{...}}
//           | {"id":n,"success":false,"error":"..."}
//   PING   -> {"pong":true}
//   EXIT   -> {"exit":true}, then the process exits
// Lines that are not JSON objects are worker log noise and are skipped.
class Worker {
public:
    struct Config {
        std::vector<std::string> command;       // argv, command[0] is looked up in PATH
        Millis startup_timeout{10000};
        Millis shutdown_timeout{1000};
        bool verbose{false};
    };

    Worker(int index, Config config);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    // Spawns the process and waits for the ready line. Throws WorkerError.
    void start();

    // Asks the process to exit, then kills it after shutdown_timeout
    void stop();

    // Kills the process immediately (hung or out-of-sync worker)
    void terminate();

    // Process exists and has not exited
    [[nodiscard]] bool is_running();

    [[nodiscard]] pid_t pid() const { return pid_; }
    [[nodiscard]] int index() const { return index_; }

    // One request/response exchange; holds the channel for its duration
    [[nodiscard]] EvaluationResult evaluate(const Allocation& allocation, Millis timeout);

    // Liveness probe. A channel busy with another exchange counts as alive.
    [[nodiscard]] bool ping(Millis timeout);

private:
    enum class ReadStatus { Line, Timeout, Closed };

    using Clock = std::chrono::steady_clock;

    [[nodiscard]] bool write_line(const std::string& line);
    [[nodiscard]] ReadStatus read_line(std::string& line, Clock::time_point deadline);

    // Next JSON object line before deadline, skipping noise
    [[nodiscard]] ReadStatus read_json(nlohmann::json& out, Clock::time_point deadline);

    void close_channel();
    void reap(bool force);

    int index_;
    Config config_;

    pid_t pid_{-1};
    int fd_{-1};
    std::string buffer_;
    uint64_t next_request_id_{1};

    std::mutex channel_mutex_;
};

}  // namespace graph_alloc
