#include "graph_alloc/eval/worker.hpp"
#include "graph_alloc/core/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <thread>

#include <poll.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

namespace graph_alloc {

namespace {

bool flag(const nlohmann::json& msg, const char* key) {
    auto it = msg.find(key);
    return it != msg.end() && it->is_boolean() && it->get<bool>();
}

}  // namespace

Worker::Worker(int index, Config config) : index_(index), config_(std::move(config)) {}

Worker::~Worker() {
    stop();
}

void Worker::start() {
    if (config_.command.empty()) {
        throw WorkerError("Worker command is empty");
    }
    if (pid_ > 0 || fd_ >= 0) {
        stop();
    }

    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
        throw WorkerError(std::string("socketpair failed: ") + std::strerror(errno));
    }

    // Built before fork: the child may only call async-signal-safe functions
    std::vector<char*> argv;
    for (auto& arg : config_.command) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        throw WorkerError(std::string("fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        // stdin and stdout become the channel, stderr is inherited
        ::dup2(fds[1], STDIN_FILENO);
        ::dup2(fds[1], STDOUT_FILENO);
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    ::close(fds[1]);
    fd_ = fds[0];
    pid_ = pid;
    buffer_.clear();

    auto deadline = Clock::now() + config_.startup_timeout;
    for (;;) {
        nlohmann::json msg;
        ReadStatus status = read_json(msg, deadline);
        if (status != ReadStatus::Line) {
            terminate();
            throw WorkerError(
                "Worker " + std::to_string(index_) + " did not become ready ("
                + (status == ReadStatus::Timeout ? "timeout" : "exited") + ")");
        }
        if (flag(msg, "ready")) {
            break;
        }
    }

    if (config_.verbose) {
        std::cout << "[Worker] index=" << index_ << " pid=" << pid_ << " ready\n";
    }
}

void Worker::stop() {
    std::lock_guard<std::mutex> lock(channel_mutex_);
    if (pid_ > 0 && fd_ >= 0 && write_line("EXIT")) {
        reap(false);
    } else {
        reap(true);
    }
    close_channel();
}

void Worker::terminate() {
    std::lock_guard<std::mutex> lock(channel_mutex_);
    reap(true);
    close_channel();
}

bool Worker::is_running() {
    if (pid_ <= 0) {
        return false;
    }
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == 0) {
        return true;
    }
    // Exited (or not our child any more): the channel is useless
    pid_ = -1;
    close_channel();
    return false;
}

void Worker::close_channel() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    buffer_.clear();
}

void Worker::reap(bool force) {
    if (pid_ <= 0) {
        return;
    }
    int status = 0;

    if (!force) {
        auto deadline = Clock::now() + config_.shutdown_timeout;
        while (Clock::now() < deadline) {
            pid_t r = ::waitpid(pid_, &status, WNOHANG);
            if (r == pid_ || r < 0) {
                pid_ = -1;
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    ::kill(pid_, SIGKILL);
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
    pid_ = -1;
}

bool Worker::write_line(const std::string& line) {
    if (fd_ < 0) {
        return false;
    }
    std::string data = line + "\n";
    const char* ptr = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        // MSG_NOSIGNAL: a dead peer yields EPIPE instead of SIGPIPE
        ssize_t n = ::send(fd_, ptr, remaining, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        ptr += n;
        remaining -= static_cast<size_t>(n);
    }
    return true;
}

Worker::ReadStatus Worker::read_line(std::string& line, Clock::time_point deadline) {
    for (;;) {
        auto pos = buffer_.find('\n');
        if (pos != std::string::npos) {
            line = buffer_.substr(0, pos);
            buffer_.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return ReadStatus::Line;
        }
        if (fd_ < 0) {
            return ReadStatus::Closed;
        }

        auto now = Clock::now();
        if (now >= deadline) {
            return ReadStatus::Timeout;
        }
        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();

        pollfd pfd{fd_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(std::max<long long>(1, wait)));
        if (rc < 0) {
            if (errno == EINTR) continue;
            return ReadStatus::Closed;
        }
        if (rc == 0) {
            continue;
        }

        char chunk[4096];
        ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return ReadStatus::Closed;
        }
        if (n == 0) {
            return ReadStatus::Closed;
        }
        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

Worker::ReadStatus Worker::read_json(nlohmann::json& out, Clock::time_point deadline) {
    std::string line;
    for (;;) {
        ReadStatus status = read_line(line, deadline);
        if (status != ReadStatus::Line) {
            return status;
        }
        auto msg = nlohmann::json::parse(line, nullptr, false);
        if (msg.is_discarded() || !msg.is_object()) {
            if (config_.verbose) {
                std::cout << "[Worker] index=" << index_ << " skipped: " << line << "\n";
            }
            continue;
        }
        out = std::move(msg);
        return ReadStatus::Line;
    }
}

EvaluationResult Worker::evaluate(const Allocation& allocation, Millis timeout) {
    std::lock_guard<std::mutex> lock(channel_mutex_);
    if (fd_ < 0) {
        return EvaluationResult::failure(EvalStatus::WorkerDied, "worker is not running");
    }

    uint64_t id = next_request_id_++;
    nlohmann::json request;
    request["id"] = id;
    request["allocation"] = nlohmann::json::array();
    for (NodeId node : allocation.nodes) {
        request["allocation"].push_back(node);
    }
    request["selections"] = nlohmann::json::object();
    for (const auto& [node, effect] : allocation.selections) {
        request["selections"][std::to_string(node)] = effect;
    }

    if (!write_line(request.dump())) {
        return EvaluationResult::failure(EvalStatus::WorkerDied, "failed to write request");
    }

    auto deadline = Clock::now() + timeout;
    for (;;) {
        nlohmann::json msg;
        ReadStatus status = read_json(msg, deadline);
        if (status == ReadStatus::Timeout) {
            return EvaluationResult::failure(
                EvalStatus::Timeout, "no response within " + std::to_string(timeout.count()) + " ms");
        }
        if (status == ReadStatus::Closed) {
            return EvaluationResult::failure(EvalStatus::WorkerDied, "worker closed the channel");
        }

        // Late answer to an earlier, abandoned request
        if (msg.contains("id") && msg["id"] != nlohmann::json(id)) {
            continue;
        }
        auto success = msg.find("success");
        if (success == msg.end()) {
            continue;
        }
        if (!success->is_boolean()) {
            return EvaluationResult::failure(EvalStatus::BadResponse, "'success' is not a boolean");
        }

        if (!success->get<bool>()) {
            auto error = msg.find("error");
            std::string message = (error != msg.end() && error->is_string())
                ? error->get<std::string>()
                : std::string("evaluation failed");
            return EvaluationResult::failure(EvalStatus::Rejected, message);
        }

        auto metrics_json = msg.find("metrics");
        if (metrics_json == msg.end()) {
            return EvaluationResult::failure(EvalStatus::BadResponse, "response has no metrics");
        }
        std::string parse_error;
        auto metrics = Metrics::parse(*metrics_json, parse_error);
        if (!metrics) {
            return EvaluationResult::failure(EvalStatus::BadResponse, parse_error);
        }
        return EvaluationResult::ok(std::move(*metrics));
    }
}

bool Worker::ping(Millis timeout) {
    std::unique_lock<std::mutex> lock(channel_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return true;
    }
    if (fd_ < 0 || !write_line("PING")) {
        return false;
    }

    auto deadline = Clock::now() + timeout;
    for (;;) {
        nlohmann::json msg;
        if (read_json(msg, deadline) != ReadStatus::Line) {
            return false;
        }
        if (flag(msg, "pong")) {
            return true;
        }
    }
}

}  // namespace graph_alloc
