#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace graph_alloc {

// Metrics reported by an evaluator. Known metrics get named fields;
// anything else numeric lands in extra.
struct Metrics {
    std::optional<double> dps;
    std::optional<double> life;
    std::optional<double> ehp;
    std::optional<double> mana;
    std::optional<double> energy_shield;
    std::optional<double> block;
    std::optional<double> clear_speed;
    std::map<std::string, double> extra;

    // Lookup by wire name ("dps", "life", ..., or an extra key)
    [[nodiscard]] std::optional<double> get(std::string_view name) const;
    void set(const std::string& name, double value);

    // Validates a JSON object of name -> finite number.
    // Returns nullopt and fills error on the first invalid entry.
    [[nodiscard]] static std::optional<Metrics> parse(const nlohmann::json& j, std::string& error);

    [[nodiscard]] nlohmann::json to_json() const;

    bool operator==(const Metrics& other) const = default;
};

enum class EvalStatus {
    Ok,
    Timeout,       // no response within the call's timeout
    WorkerDied,    // channel closed or process gone mid-request
    BadResponse,   // response was not a valid result
    Rejected       // evaluator answered with an error, or constraints rejected the candidate
};

[[nodiscard]] constexpr const char* eval_status_name(EvalStatus status) {
    switch (status) {
        case EvalStatus::Ok: return "ok";
        case EvalStatus::Timeout: return "timeout";
        case EvalStatus::WorkerDied: return "worker_died";
        case EvalStatus::BadResponse: return "bad_response";
        case EvalStatus::Rejected: return "rejected";
    }
    return "unknown";
}

struct EvaluationResult {
    EvalStatus status{EvalStatus::Rejected};
    Metrics metrics;
    std::string error;

    [[nodiscard]] bool success() const { return status == EvalStatus::Ok; }

    // Failures that indicate a broken worker rather than a bad candidate
    [[nodiscard]] bool is_worker_failure() const {
        return status == EvalStatus::Timeout || status == EvalStatus::WorkerDied;
    }

    [[nodiscard]] static EvaluationResult ok(Metrics metrics) {
        return {EvalStatus::Ok, std::move(metrics), {}};
    }

    [[nodiscard]] static EvaluationResult failure(EvalStatus status, std::string error) {
        return {status, {}, std::move(error)};
    }
};

}  // namespace graph_alloc
