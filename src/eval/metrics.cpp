#include "graph_alloc/eval/metrics.hpp"
#include <cmath>

namespace graph_alloc {

namespace {

using MetricField = std::optional<double> Metrics::*;

MetricField named_field(std::string_view name) {
    if (name == "dps") return &Metrics::dps;
    if (name == "life") return &Metrics::life;
    if (name == "ehp") return &Metrics::ehp;
    if (name == "mana") return &Metrics::mana;
    if (name == "energy_shield") return &Metrics::energy_shield;
    if (name == "block") return &Metrics::block;
    if (name == "clear_speed") return &Metrics::clear_speed;
    return nullptr;
}

constexpr const char* NAMED_FIELDS[] = {
    "dps", "life", "ehp", "mana", "energy_shield", "block", "clear_speed"
};

}  // namespace

std::optional<double> Metrics::get(std::string_view name) const {
    if (auto field = named_field(name)) {
        return this->*field;
    }
    auto it = extra.find(std::string(name));
    if (it == extra.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Metrics::set(const std::string& name, double value) {
    if (auto field = named_field(name)) {
        this->*field = value;
    } else {
        extra[name] = value;
    }
}

std::optional<Metrics> Metrics::parse(const nlohmann::json& j, std::string& error) {
    if (!j.is_object()) {
        error = "metrics must be a JSON object";
        return std::nullopt;
    }

    Metrics metrics;
    for (const auto& [key, value] : j.items()) {
        if (!value.is_number()) {
            error = "metric '" + key + "' is not a number";
            return std::nullopt;
        }
        double v = value.get<double>();
        if (!std::isfinite(v)) {
            error = "metric '" + key + "' is not finite";
            return std::nullopt;
        }
        metrics.set(key, v);
    }
    return metrics;
}

nlohmann::json Metrics::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    for (const char* name : NAMED_FIELDS) {
        if (auto value = get(name)) {
            j[name] = *value;
        }
    }
    for (const auto& [key, value] : extra) {
        j[key] = value;
    }
    return j;
}

}  // namespace graph_alloc
