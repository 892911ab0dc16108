#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <set>

namespace graph_alloc {

using NodeId = int32_t;
using EffectId = int32_t;

// Ordered so that iteration (and therefore every RNG-driven operator) is deterministic
using NodeSet = std::set<NodeId>;

constexpr NodeId INVALID_NODE = -1;

// Fitness assigned to candidates whose evaluation failed or was rejected
constexpr double FAILED_FITNESS = std::numeric_limits<double>::lowest();

enum class NodeType : uint8_t {
    Normal,
    Notable,
    Keystone,
    Socket,
    Mastery,
    Root
};

[[nodiscard]] constexpr const char* node_type_name(NodeType type) {
    switch (type) {
        case NodeType::Normal: return "normal";
        case NodeType::Notable: return "notable";
        case NodeType::Keystone: return "keystone";
        case NodeType::Socket: return "socket";
        case NodeType::Mastery: return "mastery";
        case NodeType::Root: return "root";
    }
    return "unknown";
}

enum class Attribute : uint8_t {
    Strength = 0,
    Dexterity = 1,
    Intelligence = 2
};

constexpr size_t NUM_ATTRIBUTES = 3;

using AttributeArray = std::array<float, NUM_ATTRIBUTES>;

[[nodiscard]] constexpr const char* attribute_name(Attribute attribute) {
    switch (attribute) {
        case Attribute::Strength: return "strength";
        case Attribute::Dexterity: return "dexterity";
        case Attribute::Intelligence: return "intelligence";
    }
    return "unknown";
}

// How an optimization run ended
enum class RunStatus {
    Completed,   // iteration / generation cap reached
    Converged,   // stopped early, no further improvement
    Aborted      // systemic failure, result holds the best found so far
};

[[nodiscard]] constexpr const char* run_status_name(RunStatus status) {
    switch (status) {
        case RunStatus::Completed: return "completed";
        case RunStatus::Converged: return "converged";
        case RunStatus::Aborted: return "aborted";
    }
    return "unknown";
}

}  // namespace graph_alloc
