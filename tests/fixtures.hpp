#pragma once

#include "graph_alloc/graph_alloc.hpp"

#include <atomic>

namespace graph_alloc::testing {

//        7 - 8 - 9
//        |       |
//        0 - 1 - 2 - 3
//        |
//        4 - 5 - 6
//
// 1 grants 10 strength, 6 grants 10 dexterity, 4 is a socket, 5 a mastery
// with effects {1, 2, 3}, 3 a notable and 7 a keystone.
inline TreeGraph make_small_graph() {
    TreeGraph graph;
    auto node = [&](NodeId id, NodeType type) {
        NodeMeta meta;
        meta.id = id;
        meta.type = type;
        meta.name = "n" + std::to_string(id);
        meta.tags["weight"] = static_cast<float>(id);
        return meta;
    };

    graph.add_node(node(0, NodeType::Root));
    auto strength = node(1, NodeType::Normal);
    strength.attributes[static_cast<size_t>(Attribute::Strength)] = 10.0f;
    graph.add_node(strength);
    graph.add_node(node(2, NodeType::Normal));
    graph.add_node(node(3, NodeType::Notable));
    graph.add_node(node(4, NodeType::Socket));
    auto mastery = node(5, NodeType::Mastery);
    mastery.effects = {1, 2, 3};
    graph.add_node(mastery);
    auto dexterity = node(6, NodeType::Normal);
    dexterity.attributes[static_cast<size_t>(Attribute::Dexterity)] = 10.0f;
    graph.add_node(dexterity);
    graph.add_node(node(7, NodeType::Keystone));
    graph.add_node(node(8, NodeType::Normal));
    graph.add_node(node(9, NodeType::Normal));

    graph.add_edge(0, 1);
    graph.add_edge(1, 2);
    graph.add_edge(2, 3);
    graph.add_edge(3, 9);
    graph.add_edge(0, 7);
    graph.add_edge(7, 8);
    graph.add_edge(8, 9);
    graph.add_edge(0, 4);
    graph.add_edge(4, 5);
    graph.add_edge(5, 6);
    return graph;
}

// Deterministic in-process oracle: dps is the summed "weight" tag plus the
// selected effects, life counts nodes, ehp favours low node ids.
inline FunctionEvaluator make_weight_evaluator(const TreeGraph& graph) {
    return FunctionEvaluator([&graph](const Allocation& allocation) {
        Metrics m;
        double dps = 0.0;
        double ehp = 0.0;
        for (NodeId id : allocation.nodes) {
            dps += graph.metadata(id).tag("weight");
            ehp += 1000.0 / (1.0 + id);
        }
        for (const auto& [node, effect] : allocation.selections) {
            dps += effect;
        }
        m.dps = dps;
        m.life = 10.0 * static_cast<double>(allocation.size());
        m.ehp = ehp;
        return EvaluationResult::ok(m);
    });
}

// Forwards to inner until limit evaluations were made, then reports the
// evaluator as gone for good.
class LimitedEvaluator : public Evaluator {
public:
    LimitedEvaluator(Evaluator& inner, uint64_t limit) : inner_(inner), limit_(limit) {}

    [[nodiscard]] EvaluationResult evaluate(const Allocation& allocation, Millis timeout) override {
        if (calls_++ >= limit_) {
            throw EvaluatorUnavailable("evaluator went away");
        }
        return inner_.evaluate(allocation, timeout);
    }

    [[nodiscard]] uint64_t calls() const { return calls_.load(); }

private:
    Evaluator& inner_;
    uint64_t limit_;
    std::atomic<uint64_t> calls_{0};
};

}  // namespace graph_alloc::testing
