#include "graph_alloc/core/allocation.hpp"
#include "graph_alloc/core/tree_graph.hpp"
#include <sstream>

namespace graph_alloc {

namespace {

// splitmix64 finalizer
uint64_t mix(uint64_t x) {
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

}  // namespace

void Allocation::add(NodeId id, const TreeGraph& graph) {
    nodes.insert(id);
    const auto& meta = graph.metadata(id);
    if (meta.has_effects() && !selections.count(id)) {
        selections[id] = meta.effects.front();
    }
}

void Allocation::remove(NodeId id) {
    nodes.erase(id);
    selections.erase(id);
}

void Allocation::prune_selections() {
    for (auto it = selections.begin(); it != selections.end();) {
        if (!nodes.count(it->first)) {
            it = selections.erase(it);
        } else {
            ++it;
        }
    }
}

uint64_t Allocation::canonical_hash() const {
    // Both containers iterate in key order, so equal allocations hash equally
    uint64_t h = mix(nodes.size());
    for (NodeId id : nodes) {
        h = mix(h ^ static_cast<uint64_t>(static_cast<uint32_t>(id)));
    }
    h = mix(h ^ 0xa11ca7e5ULL ^ selections.size());
    for (const auto& [node, effect] : selections) {
        uint64_t pair = (static_cast<uint64_t>(static_cast<uint32_t>(node)) << 32)
                      | static_cast<uint32_t>(effect);
        h = mix(h ^ pair);
    }
    return h;
}

AllocationDiff diff(const Allocation& from, const Allocation& to) {
    AllocationDiff d;
    for (NodeId id : to.nodes) {
        if (!from.contains(id)) {
            d.added.push_back(id);
        }
    }
    for (NodeId id : from.nodes) {
        if (!to.contains(id)) {
            d.removed.push_back(id);
        }
    }
    for (const auto& [node, effect] : to.selections) {
        auto it = from.selections.find(node);
        if (it != from.selections.end() && it->second != effect) {
            d.reselected.push_back(node);
        }
    }
    return d;
}

std::string to_string(const Allocation& allocation) {
    std::ostringstream oss;
    oss << "Allocation(nodes=" << allocation.size()
        << ", selections=" << allocation.selections.size() << ")";
    return oss.str();
}

}  // namespace graph_alloc
