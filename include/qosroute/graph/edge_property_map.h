// graph/edge_property_map.h - External property map for network arcs
// Part of the QoS route search library (C++20)
//
// DESIGN RATIONALE:
// Solver-specific edge data (particle priorities, static baseline costs)
// lives outside the network.  A map is created at the start of a solver
// call, filled, read through weighted_view, and discarded at the end.
// The shared network is never annotated.
//
// BINDING INVARIANT:
// Each edge_property_map records the topology_token and edge_count of the
// network it was built for.  weighted_view checks both at construction,
// turning "weights silently wrong after a filter" into an immediate
// std::logic_error.

#ifndef QOSROUTE_GRAPH_EDGE_PROPERTY_MAP_H
#define QOSROUTE_GRAPH_EDGE_PROPERTY_MAP_H

#include "graph_concepts.h"

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace qosroute::graph {

/// External property map: edge CSR position -> Value.
template<typename Value>
class edge_property_map {
    std::vector<Value> data_;
    topology_token token_{};

public:
    edge_property_map() = default;

    /// Construct with token binding.
    edge_property_map(std::size_t n, Value default_val, topology_token tok)
        : data_(n, default_val), token_(tok)
    {}

    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] topology_token token() const noexcept { return token_; }

    Value& operator[](edge_id e) {
        if (e.value >= data_.size())
            throw std::out_of_range("edge_property_map: edge_id out of bounds");
        return data_[e.value];
    }

    Value const& operator[](edge_id e) const {
        if (e.value >= data_.size())
            throw std::out_of_range("edge_property_map: edge_id out of bounds");
        return data_[e.value];
    }

    [[nodiscard]] bool operator==(edge_property_map const&) const = default;
};

// =========================================================================
// Factories - these bind the topology token automatically
// =========================================================================

/// Create an edge_property_map with uniform initial value, bound to g.
template<typename Value, edge_indexed_graph G>
[[nodiscard]] edge_property_map<Value>
make_uniform_edge_map(G const& g, Value const& val) {
    return edge_property_map<Value>(g.edge_count(), val, g.token());
}

/// Create an edge_property_map by applying fn(edge_id) to every arc of g.
template<typename Value, edge_indexed_graph G, typename Fn>
[[nodiscard]] edge_property_map<Value>
make_edge_map(G const& g, Fn&& fn) {
    edge_property_map<Value> emap(g.edge_count(), Value{}, g.token());
    for (std::size_t i = 0; i < g.edge_count(); ++i) {
        emap[edge_id{i}] = fn(edge_id{i});
    }
    return emap;
}

} // namespace qosroute::graph

#endif // QOSROUTE_GRAPH_EDGE_PROPERTY_MAP_H
