// graph/weighted_view.h - Network + edge weight view
// Part of the QoS route search library (C++20)
//
// BINDING MODEL:
// weighted_view is a non-owning view.  The network and edge_property_map
// must outlive the view.  The constructor checks:
//   1. weights.size() == network.edge_count()
//   2. weights.token() == network.token()
// A mismatch throws std::logic_error.
//
// The particle-swarm solver and the baseline route both run Dijkstra over
// a weighted_view: one view per reweighting, the network untouched.

#ifndef QOSROUTE_GRAPH_WEIGHTED_VIEW_H
#define QOSROUTE_GRAPH_WEIGHTED_VIEW_H

#include "edge_property_map.h"
#include "graph_concepts.h"

#include <cstddef>
#include <stdexcept>

namespace qosroute::graph {

/// Immutable non-owning view combining a network with edge weights.
template<edge_indexed_graph Graph, typename Weight>
class weighted_view {
    Graph const* graph_;
    edge_property_map<Weight> const* weights_;

public:
    using weight_type = Weight;

    weighted_view() = delete;

    weighted_view(Graph const& graph, edge_property_map<Weight> const& weights)
        : graph_(&graph), weights_(&weights)
    {
        if (weights.size() != graph.edge_count())
            throw std::logic_error(
                "weighted_view: weight map size != network edge count");
        if (!(weights.token() == graph.token()))
            throw std::logic_error(
                "weighted_view: topology token mismatch - "
                "weight map was built for a different network");
    }

    // -----------------------------------------------------------------
    // edge_indexed_graph forwarding
    // -----------------------------------------------------------------

    [[nodiscard]] std::size_t node_count() const noexcept {
        return graph_->node_count();
    }
    [[nodiscard]] std::size_t edge_count() const noexcept {
        return graph_->edge_count();
    }
    [[nodiscard]] auto out_neighbors(node_id u) const noexcept {
        return graph_->out_neighbors(u);
    }
    [[nodiscard]] auto edge_range(node_id u) const noexcept {
        return graph_->edge_range(u);
    }
    [[nodiscard]] node_id edge_target(edge_id e) const noexcept {
        return graph_->edge_target(e);
    }
    [[nodiscard]] topology_token token() const noexcept {
        return graph_->token();
    }

    // -----------------------------------------------------------------
    // Weight access
    // -----------------------------------------------------------------

    [[nodiscard]] Weight const& weight(edge_id e) const { return (*weights_)[e]; }

    /// Callable edge_id -> Weight for dijkstra().
    [[nodiscard]] auto weight_fn() const noexcept {
        return [w = weights_](edge_id e) -> Weight { return (*w)[e]; };
    }
};

} // namespace qosroute::graph

#endif // QOSROUTE_GRAPH_WEIGHTED_VIEW_H
