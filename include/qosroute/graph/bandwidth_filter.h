// graph/bandwidth_filter.h - Arc-filtered subnetworks
// Part of the QoS route search library (C++20)
//
// ALGORITHM:
// Given a network G and a predicate P over edge_ids, produce G' with
// - every node of G, same node_id, same label, same attributes
// - every arc e of G with P(e) true, same attributes
//
// Unlike an induced subgraph nothing is renumbered, so a path found in G'
// is a path of G with identical node ids.  Edge ids are reassigned and
// G'.token() differs from G.token() whenever an arc was dropped.
//
// COMPLEXITY: O(V + E log E)
//
// filter_by_bandwidth is the feasibility filter every solver runs first:
// only arcs whose bandwidth meets the demand survive, and a demand whose
// endpoints are disconnected in the result is reported as infeasible
// rather than searched on the full network.

#ifndef QOSROUTE_GRAPH_BANDWIDTH_FILTER_H
#define QOSROUTE_GRAPH_BANDWIDTH_FILTER_H

#include "graph_concepts.h"
#include "network.h"

#include <cstddef>
#include <cstdint>

namespace qosroute::graph {

/// Keep every node and the arcs satisfying pred(edge_id).
template<typename Pred>
[[nodiscard]] qos_network edge_subgraph(qos_network const& g, Pred pred) {
    network_builder b(g.undirected() ? network_builder::direction::undirected
                                     : network_builder::direction::directed);
    for (std::size_t i = 0; i < g.node_count(); ++i) {
        auto const u = node_id{static_cast<std::uint16_t>(i)};
        b.add_node(g.label(u), g.node(u));
    }
    for (std::size_t i = 0; i < g.node_count(); ++i) {
        auto const u = node_id{static_cast<std::uint16_t>(i)};
        for (auto e : g.edge_range(u)) {
            if (pred(e)) b.add_arc(u, g.edge_target(e), g.link(e));
        }
    }
    return b.finalise();
}

/// Keep the arcs with bandwidth >= demand_bw.
[[nodiscard]] inline qos_network
filter_by_bandwidth(qos_network const& g, double demand_bw) {
    return edge_subgraph(g, [&](edge_id e) {
        return g.link(e).bandwidth >= demand_bw;
    });
}

} // namespace qosroute::graph

#endif // QOSROUTE_GRAPH_BANDWIDTH_FILTER_H
