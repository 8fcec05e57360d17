// graph/shortest_path.h - Dijkstra, minimum-hop routing, reachability
// Part of the QoS route search library (C++20)
//
// ALGORITHM: Dijkstra with an index-based binary min-heap.
// Complexity: O((V + E) log V)
//
// The heap is index-based: a position array tracks where each node sits,
// enabling O(log V) decrease-key via sift-up.
//
// Weight input is a callable WeightFn(edge_id) -> double.  An arc whose
// weight is +infinity is treated as absent, which lets callers mask arcs
// without building a new network.  Weights must otherwise be
// non-negative.
//
// min_hop_path() is a breadth-first search with an arc-exclusion
// predicate; it is the "plain shortest path" used to seed simulated
// annealing and to re-route a removed segment.  Neighbours are visited in
// CSR order, so every routine here is deterministic.

#ifndef QOSROUTE_GRAPH_SHORTEST_PATH_H
#define QOSROUTE_GRAPH_SHORTEST_PATH_H

#include "graph_concepts.h"
#include "path.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <limits>
#include <optional>
#include <stdexcept>
#include <vector>

namespace qosroute::graph {

// =========================================================================
// Result type
// =========================================================================

/// Result of a single-source Dijkstra run.
///
/// - dist[n]: shortest distance from source (infinity if unreachable)
/// - pred[n]: predecessor on the shortest path (invalid_node if source or
///   unreachable)
/// - pred_edge[n]: arc used to reach n (invalid_edge likewise)
/// - verified: true once verify_shortest_path has confirmed optimality
struct shortest_path_result {
    std::vector<double> dist;
    std::vector<node_id> pred;
    std::vector<edge_id> pred_edge;
    node_id source = invalid_node;
    bool verified = false;
};

/// Walk predecessors back from target.  nullopt if target is unreachable
/// or equals the source.
[[nodiscard]] inline std::optional<path>
extract_path(shortest_path_result const& r, node_id target) {
    if (to_index(target) >= r.dist.size()) return std::nullopt;
    if (r.dist[to_index(target)] == std::numeric_limits<double>::infinity())
        return std::nullopt;
    if (target == r.source) return std::nullopt;

    path p;
    for (auto v = target; v != invalid_node; v = r.pred[to_index(v)]) {
        p.push_back(v);
        if (p.size() > r.dist.size())
            throw std::logic_error("extract_path: predecessor cycle");
    }
    std::reverse(p.begin(), p.end());
    return p;
}

// =========================================================================
// Verification
// =========================================================================

/// O(E) verification of shortest-path optimality.
///
/// Checks dist[source] == 0, the triangle inequality on every usable arc,
/// and that pred_edge agrees with dist.
template<edge_indexed_graph G, typename WeightFn>
[[nodiscard]] bool
verify_shortest_path(G const& g, WeightFn weight, shortest_path_result& result)
{
    constexpr double inf = std::numeric_limits<double>::infinity();
    auto const V = g.node_count();

    if (result.source == invalid_node || result.dist[to_index(result.source)] != 0.0) {
        result.verified = false;
        return false;
    }

    for (std::size_t u = 0; u < V; ++u) {
        auto const du = result.dist[u];
        if (du == inf) continue;
        auto const uid = node_id{static_cast<std::uint16_t>(u)};
        for (auto e : g.edge_range(uid)) {
            auto const w = weight(e);
            if (w == inf) continue;
            auto const v = to_index(g.edge_target(e));
            if (du + w < result.dist[v] - 1e-12) {
                result.verified = false;
                return false;
            }
        }
    }

    for (std::size_t v = 0; v < V; ++v) {
        auto const e = result.pred_edge[v];
        if (e == invalid_edge) continue;
        auto const p = to_index(result.pred[v]);
        auto const diff = result.dist[v] - (result.dist[p] + weight(e));
        if (diff < -1e-12 || diff > 1e-12) {
            result.verified = false;
            return false;
        }
    }

    result.verified = true;
    return true;
}

// =========================================================================
// Dijkstra's algorithm
// =========================================================================

/// Dijkstra's shortest path from a single source.
///
/// Preconditions:
/// - weight(e) >= 0 for every arc (infinity masks the arc)
/// - source is a node of g
///
/// Example:
/// ```cpp
/// auto r = dijkstra(net, src, [&](edge_id e) { return net.link(e).link_delay; });
/// auto route = extract_path(r, dst);
/// ```
template<edge_indexed_graph G, typename WeightFn>
[[nodiscard]] shortest_path_result
dijkstra(G const& g, node_id source, WeightFn weight) {
    constexpr double inf = std::numeric_limits<double>::infinity();
    auto const V = g.node_count();
    if (to_index(source) >= V)
        throw std::out_of_range("dijkstra: source not in graph");

    shortest_path_result result;
    result.dist.assign(V, inf);
    result.pred.assign(V, invalid_node);
    result.pred_edge.assign(V, invalid_edge);
    result.source = source;
    result.dist[to_index(source)] = 0.0;

    // =====================================================================
    // Index-based binary min-heap
    // =====================================================================
    //
    // heap[0..heap_size): node indices ordered by dist[].
    // pos[node]: index into heap[] (NOT_IN_HEAP once extracted).

    constexpr std::size_t NOT_IN_HEAP = ~std::size_t{0};
    std::vector<std::size_t> heap(V);
    std::vector<std::size_t> pos(V);
    for (std::size_t i = 0; i < V; ++i) {
        heap[i] = i;
        pos[i] = i;
    }
    std::size_t heap_size = V;

    auto heap_swap = [&](std::size_t a, std::size_t b) {
        auto const na = heap[a];
        auto const nb = heap[b];
        heap[a] = nb;
        heap[b] = na;
        pos[na] = b;
        pos[nb] = a;
    };

    auto sift_up = [&](std::size_t i) {
        while (i > 0) {
            std::size_t parent = (i - 1) / 2;
            if (result.dist[heap[i]] < result.dist[heap[parent]]) {
                heap_swap(i, parent);
                i = parent;
            } else {
                break;
            }
        }
    };

    auto sift_down = [&](std::size_t i) {
        while (true) {
            std::size_t smallest = i;
            std::size_t left = 2 * i + 1;
            std::size_t right = 2 * i + 2;
            if (left < heap_size &&
                result.dist[heap[left]] < result.dist[heap[smallest]]) {
                smallest = left;
            }
            if (right < heap_size &&
                result.dist[heap[right]] < result.dist[heap[smallest]]) {
                smallest = right;
            }
            if (smallest == i) break;
            heap_swap(i, smallest);
            i = smallest;
        }
    };

    // Only the source has a finite distance: one sift_up builds the heap.
    sift_up(pos[to_index(source)]);

    while (heap_size > 0) {
        auto const u = heap[0];
        heap_swap(0, heap_size - 1);
        pos[u] = NOT_IN_HEAP;
        --heap_size;
        if (heap_size > 0) sift_down(0);

        auto const du = result.dist[u];
        if (du == inf) break;  // remaining nodes unreachable

        auto const uid = node_id{static_cast<std::uint16_t>(u)};
        for (auto e : g.edge_range(uid)) {
            auto const w = weight(e);
            if (w == inf) continue;
            auto const v = to_index(g.edge_target(e));
            auto const nd = du + w;
            if (nd < result.dist[v]) {
                result.dist[v] = nd;
                result.pred[v] = uid;
                result.pred_edge[v] = e;
                if (pos[v] != NOT_IN_HEAP) sift_up(pos[v]);
            }
        }
    }

    (void)verify_shortest_path(g, weight, result);
    return result;
}

// =========================================================================
// Minimum-hop routing
// =========================================================================

/// Fewest-arc path from source to target, skipping arcs for which
/// excluded(edge_id) is true.  nullopt if none exists or source == target.
template<edge_indexed_graph G, typename ExcludeFn>
[[nodiscard]] std::optional<path>
min_hop_path(G const& g, node_id source, node_id target, ExcludeFn excluded) {
    auto const V = g.node_count();
    if (to_index(source) >= V || to_index(target) >= V) return std::nullopt;
    if (source == target) return std::nullopt;

    std::vector<node_id> pred(V, invalid_node);
    std::vector<bool> seen(V, false);
    std::deque<node_id> frontier{source};
    seen[to_index(source)] = true;

    while (!frontier.empty()) {
        auto const u = frontier.front();
        frontier.pop_front();
        for (auto e : g.edge_range(u)) {
            if (excluded(e)) continue;
            auto const v = g.edge_target(e);
            if (seen[to_index(v)]) continue;
            seen[to_index(v)] = true;
            pred[to_index(v)] = u;
            if (v == target) {
                path p;
                for (auto n = target; n != invalid_node; n = pred[to_index(n)])
                    p.push_back(n);
                std::reverse(p.begin(), p.end());
                return p;
            }
            frontier.push_back(v);
        }
    }
    return std::nullopt;
}

/// Fewest-arc path using every arc.
template<edge_indexed_graph G>
[[nodiscard]] std::optional<path>
min_hop_path(G const& g, node_id source, node_id target) {
    return min_hop_path(g, source, target, [](edge_id) { return false; });
}

/// True if target can be reached from source (source == target counts).
template<edge_indexed_graph G>
[[nodiscard]] bool is_reachable(G const& g, node_id source, node_id target) {
    if (to_index(source) >= g.node_count() || to_index(target) >= g.node_count())
        return false;
    if (source == target) return true;
    return min_hop_path(g, source, target).has_value();
}

} // namespace qosroute::graph

#endif // QOSROUTE_GRAPH_SHORTEST_PATH_H
