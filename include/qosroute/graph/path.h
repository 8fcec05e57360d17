// graph/path.h - Route representation and structural checks
// Part of the QoS route search library (C++20)
//
// A path is an ordered node sequence, source first, target last.  Every
// route a solver returns must be simple (no repeated node) and
// edge-connected in the network the search ran on.  Splicing operators
// (crossover, mutation, segment re-route) may produce a walk that revisits
// a node; remove_cycles() cuts such loops without breaking connectivity.

#ifndef QOSROUTE_GRAPH_PATH_H
#define QOSROUTE_GRAPH_PATH_H

#include "graph_concepts.h"
#include "network.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace qosroute::graph {

using path = std::vector<node_id>;

/// Number of arcs on p.
[[nodiscard]] inline std::size_t hop_count(path const& p) noexcept {
    return p.empty() ? 0 : p.size() - 1;
}

/// True if no node appears twice.
[[nodiscard]] inline bool is_simple_path(path const& p) {
    std::vector<std::uint16_t> seen;
    seen.reserve(p.size());
    for (auto n : p) seen.push_back(n.value);
    std::sort(seen.begin(), seen.end());
    return std::adjacent_find(seen.begin(), seen.end()) == seen.end();
}

/// True if every consecutive pair of p is an arc of g.
[[nodiscard]] inline bool is_connected_path(qos_network const& g, path const& p) {
    for (std::size_t i = 0; i + 1 < p.size(); ++i) {
        if (!g.has_edge(p[i], p[i + 1])) return false;
    }
    return true;
}

/// Full route contract: length >= 2, endpoints, simple, edge-connected.
[[nodiscard]] inline bool is_valid_route(qos_network const& g, path const& p,
                                         node_id source, node_id target) {
    return p.size() >= 2 && p.front() == source && p.back() == target &&
           is_simple_path(p) && is_connected_path(g, p);
}

/// Cut every loop out of a walk.  When a node reappears, everything after
/// its first occurrence is discarded before continuing, so consecutive
/// pairs of the result are consecutive pairs of the input.
[[nodiscard]] inline path remove_cycles(path const& walk) {
    path out;
    out.reserve(walk.size());
    for (auto n : walk) {
        auto const it = std::find(out.begin(), out.end(), n);
        if (it != out.end()) {
            out.erase(it + 1, out.end());
        } else {
            out.push_back(n);
        }
    }
    return out;
}

/// FNV-1a fingerprint of the node sequence (tabu memory key).
[[nodiscard]] inline std::uint64_t path_signature(path const& p) noexcept {
    std::uint64_t h = 14695981039346656037ULL;
    for (auto n : p) {
        h ^= static_cast<std::uint64_t>(n.value) + 1;
        h *= 1099511628211ULL;
    }
    return h;
}

/// Translate node ids to caller labels.
[[nodiscard]] inline std::vector<int> to_labels(qos_network const& g, path const& p) {
    std::vector<int> out;
    out.reserve(p.size());
    for (auto n : p) out.push_back(g.label(n));
    return out;
}

/// Minimum arc bandwidth along p (infinity for fewer than two nodes,
/// zero if an arc is missing).
[[nodiscard]] inline double bottleneck_bandwidth(qos_network const& g, path const& p) {
    double bw = std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i + 1 < p.size(); ++i) {
        auto const e = g.find_edge(p[i], p[i + 1]);
        if (e == invalid_edge) return 0.0;
        bw = std::min(bw, g.link(e).bandwidth);
    }
    return bw;
}

} // namespace qosroute::graph

#endif // QOSROUTE_GRAPH_PATH_H
