// graph/graph_concepts.h - Descriptor types and graph concepts
// Part of the QoS route search library (C++20)
//
// DESIGN RATIONALE:
// Descriptors are opaque handles.  node_id is a dense index into the
// network's attribute arrays; the caller's own node numbering is kept
// separately as a label (see qos_network::label / find_node).
//
// edge_id is the CSR position of a directed arc.  Solver-local edge data
// (priorities, static costs, exclusion masks) is keyed by edge_id and
// bound to the topology_token of the network it was built for, so the
// shared network is never used as scratch space.
//
// DESIGN LIMIT: node ids are uint16_t and 0xFFFF is invalid_node, so a
// network holds at most 65,535 routers.

#ifndef QOSROUTE_GRAPH_CONCEPTS_H
#define QOSROUTE_GRAPH_CONCEPTS_H

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>

namespace qosroute::graph {

// =============================================================================
// Descriptor Types
// =============================================================================

/// Router index within a qos_network (0-based, dense).
///
/// Valid for the network that produced it and for every network derived
/// from it by edge filtering (filtering preserves node ids).
struct node_id {
    std::uint16_t value{};

    friend constexpr bool operator==(node_id, node_id) = default;
    friend constexpr auto operator<=>(node_id, node_id) = default;
};

/// Index into per-node vectors.
[[nodiscard]] constexpr std::size_t to_index(node_id n) noexcept {
    return static_cast<std::size_t>(n.value);
}

/// Returned by label lookups that miss; never a valid router.
inline constexpr node_id invalid_node{std::uint16_t{0xFFFF}};

/// Arc position in the CSR targets array of one network.
///
/// Edge IDs are NOT stable across network construction or filtering.
/// Use topology_token to detect stale IDs.
struct edge_id {
    std::size_t value{};

    friend constexpr bool operator==(edge_id, edge_id) = default;
    friend constexpr auto operator<=>(edge_id, edge_id) = default;
};

/// Index into per-arc vectors.
[[nodiscard]] constexpr std::size_t to_index(edge_id e) noexcept {
    return e.value;
}

/// Returned by find_edge when two routers are not adjacent.
inline constexpr edge_id invalid_edge{~std::size_t{0}};

/// Topology token - lightweight fingerprint of network structure.
///
/// Derived from the CSR content (node count, edge count, offsets and
/// targets).  A filtered network has a different token from its parent
/// unless the filter kept every arc.
struct topology_token {
    std::uint64_t value{};

    friend constexpr bool operator==(topology_token, topology_token) = default;
};

// =============================================================================
// Graph Concepts
// =============================================================================

/// Immutable adjacency queries.
template<typename G>
concept graph_queryable =
    requires(G const& g, node_id u) {
        { g.node_count() } -> std::convertible_to<std::size_t>;
        { g.out_neighbors(u) };
    };

/// Adjacency with CSR edge identities: edge_range(u) yields edge_ids and
/// edge_target(e) resolves the head of each arc.  Required by every
/// algorithm that consumes per-edge data.
template<typename G>
concept edge_indexed_graph =
    graph_queryable<G> &&
    requires(G const& g, node_id u, edge_id e) {
        { g.edge_count() } -> std::convertible_to<std::size_t>;
        { g.edge_range(u) };
        { g.edge_target(e) } -> std::same_as<node_id>;
        { g.token() } -> std::same_as<topology_token>;
    };

} // namespace qosroute::graph

#endif // QOSROUTE_GRAPH_CONCEPTS_H
