// graph/network.h - Runtime-constructed QoS network (CSR + attributes)
// Part of the QoS route search library (C++20)
//
// DESIGN RATIONALE:
// The network is built once from dynamic data (a generator, a CSV import,
// a test fixture) and is then immutable for the duration of every search
// that reads it.  Several solvers may share one network across threads.
//
// Storage is compressed sparse row: offsets_[u]..offsets_[u+1] index the
// arcs leaving u in targets_ and links_.  The CSR position of an arc is
// its edge_id, so per-arc attributes live in a parallel array and
// solver-local data can be keyed by edge_id without hashing.
//
// Node attributes (processing delay, reliability) are stored per node_id.
// The caller's integer node identifier is kept as a label; node_id is
// always the dense index.
//
// CONSTRUCTION:
//   network_builder collects nodes and links, then finalise() produces an
//   immutable qos_network.  Canonicalisation: arcs sorted by (src, dst),
//   duplicates removed (first added wins), self-loops removed.
//   An undirected builder (the default) stores every link as two arcs
//   carrying identical attributes.

#ifndef QOSROUTE_GRAPH_NETWORK_H
#define QOSROUTE_GRAPH_NETWORK_H

#include "graph_concepts.h"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace qosroute::graph {

// =============================================================================
// Attributes
// =============================================================================

/// Per-node QoS attributes.
struct node_attributes {
    double proc_delay = 0.0;   ///< processing delay, ms
    double reliability = 1.0;  ///< probability the node forwards correctly
};

/// Categorical link tag.  Carried for topology providers; never read by
/// the search.
enum class link_type : std::uint8_t {
    unspecified,
    fiber,
    microwave,
    satellite,
};

[[nodiscard]] constexpr std::string_view to_string(link_type t) noexcept {
    switch (t) {
        case link_type::fiber:     return "fiber";
        case link_type::microwave: return "microwave";
        case link_type::satellite: return "satellite";
        case link_type::unspecified: break;
    }
    return "unspecified";
}

/// Per-arc QoS attributes.
struct link_attributes {
    double bandwidth = 1.0;    ///< Mbps
    double link_delay = 0.0;   ///< ms
    double reliability = 1.0;
    link_type type = link_type::unspecified;
};

class network_builder;

// =============================================================================
// qos_network
// =============================================================================

/// Immutable CSR network with node and link attributes.
///
/// Constructed via network_builder::finalise() or derived from another
/// network by edge_subgraph / filter_by_bandwidth.
///
/// Example:
/// ```cpp
/// network_builder b;
/// auto a = b.add_node(10, {.proc_delay = 1.0, .reliability = 0.99});
/// auto c = b.add_node(20, {.proc_delay = 2.0, .reliability = 0.98});
/// b.add_link(a, c, {.bandwidth = 500, .link_delay = 5, .reliability = 0.99});
/// auto net = b.finalise();
/// ```
class qos_network {
public:
    qos_network() = default;

    // =========================================================================
    // Size queries
    // =========================================================================

    [[nodiscard]] std::size_t node_count() const noexcept { return V_; }
    [[nodiscard]] std::size_t edge_count() const noexcept { return E_; }
    [[nodiscard]] bool empty() const noexcept { return V_ == 0; }

    /// True if built by an undirected builder (every link stored as two arcs).
    [[nodiscard]] bool undirected() const noexcept { return undirected_; }

    [[nodiscard]] bool has_node(node_id u) const noexcept {
        return to_index(u) < V_;
    }

    // =========================================================================
    // Adjacency access
    // =========================================================================

    struct adjacency_range {
        node_id const* begin_;
        node_id const* end_;

        [[nodiscard]] node_id const* begin() const noexcept { return begin_; }
        [[nodiscard]] node_id const* end() const noexcept { return end_; }
        [[nodiscard]] std::size_t size() const noexcept {
            return static_cast<std::size_t>(end_ - begin_);
        }
        [[nodiscard]] bool empty() const noexcept { return begin_ == end_; }
    };

    /// Half-open range of edge_ids [first, last).
    struct edge_id_range {
        std::size_t first;
        std::size_t last;

        struct iterator {
            std::size_t pos;

            edge_id operator*() const noexcept { return edge_id{pos}; }
            iterator& operator++() noexcept { ++pos; return *this; }
            bool operator==(iterator const&) const = default;
        };

        [[nodiscard]] iterator begin() const noexcept { return {first}; }
        [[nodiscard]] iterator end() const noexcept { return {last}; }
        [[nodiscard]] std::size_t size() const noexcept { return last - first; }
        [[nodiscard]] bool empty() const noexcept { return first == last; }
    };

    [[nodiscard]] adjacency_range out_neighbors(node_id u) const noexcept {
        auto const idx = to_index(u);
        return {targets_.data() + offsets_[idx],
                targets_.data() + offsets_[idx + 1]};
    }

    [[nodiscard]] std::size_t out_degree(node_id u) const noexcept {
        auto const idx = to_index(u);
        return offsets_[idx + 1] - offsets_[idx];
    }

    [[nodiscard]] edge_id_range edge_range(node_id u) const noexcept {
        auto const idx = to_index(u);
        return {offsets_[idx], offsets_[idx + 1]};
    }

    [[nodiscard]] node_id edge_target(edge_id e) const noexcept {
        return targets_[to_index(e)];
    }

    /// Arc u->v, or invalid_edge.  O(log deg(u)); targets are sorted.
    [[nodiscard]] edge_id find_edge(node_id u, node_id v) const noexcept {
        if (!has_node(u) || !has_node(v)) return invalid_edge;
        auto const first = targets_.begin() +
            static_cast<std::ptrdiff_t>(offsets_[to_index(u)]);
        auto const last = targets_.begin() +
            static_cast<std::ptrdiff_t>(offsets_[to_index(u) + 1]);
        auto const it = std::lower_bound(first, last, v);
        if (it == last || *it != v) return invalid_edge;
        return edge_id{static_cast<std::size_t>(it - targets_.begin())};
    }

    [[nodiscard]] bool has_edge(node_id u, node_id v) const noexcept {
        return find_edge(u, v) != invalid_edge;
    }

    // =========================================================================
    // Attributes
    // =========================================================================

    [[nodiscard]] node_attributes const& node(node_id u) const {
        if (!has_node(u))
            throw std::out_of_range(
                fmt::format("qos_network: node {} not in network", u.value));
        return nodes_[to_index(u)];
    }

    [[nodiscard]] link_attributes const& link(edge_id e) const {
        if (to_index(e) >= E_)
            throw std::out_of_range(
                fmt::format("qos_network: edge {} out of bounds", e.value));
        return links_[to_index(e)];
    }

    /// Caller-facing identifier of u.
    [[nodiscard]] int label(node_id u) const {
        if (!has_node(u))
            throw std::out_of_range(
                fmt::format("qos_network: node {} not in network", u.value));
        return labels_[to_index(u)];
    }

    /// Node carrying the given label, or invalid_node.
    [[nodiscard]] node_id find_node(int label) const noexcept {
        auto const it = label_index_.find(label);
        return it == label_index_.end() ? invalid_node : it->second;
    }

    [[nodiscard]] topology_token token() const noexcept { return token_; }

private:
    std::size_t V_ = 0;
    std::size_t E_ = 0;
    bool undirected_ = true;
    std::vector<std::size_t> offsets_{0};
    std::vector<node_id> targets_;
    std::vector<link_attributes> links_;
    std::vector<node_attributes> nodes_;
    std::vector<int> labels_;
    std::unordered_map<int, node_id> label_index_;
    topology_token token_{};

    friend class network_builder;
};

static_assert(edge_indexed_graph<qos_network>);

// =============================================================================
// network_builder
// =============================================================================

/// Builder for qos_network.
///
/// Attribute validation happens at insertion: negative or non-finite
/// delays, bandwidths and reliabilities, or reliabilities above 1, throw
/// std::invalid_argument.  Zero reliability and zero bandwidth are
/// accepted; the cost model clamps them.
class network_builder {
public:
    enum class direction { undirected, directed };

    network_builder() = default;
    explicit network_builder(direction d) : direction_(d) {}

    /// Add a node labelled with its own index.
    [[nodiscard]] node_id add_node(node_attributes attrs = {}) {
        return add_node(static_cast<int>(nodes_.size()), attrs);
    }

    /// Add a node with an explicit caller label.  Labels must be unique.
    node_id add_node(int label, node_attributes attrs) {
        if (nodes_.size() >= 0xFFFF)
            throw std::length_error("network_builder: node count exceeds 65535");
        check_node(attrs);
        auto const id = node_id{static_cast<std::uint16_t>(nodes_.size())};
        auto const [it, inserted] = label_index_.emplace(label, id);
        if (!inserted)
            throw std::invalid_argument(
                fmt::format("network_builder: duplicate node label {}", label));
        nodes_.push_back(attrs);
        labels_.push_back(label);
        return id;
    }

    /// Add a link.  Undirected builders insert both arcs.
    void add_link(node_id u, node_id v, link_attributes attrs) {
        add_arc(u, v, attrs);
        if (direction_ == direction::undirected) add_arc(v, u, attrs);
    }

    /// Add a link between two labelled nodes.
    void add_link(int u_label, int v_label, link_attributes attrs) {
        add_link(resolve(u_label), resolve(v_label), attrs);
    }

    /// Add a single arc u->v regardless of builder direction.
    void add_arc(node_id u, node_id v, link_attributes attrs) {
        if (nodes_.empty())
            throw std::logic_error("network_builder: no nodes");
        if (to_index(u) >= nodes_.size())
            throw std::out_of_range("network_builder: source not in network");
        if (to_index(v) >= nodes_.size())
            throw std::out_of_range("network_builder: target not in network");
        check_link(attrs);
        arcs_.push_back(arc{u.value, v.value, attrs});
    }

    [[nodiscard]] std::size_t node_count() const noexcept { return nodes_.size(); }
    [[nodiscard]] std::size_t arc_count() const noexcept { return arcs_.size(); }

    /// Build the immutable qos_network.
    [[nodiscard]] qos_network finalise() const {
        qos_network g;
        g.V_ = nodes_.size();
        g.undirected_ = direction_ == direction::undirected;
        g.nodes_ = nodes_;
        g.labels_ = labels_;
        g.label_index_ = label_index_;

        auto sorted = arcs_;
        std::stable_sort(sorted.begin(), sorted.end(),
            [](arc const& a, arc const& b) {
                if (a.src != b.src) return a.src < b.src;
                return a.dst < b.dst;
            });

        // Drop self-loops and duplicates; the first arc added survives.
        std::vector<arc> clean;
        clean.reserve(sorted.size());
        for (auto const& a : sorted) {
            if (a.src == a.dst) continue;
            if (!clean.empty() && clean.back().src == a.src &&
                clean.back().dst == a.dst) continue;
            clean.push_back(a);
        }
        g.E_ = clean.size();

        g.offsets_.assign(g.V_ + 1, 0);
        for (auto const& a : clean) {
            g.offsets_[static_cast<std::size_t>(a.src) + 1]++;
        }
        for (std::size_t i = 1; i <= g.V_; ++i) {
            g.offsets_[i] += g.offsets_[i - 1];
        }

        g.targets_.resize(clean.size());
        g.links_.resize(clean.size());
        for (std::size_t i = 0; i < clean.size(); ++i) {
            g.targets_[i] = node_id{clean[i].dst};
            g.links_[i] = clean[i].attrs;
        }

        // FNV-1a 64-bit over the CSR structure.
        std::uint64_t h = 14695981039346656037ULL;
        auto mix = [&](std::uint64_t word) {
            h ^= word;
            h *= 1099511628211ULL;
        };
        mix(g.V_);
        mix(g.E_);
        for (auto const off : g.offsets_) mix(off);
        for (auto const t : g.targets_) mix(t.value);
        g.token_ = topology_token{h};

        return g;
    }

private:
    struct arc {
        std::uint16_t src;
        std::uint16_t dst;
        link_attributes attrs;
    };

    node_id resolve(int label) const {
        auto const it = label_index_.find(label);
        if (it == label_index_.end())
            throw std::out_of_range(
                fmt::format("network_builder: no node labelled {}", label));
        return it->second;
    }

    static void check_node(node_attributes const& a) {
        if (!std::isfinite(a.proc_delay) || a.proc_delay < 0.0)
            throw std::invalid_argument(fmt::format(
                "network_builder: invalid proc_delay {}", a.proc_delay));
        if (!std::isfinite(a.reliability) || a.reliability < 0.0 ||
            a.reliability > 1.0)
            throw std::invalid_argument(fmt::format(
                "network_builder: invalid node reliability {}", a.reliability));
    }

    static void check_link(link_attributes const& a) {
        if (!std::isfinite(a.bandwidth) || a.bandwidth < 0.0)
            throw std::invalid_argument(fmt::format(
                "network_builder: invalid bandwidth {}", a.bandwidth));
        if (!std::isfinite(a.link_delay) || a.link_delay < 0.0)
            throw std::invalid_argument(fmt::format(
                "network_builder: invalid link_delay {}", a.link_delay));
        if (!std::isfinite(a.reliability) || a.reliability < 0.0 ||
            a.reliability > 1.0)
            throw std::invalid_argument(fmt::format(
                "network_builder: invalid link reliability {}", a.reliability));
    }

    direction direction_ = direction::undirected;
    std::vector<node_attributes> nodes_;
    std::vector<int> labels_;
    std::unordered_map<int, node_id> label_index_;
    std::vector<arc> arcs_;
};

} // namespace qosroute::graph

#endif // QOSROUTE_GRAPH_NETWORK_H
