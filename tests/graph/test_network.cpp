// tests/graph/test_network.cpp
// Tests for qos_network and network_builder.
//
// Validates:
//   1. CSR canonicalisation: arcs sorted, duplicates dropped (first wins),
//      self-loops dropped
//   2. Undirected builder stores both arcs with identical attributes
//   3. Directed builder stores one arc
//   4. Labels: lookup, duplicate rejection, unknown labels
//   5. Attribute validation at insertion
//   6. find_edge / has_edge / edge_range agreement
//   7. Topology token determinism
//   8. Path helpers: remove_cycles, is_simple_path, is_valid_route,
//      path_signature, bottleneck_bandwidth, to_labels

#include "../test_networks.h"

#include <qosroute/graph/network.h>
#include <qosroute/graph/path.h>
#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace qosroute::graph;
using qosroute::test::make_diamond;
using qosroute::test::make_mesh;

namespace {

node_id n(std::uint16_t v) { return node_id{v}; }

} // namespace

// =========================================================================
// 1. Canonicalisation
// =========================================================================

TEST(QosNetwork, EmptyNetwork) {
    network_builder b;
    auto const g = b.finalise();
    EXPECT_TRUE(g.empty());
    EXPECT_EQ(g.node_count(), 0u);
    EXPECT_EQ(g.edge_count(), 0u);
}

TEST(QosNetwork, ArcsSortedByTarget) {
    network_builder b(network_builder::direction::directed);
    auto a = b.add_node();
    auto c = b.add_node();
    auto d = b.add_node();
    auto e = b.add_node();
    b.add_arc(a, e, {});
    b.add_arc(a, c, {});
    b.add_arc(a, d, {});
    auto const g = b.finalise();

    ASSERT_EQ(g.out_degree(a), 3u);
    std::vector<node_id> targets(g.out_neighbors(a).begin(), g.out_neighbors(a).end());
    EXPECT_EQ(targets, (std::vector<node_id>{c, d, e}));
}

TEST(QosNetwork, DuplicateKeepsFirstAttributes) {
    network_builder b(network_builder::direction::directed);
    auto a = b.add_node();
    auto c = b.add_node();
    b.add_arc(a, c, {.bandwidth = 100.0, .link_delay = 1.0});
    b.add_arc(a, c, {.bandwidth = 900.0, .link_delay = 9.0});
    auto const g = b.finalise();

    ASSERT_EQ(g.edge_count(), 1u);
    EXPECT_DOUBLE_EQ(g.link(g.find_edge(a, c)).bandwidth, 100.0);
    EXPECT_DOUBLE_EQ(g.link(g.find_edge(a, c)).link_delay, 1.0);
}

TEST(QosNetwork, SelfLoopsDropped) {
    network_builder b;
    auto a = b.add_node();
    auto c = b.add_node();
    b.add_link(a, a, {});
    b.add_link(a, c, {});
    auto const g = b.finalise();
    EXPECT_EQ(g.edge_count(), 2u);
    EXPECT_FALSE(g.has_edge(a, a));
}

// =========================================================================
// 2-3. Direction
// =========================================================================

TEST(QosNetwork, UndirectedBuilderMirrorsLinks) {
    auto const g = make_diamond();
    EXPECT_TRUE(g.undirected());
    EXPECT_EQ(g.node_count(), 4u);
    EXPECT_EQ(g.edge_count(), 8u);

    auto const fwd = g.find_edge(n(0), n(2));
    auto const back = g.find_edge(n(2), n(0));
    ASSERT_NE(fwd, invalid_edge);
    ASSERT_NE(back, invalid_edge);
    EXPECT_DOUBLE_EQ(g.link(fwd).bandwidth, g.link(back).bandwidth);
    EXPECT_DOUBLE_EQ(g.link(fwd).link_delay, g.link(back).link_delay);
    EXPECT_DOUBLE_EQ(g.link(fwd).reliability, g.link(back).reliability);
}

TEST(QosNetwork, DirectedBuilderSingleArc) {
    network_builder b(network_builder::direction::directed);
    auto a = b.add_node();
    auto c = b.add_node();
    b.add_link(a, c, {});
    auto const g = b.finalise();
    EXPECT_FALSE(g.undirected());
    EXPECT_TRUE(g.has_edge(a, c));
    EXPECT_FALSE(g.has_edge(c, a));
}

// =========================================================================
// 4. Labels
// =========================================================================

TEST(QosNetwork, LabelsResolve) {
    auto const g = make_mesh(10, 7);
    for (std::uint16_t i = 0; i < 10; ++i) {
        EXPECT_EQ(g.label(n(i)), 100 + i);
        EXPECT_EQ(g.find_node(100 + i), n(i));
    }
    EXPECT_EQ(g.find_node(5), invalid_node);
}

TEST(QosNetwork, DuplicateLabelThrows) {
    network_builder b;
    b.add_node(7, {});
    EXPECT_THROW(b.add_node(7, {}), std::invalid_argument);
}

TEST(QosNetwork, UnknownLabelLinkThrows) {
    network_builder b;
    b.add_node(1, {});
    EXPECT_THROW(b.add_link(1, 2, {}), std::out_of_range);
}

TEST(QosNetwork, ArcOutsideNetworkThrows) {
    network_builder b;
    EXPECT_THROW(b.add_arc(n(0), n(1), {}), std::logic_error);
    auto a = b.add_node();
    EXPECT_THROW(b.add_arc(a, n(5), {}), std::out_of_range);
}

TEST(QosNetwork, AttributeAccessOutOfRangeThrows) {
    auto const g = make_diamond();
    EXPECT_THROW((void)g.node(n(9)), std::out_of_range);
    EXPECT_THROW((void)g.link(edge_id{99}), std::out_of_range);
    EXPECT_THROW((void)g.label(n(9)), std::out_of_range);
}

// =========================================================================
// 5. Validation
// =========================================================================

TEST(QosNetwork, RejectsInvalidNodeAttributes) {
    network_builder b;
    EXPECT_THROW((void)b.add_node({.proc_delay = -1.0}), std::invalid_argument);
    EXPECT_THROW((void)b.add_node({.reliability = 1.5}), std::invalid_argument);
    EXPECT_THROW((void)b.add_node({.reliability = std::nan("")}), std::invalid_argument);
}

TEST(QosNetwork, RejectsInvalidLinkAttributes) {
    network_builder b;
    auto a = b.add_node();
    auto c = b.add_node();
    EXPECT_THROW(b.add_link(a, c, {.bandwidth = -5.0}), std::invalid_argument);
    EXPECT_THROW(b.add_link(a, c, {.link_delay = -0.1}), std::invalid_argument);
    EXPECT_THROW(b.add_link(a, c, {.reliability = -0.1}), std::invalid_argument);
    EXPECT_THROW(b.add_link(a, c, {.bandwidth = std::numeric_limits<double>::infinity()}),
                 std::invalid_argument);
}

TEST(QosNetwork, AcceptsZeroReliabilityAndBandwidth) {
    network_builder b;
    auto a = b.add_node({.reliability = 0.0});
    auto c = b.add_node();
    EXPECT_NO_THROW(b.add_link(a, c, {.bandwidth = 0.0, .reliability = 0.0}));
}

TEST(QosNetwork, LinkTypeCarried) {
    network_builder b;
    auto a = b.add_node();
    auto c = b.add_node();
    b.add_link(a, c, {.type = link_type::satellite});
    auto const g = b.finalise();
    EXPECT_EQ(g.link(g.find_edge(a, c)).type, link_type::satellite);
    EXPECT_EQ(to_string(link_type::satellite), "satellite");
}

// =========================================================================
// 6. Edge queries
// =========================================================================

TEST(QosNetwork, EdgeRangeMatchesNeighbours) {
    auto const g = make_mesh(15, 3);
    for (std::uint16_t u = 0; u < g.node_count(); ++u) {
        auto const nbrs = g.out_neighbors(n(u));
        auto const edges = g.edge_range(n(u));
        ASSERT_EQ(nbrs.size(), edges.size());
        std::size_t k = 0;
        for (auto e : edges) {
            EXPECT_EQ(g.edge_target(e), nbrs.begin()[k]);
            EXPECT_EQ(g.find_edge(n(u), g.edge_target(e)), e);
            ++k;
        }
    }
}

TEST(QosNetwork, FindEdgeMissing) {
    auto const g = make_diamond();
    EXPECT_EQ(g.find_edge(n(0), n(3)), invalid_edge);
    EXPECT_EQ(g.find_edge(n(0), n(40)), invalid_edge);
    EXPECT_FALSE(g.has_edge(n(1), n(2)));
}

// =========================================================================
// 7. Token
// =========================================================================

TEST(QosNetwork, TokenDeterministic) {
    EXPECT_EQ(make_mesh(12, 5).token(), make_mesh(12, 5).token());
    EXPECT_NE(make_mesh(12, 5).token(), make_mesh(12, 6).token());
}

// =========================================================================
// 8. Path helpers
// =========================================================================

TEST(PathHelpers, RemoveCyclesCutsLoops) {
    path const walk{n(0), n(1), n(2), n(1), n(3)};
    EXPECT_EQ(remove_cycles(walk), (path{n(0), n(1), n(3)}));

    path const nested{n(0), n(1), n(2), n(3), n(2), n(1), n(4)};
    EXPECT_EQ(remove_cycles(nested), (path{n(0), n(1), n(4)}));

    path const simple{n(0), n(1), n(2)};
    EXPECT_EQ(remove_cycles(simple), simple);
}

TEST(PathHelpers, SimpleAndValid) {
    auto const g = make_diamond();
    EXPECT_TRUE(is_simple_path(path{n(0), n(1), n(3)}));
    EXPECT_FALSE(is_simple_path(path{n(0), n(1), n(0)}));

    EXPECT_TRUE(is_valid_route(g, path{n(0), n(1), n(3)}, n(0), n(3)));
    EXPECT_FALSE(is_valid_route(g, path{n(0), n(3)}, n(0), n(3)));        // no arc
    EXPECT_FALSE(is_valid_route(g, path{n(0), n(1)}, n(0), n(3)));        // wrong end
    EXPECT_FALSE(is_valid_route(g, path{n(0)}, n(0), n(0)));              // too short
    EXPECT_FALSE(is_valid_route(g, path{n(0), n(1), n(0), n(2), n(3)}, n(0), n(3)));
}

TEST(PathHelpers, SignatureDistinguishesOrder) {
    EXPECT_EQ(path_signature(path{n(0), n(1), n(2)}),
              path_signature(path{n(0), n(1), n(2)}));
    EXPECT_NE(path_signature(path{n(0), n(1), n(2)}),
              path_signature(path{n(0), n(2), n(1)}));
}

TEST(PathHelpers, BottleneckAndLabels) {
    auto const g = make_diamond();
    path const p{n(0), n(2), n(3)};
    EXPECT_DOUBLE_EQ(bottleneck_bandwidth(g, p), 200.0);
    EXPECT_DOUBLE_EQ(bottleneck_bandwidth(g, path{n(0), n(3)}), 0.0);
    EXPECT_EQ(to_labels(g, p), (std::vector<int>{0, 2, 3}));
    EXPECT_EQ(hop_count(p), 2u);
}
