// tests/solver/test_particle_swarm.cpp
// Tests for swarm_search and priority decoding.
//
// Validates:
//   1. Single-link network returns the only route
//   2. Diamond under delay weights picks the fast branch
//   3. Bandwidth-disconnected demand is infeasible
//   4. Invalid priority bounds are rejected
//   5. Mesh routes are simple and bandwidth-feasible
//   6. Global-best convergence never increases
//   7. Decoding follows the lowest-priority head nodes
//   8. Same seed, same result
//   9. Cancellation mid-run keeps the best route found so far

#include "../test_networks.h"

#include <qosroute/core/cancel_token.h>
#include <qosroute/graph/bandwidth_filter.h>
#include <qosroute/solver/algorithms/particle_swarm.h>
#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <thread>

using namespace qosroute;
using graph::node_id;
using graph::path;
using qosroute::test::make_bottleneck;
using qosroute::test::make_diamond;
using qosroute::test::make_mesh;
using qosroute::test::make_trivial;

namespace {

node_id n(std::uint16_t v) { return node_id{v}; }

swarm_params seeded(std::uint64_t seed) {
    swarm_params p;
    p.seed = seed;
    return p;
}

} // namespace

TEST(SwarmSearch, TrivialNetwork) {
    auto const g = make_trivial();
    auto const r = swarm_search(g, {n(0), n(1), 100.0}, qos_weights{}, seeded(1));
    ASSERT_TRUE(r.is_found()) << r.message;
    EXPECT_EQ(r.route, (path{n(0), n(1)}));
    EXPECT_EQ(r.stats.iterations, 25u);
    EXPECT_EQ(r.stats.candidates_total, 25u * 30u);
}

TEST(SwarmSearch, DiamondPrefersFastBranch) {
    auto const g = make_diamond();
    auto const r = swarm_search(g, {n(0), n(3), 100.0}, qos_weights{}, seeded(2));
    ASSERT_TRUE(r.is_found());
    EXPECT_EQ(r.route, (path{n(0), n(1), n(3)}));
}

TEST(SwarmSearch, BandwidthDisconnectedIsInfeasible) {
    auto const g = make_bottleneck();
    auto const r = swarm_search(g, {n(0), n(1), 100.0}, qos_weights{}, seeded(3));
    EXPECT_EQ(r.status, search_status::infeasible_demand);
    EXPECT_TRUE(r.convergence.empty());
}

TEST(SwarmSearch, RejectsBadPriorityBounds) {
    auto const g = make_trivial();
    auto p = seeded(4);
    p.min_priority = 0.0;
    EXPECT_EQ(swarm_search(g, {n(0), n(1), 0.0}, qos_weights{}, p).status,
              search_status::invalid_input);
    p.min_priority = 2.0;
    EXPECT_EQ(swarm_search(g, {n(0), n(1), 0.0}, qos_weights{}, p).status,
              search_status::invalid_input);
    p = seeded(4);
    p.swarm_size = 0;
    EXPECT_EQ(swarm_search(g, {n(0), n(1), 0.0}, qos_weights{}, p).status,
              search_status::invalid_input);
}

TEST(SwarmSearch, PreCancelledReturnsCancelled) {
    auto const g = make_diamond();
    cancel_token token;
    token.request_cancel();
    auto const r = swarm_search(g, {n(0), n(3), 0.0}, qos_weights{}, seeded(5), &token);
    EXPECT_EQ(r.status, search_status::cancelled);
    EXPECT_EQ(r.stats.iterations, 0u);
}

TEST(SwarmSearch, CancelMidRunKeepsBestRoute) {
    auto const g = make_mesh(60, 7, 3);
    route_query const q{n(0), n(30), 100.0};
    auto p = seeded(62);
    p.iterations = 1'000'000;

    cancel_token token;
    std::thread canceller([&token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        token.request_cancel();
    });
    auto const r = swarm_search(g, q, qos_weights{0.5, 0.3, 0.2}, p, &token);
    canceller.join();

    ASSERT_TRUE(r.is_found()) << r.message;
    EXPECT_TRUE(graph::is_valid_route(g, r.route, q.source, q.target));
    EXPECT_GE(graph::bottleneck_bandwidth(g, r.route), q.bandwidth_demand);
    EXPECT_LT(r.stats.iterations, 1'000'000u);
}

TEST(SwarmSearch, MeshRoutesAreValidAndFeasible) {
    auto const g = make_mesh(40, 51);
    qos_weights const w{0.3, 0.5, 0.2};
    for (std::uint16_t t : {8, 19, 33}) {
        route_query const q{n(1), n(t), 400.0};
        auto const r = swarm_search(g, q, w, seeded(t));
        ASSERT_TRUE(r.is_found()) << "target " << t << ": " << r.message;
        EXPECT_TRUE(graph::is_valid_route(g, r.route, q.source, q.target));
        EXPECT_GE(graph::bottleneck_bandwidth(g, r.route), 400.0);
    }
}

TEST(SwarmSearch, GlobalBestNeverIncreases) {
    auto const g = make_mesh(35, 53);
    auto p = seeded(6);
    p.iterations = 40;
    auto const r = swarm_search(g, {n(0), n(18), 100.0}, qos_weights{0.5, 0.5, 0.0}, p);
    ASSERT_TRUE(r.is_found());
    ASSERT_EQ(r.convergence.size(), 40u);
    for (std::size_t i = 1; i < r.convergence.size(); ++i) {
        EXPECT_LE(r.convergence[i], r.convergence[i - 1]);
    }
    EXPECT_DOUBLE_EQ(r.convergence.back(), r.cost.fitness);
}

TEST(SwarmSearch, SameSeedSameResult) {
    auto const g = make_mesh(30, 57);
    route_query const q{n(3), n(25), 150.0};
    auto const a = swarm_search(g, q, qos_weights{}, seeded(77));
    auto const b = swarm_search(g, q, qos_weights{}, seeded(77));
    ASSERT_TRUE(a.is_found());
    EXPECT_EQ(a.route, b.route);
    EXPECT_EQ(a.convergence, b.convergence);
}

TEST(PriorityDecoding, LowPriorityNodesAreFavoured) {
    auto const g = make_diamond();
    auto scratch = graph::make_uniform_edge_map(g, 1.0);
    route_query const q{n(0), n(3), 0.0};

    auto const via2 = decode_priorities(g, q, {0.5, 0.9, 0.001, 0.5}, scratch);
    ASSERT_TRUE(via2.has_value());
    EXPECT_EQ(*via2, (path{n(0), n(2), n(3)}));

    auto const via1 = decode_priorities(g, q, {0.5, 0.001, 0.9, 0.5}, scratch);
    ASSERT_TRUE(via1.has_value());
    EXPECT_EQ(*via1, (path{n(0), n(1), n(3)}));
}

TEST(PriorityDecoding, ArcWeightIsHeadPriority) {
    auto const g = make_diamond();
    auto weights = graph::make_uniform_edge_map(g, 0.0);
    std::vector<double> const pos{0.1, 0.2, 0.3, 0.4};
    assign_priorities(g, pos, weights);
    for (std::size_t e = 0; e < g.edge_count(); ++e) {
        auto const id = graph::edge_id{e};
        EXPECT_DOUBLE_EQ(weights[id], pos[graph::to_index(g.edge_target(id))]);
    }
}
