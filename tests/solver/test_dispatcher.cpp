// tests/solver/test_dispatcher.cpp
// Tests for parse_algorithm and solve().
//
// Validates:
//   1. Canonical names and aliases resolve case-insensitively
//   2. invalid_input for a null network, unknown labels, bad weights,
//      bad bandwidth and unknown algorithm names
//   3. Every algorithm finds the single link of the trivial network
//   4. Every algorithm reports infeasible_demand on the bottleneck
//   5. All-zero weights fall back to pure delay
//   6. Labels, hop count, bottleneck and the uniform K = 1 breakdown
//   7. A fixed seed override makes the run reproducible

#include "../test_networks.h"

#include <qosroute/solver/dispatcher.h>
#include <gtest/gtest.h>

#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace qosroute;
using qosroute::test::make_bottleneck;
using qosroute::test::make_diamond;
using qosroute::test::make_mesh;
using qosroute::test::make_trivial;

namespace {

constexpr std::array<algorithm, 5> all_algorithms{
    algorithm::genetic,
    algorithm::particle_swarm,
    algorithm::simulated_annealing,
    algorithm::q_learning,
    algorithm::baseline,
};

solver_params seeded(std::uint64_t seed) {
    solver_params p;
    p.seed = seed;
    return p;
}

} // namespace

// =========================================================================
// 1. Names
// =========================================================================

TEST(ParseAlgorithm, CanonicalNamesRoundTrip) {
    for (auto a : all_algorithms) {
        auto const parsed = parse_algorithm(to_string(a));
        ASSERT_TRUE(parsed.has_value()) << to_string(a);
        EXPECT_EQ(*parsed, a);
    }
}

TEST(ParseAlgorithm, AliasesAndCase) {
    EXPECT_EQ(parse_algorithm("GA"), algorithm::genetic);
    EXPECT_EQ(parse_algorithm("Genetic-Algorithm"), algorithm::genetic);
    EXPECT_EQ(parse_algorithm("pso"), algorithm::particle_swarm);
    EXPECT_EQ(parse_algorithm("Simulated Annealing"), algorithm::simulated_annealing);
    EXPECT_EQ(parse_algorithm("SA"), algorithm::simulated_annealing);
    EXPECT_EQ(parse_algorithm("Q-Learning"), algorithm::q_learning);
    EXPECT_EQ(parse_algorithm("ql"), algorithm::q_learning);
    EXPECT_EQ(parse_algorithm("Dijkstra"), algorithm::baseline);
    EXPECT_FALSE(parse_algorithm("ant_colony").has_value());
    EXPECT_FALSE(parse_algorithm("").has_value());
}

// =========================================================================
// 2. Input validation
// =========================================================================

TEST(Solve, NullNetworkIsInvalidInput) {
    auto const r = solve(nullptr, {0, 1, 10.0}, qos_weights{}, algorithm::genetic);
    EXPECT_EQ(r.status, search_status::invalid_input);
    EXPECT_EQ(r.algo, algorithm::genetic);
    EXPECT_TRUE(r.path.empty());
}

TEST(Solve, UnknownLabelIsInvalidInput) {
    auto const g = make_trivial();
    for (auto a : all_algorithms) {
        auto const r = solve(&g, {0, 42, 10.0}, qos_weights{}, a);
        EXPECT_EQ(r.status, search_status::invalid_input) << to_string(a);
        EXPECT_NE(r.message.find("42"), std::string::npos);
    }
}

TEST(Solve, BadWeightsAreInvalidInput) {
    auto const g = make_trivial();
    EXPECT_EQ(solve(&g, {0, 1, 10.0}, qos_weights{-1.0, 1.0, 1.0}, algorithm::baseline).status,
              search_status::invalid_input);
    EXPECT_EQ(solve(&g, {0, 1, 10.0}, qos_weights{std::nan(""), 0.0, 0.0},
                    algorithm::particle_swarm).status,
              search_status::invalid_input);
}

TEST(Solve, BadDemandIsInvalidInput) {
    auto const g = make_trivial();
    EXPECT_EQ(solve(&g, {0, 1, -5.0}, qos_weights{}, algorithm::baseline).status,
              search_status::invalid_input);
    EXPECT_EQ(solve(&g, {0, 1, std::numeric_limits<double>::infinity()}, qos_weights{},
                    algorithm::genetic).status,
              search_status::invalid_input);
    EXPECT_EQ(solve(&g, {1, 1, 10.0}, qos_weights{}, algorithm::q_learning).status,
              search_status::invalid_input);
}

TEST(Solve, UnknownAlgorithmNameIsInvalidInput) {
    auto const g = make_trivial();
    auto const r = solve(&g, {0, 1, 10.0}, qos_weights{}, "tabu_search");
    EXPECT_EQ(r.status, search_status::invalid_input);
    EXPECT_NE(r.message.find("tabu_search"), std::string::npos);

    auto const ok = solve(&g, {0, 1, 10.0}, qos_weights{}, "Dijkstra");
    EXPECT_TRUE(ok.ok());
    EXPECT_EQ(ok.algo, algorithm::baseline);
}

// =========================================================================
// 3-5. Every algorithm, small networks
// =========================================================================

TEST(Solve, EveryAlgorithmFindsTrivialRoute) {
    auto const g = make_trivial();
    for (auto a : all_algorithms) {
        auto const r = solve(&g, {0, 1, 100.0}, qos_weights{0.5, 0.3, 0.2}, a, seeded(1));
        ASSERT_TRUE(r.ok()) << to_string(a) << ": " << r.message;
        EXPECT_EQ(r.algo, a);
        EXPECT_EQ(r.path, (std::vector<int>{0, 1}));
        EXPECT_NEAR(r.total_delay, 5.0, 1e-9);
        EXPECT_NEAR(r.final_reliability_percent, 100.0 * 0.99 * 0.99 * 0.99, 1e-9);
        EXPECT_NEAR(r.resource_cost, 2.0, 1e-12);
        EXPECT_EQ(r.hop_count, 1u);
        EXPECT_DOUBLE_EQ(r.bottleneck_bandwidth, 500.0);
        EXPECT_GE(r.elapsed_ms, 0.0);
    }
}

TEST(Solve, EveryAlgorithmReportsInfeasibleDemand) {
    auto const g = make_bottleneck();
    for (auto a : all_algorithms) {
        auto const r = solve(&g, {0, 1, 100.0}, qos_weights{}, a, seeded(2));
        EXPECT_EQ(r.status, search_status::infeasible_demand) << to_string(a);
        EXPECT_TRUE(r.path.empty());
        EXPECT_FALSE(r.message.empty());
    }
}

TEST(Solve, ZeroWeightsFallBackToDelay) {
    auto const g = make_diamond();
    for (auto a : all_algorithms) {
        auto const r = solve(&g, {0, 3, 100.0}, qos_weights{0.0, 0.0, 0.0}, a, seeded(3));
        ASSERT_TRUE(r.ok()) << to_string(a);
        EXPECT_DOUBLE_EQ(r.fitness, r.total_delay);
    }
}

// =========================================================================
// 6-7. Result normalisation on a mesh
// =========================================================================

TEST(Solve, MeshResultsUseLabelsAndUniformBreakdown) {
    auto const g = make_mesh(35, 101);
    qos_weights const raw{2.0, 1.0, 1.0};
    auto const w = normalise(raw);
    for (auto a : all_algorithms) {
        auto const r = solve(&g, {100, 117, 250.0}, raw, a, seeded(4));
        ASSERT_TRUE(r.ok()) << to_string(a) << ": " << r.message;
        ASSERT_GE(r.path.size(), 2u);
        EXPECT_EQ(r.path.front(), 100);
        EXPECT_EQ(r.path.back(), 117);
        EXPECT_EQ(r.hop_count, r.path.size() - 1);
        EXPECT_GE(r.bottleneck_bandwidth, 250.0);

        graph::path route;
        for (int label : r.path) route.push_back(g.find_node(label));
        EXPECT_TRUE(graph::is_valid_route(g, route, route.front(), route.back()));

        auto const uniform = evaluate_path(g, route, w, 1.0);
        ASSERT_TRUE(uniform.has_value());
        EXPECT_DOUBLE_EQ(r.fitness, uniform->fitness);
        EXPECT_DOUBLE_EQ(r.total_delay, uniform->total_delay);
        EXPECT_DOUBLE_EQ(r.reliability_cost, uniform->reliability_cost);
    }
}

TEST(Solve, SeedOverrideIsReproducible) {
    auto const g = make_mesh(30, 103);
    for (auto a : metaheuristics) {
        auto const x = solve(&g, {101, 120, 200.0}, qos_weights{0.4, 0.4, 0.2}, a, seeded(77));
        auto const y = solve(&g, {101, 120, 200.0}, qos_weights{0.4, 0.4, 0.2}, a, seeded(77));
        EXPECT_EQ(x.status, y.status) << to_string(a);
        EXPECT_EQ(x.path, y.path) << to_string(a);
        EXPECT_EQ(x.stats, y.stats) << to_string(a);
    }
}
