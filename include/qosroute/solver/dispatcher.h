// solver/dispatcher.h - Algorithm selection and result normalisation
// Part of the QoS route search library (C++20)
//
// solve() is the single entry point callers use:
//   1. validate the network pointer, endpoint labels, bandwidth demand and
//      weight triple (invalid_input)
//   2. normalise the weights to sum 1
//   3. run the selected solver, forwarding its parameter block and the
//      optional seed override
//   4. check the returned route against the bandwidth-filtered network
//   5. recompute a uniform breakdown on the unfiltered network with K = 1
//      so results of different solvers are directly comparable
//
// Dispatch map:
//   genetic              -> genetic_search
//   particle_swarm       -> swarm_search
//   simulated_annealing  -> annealing_search
//   q_learning           -> qlearning_search
//   baseline             -> baseline_search (Dijkstra over static arc costs)
//
// No exception leaves solve(): anything a solver throws is logged and
// reported as internal_error.

#ifndef QOSROUTE_SOLVER_DISPATCHER_H
#define QOSROUTE_SOLVER_DISPATCHER_H

#include "search_result.h"
#include "algorithms/annealing.h"
#include "algorithms/baseline.h"
#include "algorithms/genetic.h"
#include "algorithms/particle_swarm.h"
#include "algorithms/qlearning.h"
#include "../core/cancel_token.h"
#include "../core/log.h"
#include "../core/search_stats.h"
#include "../cost/cost_model.h"
#include "../cost/qos_weights.h"
#include "../graph/bandwidth_filter.h"
#include "../graph/network.h"
#include "../graph/path.h"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace qosroute {

enum class algorithm {
    genetic,
    particle_swarm,
    simulated_annealing,
    q_learning,
    baseline,
};

inline constexpr std::array<algorithm, 4> metaheuristics{
    algorithm::genetic,
    algorithm::particle_swarm,
    algorithm::simulated_annealing,
    algorithm::q_learning,
};

[[nodiscard]] constexpr std::string_view to_string(algorithm a) noexcept {
    switch (a) {
        case algorithm::genetic:             return "genetic";
        case algorithm::particle_swarm:      return "particle_swarm";
        case algorithm::simulated_annealing: return "simulated_annealing";
        case algorithm::q_learning:          return "q_learning";
        case algorithm::baseline:            return "baseline";
    }
    return "unknown";
}

/// Case-insensitive name lookup.  Accepts the canonical names and the
/// usual abbreviations (ga, pso, sa, ql, dijkstra, ...).
[[nodiscard]] inline std::optional<algorithm> parse_algorithm(std::string_view name) {
    std::string key;
    key.reserve(name.size());
    for (char c : name) {
        if (c == '-' || c == ' ') c = '_';
        key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    struct alias {
        std::string_view name;
        algorithm algo;
    };
    static constexpr std::array<alias, 14> aliases{{
        {"genetic", algorithm::genetic},
        {"ga", algorithm::genetic},
        {"genetic_algorithm", algorithm::genetic},
        {"particle_swarm", algorithm::particle_swarm},
        {"pso", algorithm::particle_swarm},
        {"swarm", algorithm::particle_swarm},
        {"simulated_annealing", algorithm::simulated_annealing},
        {"annealing", algorithm::simulated_annealing},
        {"sa", algorithm::simulated_annealing},
        {"q_learning", algorithm::q_learning},
        {"qlearning", algorithm::q_learning},
        {"ql", algorithm::q_learning},
        {"baseline", algorithm::baseline},
        {"dijkstra", algorithm::baseline},
    }};
    for (auto const& a : aliases) {
        if (a.name == key) return a.algo;
    }
    return std::nullopt;
}

/// Per-solver parameter blocks with documented defaults.  When seed is set
/// it overrides the seed of whichever solver runs.
struct solver_params {
    genetic_params genetic;
    swarm_params swarm;
    annealing_params annealing;
    qlearning_params qlearning;
    baseline_params baseline;
    std::optional<std::uint64_t> seed;
};

/// Endpoints by caller label plus the bandwidth requirement (Mbps).
struct demand {
    int source = 0;
    int target = 0;
    double bandwidth = 0.0;
};

/// Normalised output record shared by every algorithm.
struct route_result {
    algorithm algo = algorithm::baseline;
    search_status status = search_status::no_path_found;

    std::vector<int> path;                 ///< caller labels, source first
    double total_delay = 0.0;              ///< ms
    double final_reliability_percent = 0.0;
    double resource_cost = 0.0;

    double reliability_cost = 0.0;
    double fitness = 0.0;                  ///< normalised weights, K = 1
    std::size_t hop_count = 0;
    double bottleneck_bandwidth = 0.0;

    search_stats stats;
    std::vector<double> convergence;
    double elapsed_ms = 0.0;
    std::string message;

    [[nodiscard]] bool ok() const noexcept { return status == search_status::found; }
};

namespace detail {

inline search_result run_solver(graph::qos_network const& g, route_query const& q,
                                qos_weights const& w, algorithm algo,
                                solver_params const& params,
                                cancel_token const* cancel)
{
    auto with_seed = [&](auto p) {
        if (params.seed) p.seed = params.seed;
        return p;
    };

    switch (algo) {
        case algorithm::genetic:
            return genetic_search(g, q, w, with_seed(params.genetic), cancel);
        case algorithm::particle_swarm:
            return swarm_search(g, q, w, with_seed(params.swarm), cancel);
        case algorithm::simulated_annealing:
            return annealing_search(g, q, w, with_seed(params.annealing), cancel);
        case algorithm::q_learning:
            return qlearning_search(g, q, w, with_seed(params.qlearning), cancel);
        case algorithm::baseline:
            return baseline_search(g, q, w, params.baseline);
    }
    return make_failure(search_status::invalid_input, "unknown algorithm");
}

inline route_result failed(algorithm algo, search_status status, std::string message) {
    route_result r;
    r.algo = algo;
    r.status = status;
    r.message = std::move(message);
    return r;
}

} // namespace detail

[[nodiscard]] inline route_result
solve(graph::qos_network const* network, demand const& d,
      qos_weights const& weights, algorithm algo,
      solver_params const& params = {}, cancel_token const* cancel = nullptr)
{
    constexpr auto cat = log_category::dispatch;
    using clock = std::chrono::steady_clock;

    if (network == nullptr)
        return detail::failed(algo, search_status::invalid_input, "no network");

    auto const& g = *network;
    route_query q;
    q.source = g.find_node(d.source);
    q.target = g.find_node(d.target);
    q.bandwidth_demand = d.bandwidth;

    if (q.source == graph::invalid_node || q.target == graph::invalid_node)
        return detail::failed(algo, search_status::invalid_input,
            fmt::format("node {} not in network",
                        q.source == graph::invalid_node ? d.source : d.target));
    if (!is_valid(weights))
        return detail::failed(algo, search_status::invalid_input,
            fmt::format("invalid weights ({}, {}, {})",
                        weights.delay, weights.reliability, weights.resource));

    auto const w = normalise(weights);
    log_debug(cat, "{}: {} -> {} bw {} weights ({:.3f}, {:.3f}, {:.3f})",
              to_string(algo), d.source, d.target, d.bandwidth,
              w.delay, w.reliability, w.resource);

    route_result out;
    out.algo = algo;
    auto const start = clock::now();

    try {
        auto sr = detail::run_solver(g, q, w, algo, params, cancel);
        out.elapsed_ms = std::chrono::duration<double, std::milli>(
            clock::now() - start).count();
        out.status = sr.status;
        out.stats = sr.stats;
        out.convergence = std::move(sr.convergence);
        out.message = std::move(sr.message);

        if (!sr.is_found()) {
            log_info(cat, "{} failed: {} ({})", to_string(algo),
                     to_string(out.status), out.message);
            return out;
        }

        auto const filtered = graph::filter_by_bandwidth(g, q.bandwidth_demand);
        if (!graph::is_valid_route(filtered, sr.route, q.source, q.target)) {
            log_error(cat, "{} returned an invalid route", to_string(algo));
            out.status = search_status::internal_error;
            out.message = "solver returned an invalid route";
            return out;
        }

        auto const uniform = evaluate_path(g, sr.route, w, 1.0);
        if (!uniform) {
            out.status = search_status::internal_error;
            out.message = "route failed uniform evaluation";
            return out;
        }

        out.path = graph::to_labels(g, sr.route);
        out.total_delay = uniform->total_delay;
        out.final_reliability_percent = uniform->final_reliability_percent;
        out.resource_cost = uniform->resource_cost;
        out.reliability_cost = uniform->reliability_cost;
        out.fitness = uniform->fitness;
        out.hop_count = graph::hop_count(sr.route);
        out.bottleneck_bandwidth = graph::bottleneck_bandwidth(g, sr.route);
    } catch (std::exception const& e) {
        log_error(cat, "{} raised: {}", to_string(algo), e.what());
        out.status = search_status::internal_error;
        out.message = e.what();
        out.path.clear();
        out.elapsed_ms = std::chrono::duration<double, std::milli>(
            clock::now() - start).count();
    }
    return out;
}

/// Name-based overload.  Unknown names are invalid_input.
[[nodiscard]] inline route_result
solve(graph::qos_network const* network, demand const& d,
      qos_weights const& weights, std::string_view algorithm_name,
      solver_params const& params = {}, cancel_token const* cancel = nullptr)
{
    auto const algo = parse_algorithm(algorithm_name);
    if (!algo)
        return detail::failed(algorithm::baseline, search_status::invalid_input,
            fmt::format("unknown algorithm '{}'", algorithm_name));
    return solve(network, d, weights, *algo, params, cancel);
}

} // namespace qosroute

#endif // QOSROUTE_SOLVER_DISPATCHER_H
