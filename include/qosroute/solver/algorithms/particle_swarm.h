// qosroute/solver/algorithms/particle_swarm.h
// QoS route search library - Solver
// Particle-swarm search over node priority vectors.
//
// A particle is a priority in [min_priority, max_priority] for every node
// of the network.  Its route is decoded by reweighting each arc of the
// bandwidth-filtered network with the priority of the arc's head node
// and extracting the Dijkstra path from source to target.  The reweighting
// lives in a solver-local edge_property_map read through weighted_view;
// the network itself is never touched.
//
// After all particles of an iteration are scored:
//   v <- w*v + c1*r1*(pbest - x) + c2*r2*(gbest - x)
//   x <- clip(x + v, min_priority, max_priority)
// with one uniform pair (r1, r2) drawn per particle.
//
// Stats field semantics:
//   iterations            swarm iterations completed
//   candidates_total      particle decodings
//   candidates_evaluated  cost model calls
//   candidates_rejected   decodings that produced no feasible route
//   improvements          global-best updates
//
// convergence[i] is the global-best fitness after iteration i.

#ifndef QOSROUTE_SOLVER_ALGORITHMS_PARTICLE_SWARM_H
#define QOSROUTE_SOLVER_ALGORITHMS_PARTICLE_SWARM_H

#include "../search_result.h"
#include "../search_setup.h"
#include "../../core/cancel_token.h"
#include "../../core/log.h"
#include "../../core/random.h"
#include "../../cost/cost_model.h"
#include "../../graph/edge_property_map.h"
#include "../../graph/network.h"
#include "../../graph/path.h"
#include "../../graph/shortest_path.h"
#include "../../graph/weighted_view.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

namespace qosroute {

struct swarm_params {
    std::size_t swarm_size = 30;
    std::size_t iterations = 25;
    double inertia = 0.7;
    double cognitive = 1.5;
    double social = 2.0;

    /// Initial velocities are uniform in [-initial_velocity, initial_velocity).
    double initial_velocity = 0.1;
    double min_priority = 0.001;
    double max_priority = 1.0;

    double reliability_scale = 10.0;
    std::optional<std::uint64_t> seed;
};

struct particle {
    std::vector<double> position;
    std::vector<double> velocity;
    std::vector<double> best_position;
    double best_fitness = std::numeric_limits<double>::infinity();
};

/// Write the head-node priority of every arc of g into weights.
inline void assign_priorities(graph::qos_network const& g,
                              std::vector<double> const& position,
                              graph::edge_property_map<double>& weights)
{
    for (std::size_t e = 0; e < g.edge_count(); ++e) {
        auto const id = graph::edge_id{e};
        weights[id] = position[graph::to_index(g.edge_target(id))];
    }
}

/// Decode a priority vector into a route.
[[nodiscard]] inline std::optional<graph::path>
decode_priorities(graph::qos_network const& g, route_query const& q,
                  std::vector<double> const& position,
                  graph::edge_property_map<double>& scratch)
{
    assign_priorities(g, position, scratch);
    graph::weighted_view const view(g, scratch);
    auto const sp = graph::dijkstra(view, q.source, view.weight_fn());
    return graph::extract_path(sp, q.target);
}

[[nodiscard]] inline search_result
swarm_search(graph::qos_network const& g, route_query const& q,
             qos_weights const& weights, swarm_params const& params = {},
             cancel_token const* cancel = nullptr)
{
    constexpr auto cat = log_category::swarm;
    constexpr double inf = std::numeric_limits<double>::infinity();

    if (params.swarm_size == 0 || !(params.min_priority > 0.0) ||
        !(params.min_priority < params.max_priority))
        return make_failure(search_status::invalid_input,
            "swarm search needs particles and 0 < min_priority < max_priority");

    auto setup = prepare_search(g, q, cat);
    if (setup.failure) return std::move(*setup.failure);

    auto const& net = setup.filtered;
    route_cost_model const model(net, weights, params.reliability_scale);
    auto rng = make_engine(params.seed);
    search_stats stats{};

    auto const n = net.node_count();
    auto clip = [&](double x) {
        return std::clamp(x, params.min_priority, params.max_priority);
    };

    std::vector<particle> swarm(params.swarm_size);
    for (auto& p : swarm) {
        p.position.resize(n);
        p.velocity.resize(n);
        for (std::size_t i = 0; i < n; ++i) {
            p.position[i] = clip(uniform01(rng));
            p.velocity[i] = uniform_real(rng, -params.initial_velocity,
                                         params.initial_velocity);
        }
        p.best_position = p.position;
    }

    std::vector<double> global_position(n);
    for (auto& x : global_position) x = clip(uniform01(rng));
    double global_fitness = inf;
    graph::path global_route;

    auto scratch = graph::make_uniform_edge_map(net, 1.0);
    std::vector<double> convergence;
    convergence.reserve(params.iterations);

    log_debug(cat, "start: {} particles x {} iterations over {} nodes",
              params.swarm_size, params.iterations, n);

    bool cancelled = false;
    for (std::size_t it = 0; it < params.iterations; ++it) {
        if (is_cancelled(cancel)) {
            cancelled = true;
            break;
        }

        for (auto& p : swarm) {
            stats.candidates_total++;
            auto route = decode_priorities(net, q, p.position, scratch);
            if (!route) {
                stats.candidates_rejected++;
                continue;
            }
            auto const f = model.fitness(*route);
            stats.candidates_evaluated++;
            if (f == inf) {
                stats.candidates_rejected++;
                continue;
            }
            if (f < p.best_fitness) {
                p.best_fitness = f;
                p.best_position = p.position;
            }
            if (f < global_fitness) {
                global_fitness = f;
                global_position = p.position;
                global_route = std::move(*route);
                stats.improvements++;
            }
        }

        for (auto& p : swarm) {
            auto const r1 = uniform01(rng);
            auto const r2 = uniform01(rng);
            for (std::size_t i = 0; i < n; ++i) {
                p.velocity[i] = params.inertia * p.velocity[i] +
                    params.cognitive * r1 * (p.best_position[i] - p.position[i]) +
                    params.social * r2 * (global_position[i] - p.position[i]);
                p.position[i] = clip(p.position[i] + p.velocity[i]);
            }
        }

        stats.iterations++;
        convergence.push_back(global_fitness);
    }

    if (global_route.empty()) {
        if (cancelled)
            return make_failure(search_status::cancelled,
                                "cancelled before any particle reached the target",
                                stats);
        log_info(cat, "no particle reached the target");
        return make_failure(search_status::no_path_found,
                            "no particle reached the target", stats);
    }

    auto cost = model.evaluate(global_route);
    if (!cost)
        return make_failure(search_status::internal_error,
                            "global best failed re-evaluation", stats);

    log_debug(cat, "done: {} iterations, best fitness {:.6f}{}",
              stats.iterations, cost->fitness, cancelled ? " (cancelled)" : "");

    auto result = make_success(std::move(global_route), *cost, stats);
    result.convergence = std::move(convergence);
    return result;
}

} // namespace qosroute

#endif // QOSROUTE_SOLVER_ALGORITHMS_PARTICLE_SWARM_H
