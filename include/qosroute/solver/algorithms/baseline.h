// qosroute/solver/algorithms/baseline.h
// QoS route search library - Solver
// Deterministic reference route: Dijkstra over static per-arc costs.
//
// The arc cost combines delay, scaled -ln(reliability) and 1000/bandwidth
// with the normalised weights (see cost/edge_cost.h) and is computed on
// the bandwidth-filtered network.  Node terms are not part of the arc
// cost, so the route is optimal for the link terms only; it serves as a
// comparison point for the metaheuristics.
//
// Stats field semantics:
//   iterations            1
//   candidates_evaluated  1 (the extracted route)

#ifndef QOSROUTE_SOLVER_ALGORITHMS_BASELINE_H
#define QOSROUTE_SOLVER_ALGORITHMS_BASELINE_H

#include "../search_result.h"
#include "../search_setup.h"
#include "../../core/log.h"
#include "../../cost/cost_model.h"
#include "../../cost/edge_cost.h"
#include "../../graph/shortest_path.h"
#include "../../graph/weighted_view.h"

#include <utility>

namespace qosroute {

struct baseline_params {
    double edge_reliability_scale = static_reliability_scale;
    double reliability_scale = 1.0;
};

[[nodiscard]] inline search_result
baseline_search(graph::qos_network const& g, route_query const& q,
                qos_weights const& weights, baseline_params const& params = {})
{
    constexpr auto cat = log_category::dispatch;

    auto setup = prepare_search(g, q, cat);
    if (setup.failure) return std::move(*setup.failure);

    auto const& net = setup.filtered;
    auto const costs = make_static_edge_costs(net, weights, params.edge_reliability_scale);
    graph::weighted_view const view(net, costs);
    auto const sp = graph::dijkstra(view, q.source, view.weight_fn());

    search_stats stats{};
    stats.iterations = 1;
    auto route = graph::extract_path(sp, q.target);
    if (!route)
        return make_failure(search_status::no_path_found,
                            "dijkstra found no route", stats);

    route_cost_model const model(net, weights, params.reliability_scale);
    stats.candidates_total = 1;
    stats.candidates_evaluated = 1;
    auto cost = model.evaluate(*route);
    if (!cost)
        return make_failure(search_status::internal_error,
                            "dijkstra route failed evaluation", stats);

    log_debug(cat, "baseline route: {} hops, fitness {:.6f}",
              graph::hop_count(*route), cost->fitness);

    auto result = make_success(std::move(*route), *cost, stats);
    result.convergence.push_back(cost->fitness);
    return result;
}

} // namespace qosroute

#endif // QOSROUTE_SOLVER_ALGORITHMS_BASELINE_H
