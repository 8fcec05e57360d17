// solver/search_result.h - Tagged outcome of one solver run
// Part of the QoS route search library (C++20)
//
// DESIGN RATIONALE:
// Every solver returns a search_result, whatever its internal state
// looks like.  status == found carries a route and its cost breakdown;
// every other status carries a reason and a human-readable message and an
// empty route.  The dispatcher consumes this one shape for all
// algorithms.
//
// Statuses:
//   found              route is valid for the bandwidth-filtered network
//   infeasible_demand  no route exists once low-bandwidth arcs are removed
//   no_path_found      the search ran out of budget without reaching the
//                      target (empty GA seed pool, no successful episode)
//   invalid_input      unknown endpoints, bad weights, bad parameters
//   cancelled          stopped by a cancel_token before any route was found
//   internal_error     an exception escaped a solver (dispatcher only)

#ifndef QOSROUTE_SOLVER_SEARCH_RESULT_H
#define QOSROUTE_SOLVER_SEARCH_RESULT_H

#include <qosroute/core/search_stats.h>
#include <qosroute/cost/cost_model.h>
#include <qosroute/graph/path.h>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace qosroute {

enum class search_status {
    found,
    infeasible_demand,
    no_path_found,
    invalid_input,
    cancelled,
    internal_error,
};

[[nodiscard]] constexpr std::string_view to_string(search_status s) noexcept {
    switch (s) {
        case search_status::found:             return "found";
        case search_status::infeasible_demand: return "infeasible_demand";
        case search_status::no_path_found:     return "no_path_found";
        case search_status::invalid_input:     return "invalid_input";
        case search_status::cancelled:         return "cancelled";
        case search_status::internal_error:    return "internal_error";
    }
    return "unknown";
}

/// Endpoints and bandwidth requirement in node_id space.
struct route_query {
    graph::node_id source = graph::invalid_node;
    graph::node_id target = graph::invalid_node;
    double bandwidth_demand = 0.0;
};

struct search_result {
    search_status status = search_status::no_path_found;

    /// Best route (empty unless found).
    graph::path route;

    /// Breakdown under the solver's own weights and reliability scale.
    cost_breakdown cost;

    search_stats stats;

    /// Best objective per outer iteration, for convergence plots.  Lower is
    /// better; +infinity until the first feasible route.
    std::vector<double> convergence;

    std::string message;

    [[nodiscard]] bool is_found() const noexcept {
        return status == search_status::found;
    }
};

[[nodiscard]] inline search_result make_failure(search_status status,
                                                std::string message,
                                                search_stats stats = {}) {
    search_result r;
    r.status = status;
    r.message = std::move(message);
    r.stats = stats;
    return r;
}

[[nodiscard]] inline search_result make_success(graph::path route,
                                                cost_breakdown cost,
                                                search_stats stats) {
    search_result r;
    r.status = search_status::found;
    r.route = std::move(route);
    r.cost = cost;
    r.stats = stats;
    return r;
}

} // namespace qosroute

#endif // QOSROUTE_SOLVER_SEARCH_RESULT_H
