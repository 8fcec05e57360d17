// solver/search_setup.h - Shared preamble of every route solver
// Part of the QoS route search library (C++20)
//
// Each solver starts the same way:
//   1. reject endpoints outside the network, identical endpoints, and a
//      negative or non-finite bandwidth demand (invalid_input)
//   2. build the bandwidth-filtered network
//   3. confirm the target is reachable in it (infeasible_demand)
// Only then does solver-specific state get allocated.

#ifndef QOSROUTE_SOLVER_SEARCH_SETUP_H
#define QOSROUTE_SOLVER_SEARCH_SETUP_H

#include "search_result.h"
#include "../core/log.h"
#include "../graph/bandwidth_filter.h"
#include "../graph/network.h"
#include "../graph/shortest_path.h"

#include <fmt/format.h>

#include <cmath>
#include <optional>
#include <utility>

namespace qosroute {

struct search_setup {
    graph::qos_network filtered;

    /// Set when the search must stop before it starts.
    std::optional<search_result> failure;
};

[[nodiscard]] inline std::optional<search_result>
validate_query(graph::qos_network const& g, route_query const& q) {
    if (!g.has_node(q.source) || !g.has_node(q.target))
        return make_failure(search_status::invalid_input,
            fmt::format("endpoint not in network (source {}, target {})",
                        q.source.value, q.target.value));
    if (q.source == q.target)
        return make_failure(search_status::invalid_input,
            "source and target must differ");
    if (!std::isfinite(q.bandwidth_demand) || q.bandwidth_demand < 0.0)
        return make_failure(search_status::invalid_input,
            fmt::format("invalid bandwidth demand {}", q.bandwidth_demand));
    return std::nullopt;
}

[[nodiscard]] inline search_setup
prepare_search(graph::qos_network const& g, route_query const& q,
               log_category category) {
    search_setup s;
    if (auto bad = validate_query(g, q)) {
        log_info(category, "rejected query: {}", bad->message);
        s.failure = std::move(bad);
        return s;
    }

    s.filtered = graph::filter_by_bandwidth(g, q.bandwidth_demand);
    log_debug(category, "bandwidth filter {} Mbps kept {} of {} arcs",
              q.bandwidth_demand, s.filtered.edge_count(), g.edge_count());

    if (!graph::is_reachable(s.filtered, q.source, q.target)) {
        log_info(category, "no route {} -> {} with bandwidth >= {}",
                 g.label(q.source), g.label(q.target), q.bandwidth_demand);
        s.failure = make_failure(search_status::infeasible_demand,
            fmt::format("no route from {} to {} with bandwidth >= {}",
                        g.label(q.source), g.label(q.target),
                        q.bandwidth_demand));
    }
    return s;
}

} // namespace qosroute

#endif // QOSROUTE_SOLVER_SEARCH_SETUP_H
