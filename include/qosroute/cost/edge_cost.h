// cost/edge_cost.h - Static per-arc scalar cost for baseline routing
// Part of the QoS route search library (C++20)
//
//   cost(e) = wd*link_delay + wr*(-ln r)*K + wres*1000/bw
//
// Link terms only; node processing delay and node reliability are not
// attributable to a single arc.  The map is solver-local and bound to the
// network it was built for.  None of the four metaheuristics read it;
// they score whole paths through the cost model.

#ifndef QOSROUTE_COST_EDGE_COST_H
#define QOSROUTE_COST_EDGE_COST_H

#include "cost_model.h"
#include "qos_weights.h"
#include <qosroute/graph/edge_property_map.h>
#include <qosroute/graph/network.h>

namespace qosroute {

inline constexpr double static_reliability_scale = 100.0;

[[nodiscard]] inline graph::edge_property_map<double>
make_static_edge_costs(graph::qos_network const& g, qos_weights const& w,
                       double reliability_scale = static_reliability_scale) {
    return graph::make_edge_map<double>(g, [&](graph::edge_id e) {
        auto const& link = g.link(e);
        return scalarise(w, link.link_delay,
                         reliability_cost_of(link.reliability),
                         resource_cost_of(link.bandwidth),
                         reliability_scale);
    });
}

} // namespace qosroute

#endif // QOSROUTE_COST_EDGE_COST_H
