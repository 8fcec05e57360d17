// cost/cost_model.h - Route cost breakdown and scalar fitness
// Part of the QoS route search library (C++20)
//
// For a path p = (n0, ..., nk):
//
//   total_delay      = sum link_delay(e)        over arcs
//                    + sum proc_delay(n)        over n1..n(k-1)
//   reliability_cost = sum -ln max(r(e), eps)   over arcs
//                    + sum -ln max(r(n), eps)   over n0..nk
//   resource_cost    = sum 1000 / max(bw(e), eps)
//   fitness          = wd*total_delay + wr*reliability_cost*K
//                    + wres*resource_cost
//   final_reliability_percent = 100 * exp(-reliability_cost)
//
// K (reliability_scale) is a per-solver tuning constant; it shifts the
// relative weight of reliability and is applied uniformly within one run.
//
// NUMERIC GUARD: zero or tiny reliabilities and bandwidths are clamped to
// eps before the logarithm and the reciprocal.  They never raise.
//
// evaluate_path returns nullopt (infeasible) for fewer than two nodes or
// when a consecutive pair is not an arc.  It is pure: repeated calls with
// the same network, path and weights return bit-identical results.

#ifndef QOSROUTE_COST_COST_MODEL_H
#define QOSROUTE_COST_COST_MODEL_H

#include "qos_weights.h"
#include <qosroute/graph/network.h>
#include <qosroute/graph/path.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>

namespace qosroute {

inline constexpr double reliability_epsilon = 1e-6;
inline constexpr double bandwidth_epsilon = 1e-6;
inline constexpr double resource_numerator = 1000.0;

struct cost_breakdown {
    double total_delay = 0.0;
    double reliability_cost = 0.0;
    double resource_cost = 0.0;
    double fitness = std::numeric_limits<double>::infinity();
    double final_reliability_percent = 0.0;

    bool operator==(cost_breakdown const&) const = default;
};

/// -ln of a reliability, clamped.
[[nodiscard]] inline double reliability_cost_of(double r) noexcept {
    return -std::log(std::max(r, reliability_epsilon));
}

/// 1000 / bandwidth, clamped.
[[nodiscard]] inline double resource_cost_of(double bw) noexcept {
    return resource_numerator / std::max(bw, bandwidth_epsilon);
}

[[nodiscard]] inline double scalarise(qos_weights const& w, double delay,
                                      double reliability_cost,
                                      double resource_cost,
                                      double reliability_scale) noexcept {
    return w.delay * delay +
           w.reliability * reliability_cost * reliability_scale +
           w.resource * resource_cost;
}

[[nodiscard]] inline std::optional<cost_breakdown>
evaluate_path(graph::qos_network const& g, graph::path const& p,
              qos_weights const& w, double reliability_scale) {
    if (p.size() < 2) return std::nullopt;
    for (auto n : p) {
        if (!g.has_node(n)) return std::nullopt;
    }

    cost_breakdown out;
    out.fitness = 0.0;

    for (std::size_t i = 0; i + 1 < p.size(); ++i) {
        auto const e = g.find_edge(p[i], p[i + 1]);
        if (e == graph::invalid_edge) return std::nullopt;
        auto const& link = g.link(e);
        out.total_delay += link.link_delay;
        out.reliability_cost += reliability_cost_of(link.reliability);
        out.resource_cost += resource_cost_of(link.bandwidth);
    }

    for (std::size_t i = 1; i + 1 < p.size(); ++i) {
        out.total_delay += g.node(p[i]).proc_delay;
    }
    for (auto n : p) {
        out.reliability_cost += reliability_cost_of(g.node(n).reliability);
    }

    out.fitness = scalarise(w, out.total_delay, out.reliability_cost,
                            out.resource_cost, reliability_scale);
    out.final_reliability_percent = 100.0 * std::exp(-out.reliability_cost);
    return out;
}

/// Fitness, or +infinity when the path is infeasible.
[[nodiscard]] inline double path_fitness(graph::qos_network const& g,
                                         graph::path const& p,
                                         qos_weights const& w,
                                         double reliability_scale) {
    auto const c = evaluate_path(g, p, w, reliability_scale);
    return c ? c->fitness : std::numeric_limits<double>::infinity();
}

/// Cost model bound to one network, weight triple and scale for the
/// duration of a search.
class route_cost_model {
public:
    route_cost_model(graph::qos_network const& g, qos_weights w,
                     double reliability_scale)
        : graph_(&g), weights_(w), scale_(reliability_scale) {}

    [[nodiscard]] std::optional<cost_breakdown> evaluate(graph::path const& p) const {
        return evaluate_path(*graph_, p, weights_, scale_);
    }

    [[nodiscard]] double fitness(graph::path const& p) const {
        return path_fitness(*graph_, p, weights_, scale_);
    }

    [[nodiscard]] graph::qos_network const& network() const noexcept { return *graph_; }
    [[nodiscard]] qos_weights const& weights() const noexcept { return weights_; }
    [[nodiscard]] double reliability_scale() const noexcept { return scale_; }

private:
    graph::qos_network const* graph_;
    qos_weights weights_;
    double scale_;
};

} // namespace qosroute

#endif // QOSROUTE_COST_COST_MODEL_H
