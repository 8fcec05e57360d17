// cost/qos_weights.h - QoS importance weights
// Part of the QoS route search library (C++20)
//
// The weight triple scalarises the three route objectives.  Callers may
// pass any non-negative triple; the dispatcher normalises it to sum to 1
// before a solver runs.  An all-zero triple falls back to pure delay
// (1, 0, 0).

#ifndef QOSROUTE_COST_QOS_WEIGHTS_H
#define QOSROUTE_COST_QOS_WEIGHTS_H

#include <cmath>

namespace qosroute {

struct qos_weights {
    double delay = 1.0;
    double reliability = 0.0;
    double resource = 0.0;

    [[nodiscard]] double total() const noexcept {
        return delay + reliability + resource;
    }

    bool operator==(qos_weights const&) const = default;
};

/// Every component finite and >= 0.
[[nodiscard]] inline bool is_valid(qos_weights const& w) noexcept {
    auto ok = [](double x) { return std::isfinite(x) && x >= 0.0; };
    return ok(w.delay) && ok(w.reliability) && ok(w.resource);
}

/// Scale to sum 1.  Precondition: is_valid(w).
[[nodiscard]] inline qos_weights normalise(qos_weights const& w) noexcept {
    auto const t = w.total();
    if (t <= 0.0) return qos_weights{1.0, 0.0, 0.0};
    return qos_weights{w.delay / t, w.reliability / t, w.resource / t};
}

} // namespace qosroute

#endif // QOSROUTE_COST_QOS_WEIGHTS_H
