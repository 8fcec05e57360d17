// solver/compare.h - Side-by-side algorithm runs and batch summaries
// Part of the QoS route search library (C++20)
//
// compare_algorithms() runs several algorithms against one demand, one
// std::async task per algorithm.  The network is shared read-only; each
// task owns its solver state and random engine, so no locking is needed.
// Results are returned in the order the algorithms were requested.
//
// run_batch() evaluates a list of demands sequentially (each demand's
// algorithms still run side by side) and folds the results into one
// summary row per algorithm.

#ifndef QOSROUTE_SOLVER_COMPARE_H
#define QOSROUTE_SOLVER_COMPARE_H

#include "dispatcher.h"
#include "../core/cancel_token.h"
#include "../core/log.h"
#include "../core/search_stats.h"
#include "../cost/qos_weights.h"
#include "../graph/network.h"

#include <cstddef>
#include <future>
#include <span>
#include <vector>

namespace qosroute {

[[nodiscard]] inline std::vector<route_result>
compare_algorithms(graph::qos_network const& g, demand const& d,
                   qos_weights const& weights,
                   std::span<algorithm const> algorithms,
                   solver_params const& params = {},
                   cancel_token const* cancel = nullptr)
{
    std::vector<std::future<route_result>> pending;
    pending.reserve(algorithms.size());
    for (auto algo : algorithms) {
        pending.push_back(std::async(std::launch::async, [&g, d, weights, algo, &params, cancel] {
            return solve(&g, d, weights, algo, params, cancel);
        }));
    }

    std::vector<route_result> results;
    results.reserve(pending.size());
    for (auto& f : pending) results.push_back(f.get());
    return results;
}

/// Aggregate of one algorithm over a batch of demands.  Means are taken
/// over successful runs only; elapsed time over all runs.
struct batch_summary {
    algorithm algo = algorithm::baseline;
    std::size_t runs = 0;
    std::size_t successes = 0;
    double mean_delay = 0.0;
    double mean_reliability_percent = 0.0;
    double mean_resource_cost = 0.0;
    double mean_elapsed_ms = 0.0;
    search_stats stats;

    [[nodiscard]] double success_rate() const noexcept {
        return runs == 0 ? 0.0
                         : static_cast<double>(successes) / static_cast<double>(runs);
    }
};

[[nodiscard]] inline std::vector<batch_summary>
run_batch(graph::qos_network const& g, std::span<demand const> demands,
          qos_weights const& weights, std::span<algorithm const> algorithms,
          solver_params const& params = {}, cancel_token const* cancel = nullptr)
{
    std::vector<batch_summary> rows(algorithms.size());
    for (std::size_t i = 0; i < algorithms.size(); ++i) rows[i].algo = algorithms[i];

    for (auto const& d : demands) {
        if (is_cancelled(cancel)) break;
        auto const results = compare_algorithms(g, d, weights, algorithms, params, cancel);
        for (std::size_t i = 0; i < results.size(); ++i) {
            auto& row = rows[i];
            auto const& r = results[i];
            row.runs++;
            row.mean_elapsed_ms += r.elapsed_ms;
            row.stats += r.stats;
            if (!r.ok()) continue;
            row.successes++;
            row.mean_delay += r.total_delay;
            row.mean_reliability_percent += r.final_reliability_percent;
            row.mean_resource_cost += r.resource_cost;
        }
    }

    for (auto& row : rows) {
        if (row.runs > 0) row.mean_elapsed_ms /= static_cast<double>(row.runs);
        if (row.successes == 0) continue;
        auto const n = static_cast<double>(row.successes);
        row.mean_delay /= n;
        row.mean_reliability_percent /= n;
        row.mean_resource_cost /= n;
    }

    log_debug(log_category::dispatch, "batch of {} demands over {} algorithms done",
              demands.size(), algorithms.size());
    return rows;
}

} // namespace qosroute

#endif // QOSROUTE_SOLVER_COMPARE_H
