// qosroute/solver/algorithms/qlearning.h
// QoS route search library - Solver
// Episodic tabular Q-learning over the node-adjacency action space.
//
// State is the current node, an action is the next node.  Q-values live
// in a sparse table (missing entries read as 0).
//
// Episode:
//   start at the source; at each step choose among unvisited neighbours
//   - if the target is one of them, take it when u > epsilon / 2
//   - else explore uniformly with probability epsilon
//   - else exploit the highest Q-value (first in adjacency order on ties)
//   non-terminal update: Q += lr * (step_reward + discount * max Q(s', .) - Q)
//   terminal update:     Q += lr * (R - Q)
//   R = reward_scale / (1 + cost) - length_penalty * nodes, or
//       bandwidth_violation_reward if any arc is below the demand
//   the episode ends at the target, at a dead end, or after max_steps
//
// Exploration walks the full network so the agent can learn that
// low-bandwidth arcs are penalised; only episodes that reach the target
// without a violation are eligible as the best route.  epsilon decays
// linearly from epsilon_start to epsilon_end over the episodes.
//
// A qlearning_router can be reused across searches.  With reuse_table
// false (the default) the table is cleared at the start of every search.
//
// Stats field semantics:
//   iterations            episodes completed
//   candidates_total      steps taken
//   candidates_evaluated  terminal rewards computed
//   candidates_rejected   episodes that reached the target with a violation
//   improvements          best-route updates
//   successful_episodes   episodes that reached the target
//
// convergence[e] is the fitness of the best eligible route after
// episode e.

#ifndef QOSROUTE_SOLVER_ALGORITHMS_QLEARNING_H
#define QOSROUTE_SOLVER_ALGORITHMS_QLEARNING_H

#include "../search_result.h"
#include "../search_setup.h"
#include "../../core/cancel_token.h"
#include "../../core/log.h"
#include "../../core/random.h"
#include "../../cost/cost_model.h"
#include "../../graph/network.h"
#include "../../graph/path.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace qosroute {

struct qlearning_params {
    double learning_rate = 0.1;
    double discount = 0.9;
    double epsilon_start = 0.9;
    double epsilon_end = 0.05;
    std::size_t episodes = 500;
    std::size_t max_steps = 100;

    double step_reward = -0.1;
    double reward_scale = 1000.0;
    double length_penalty = 0.1;
    double bandwidth_violation_reward = -500.0;
    double unreached_reward = -1000.0;

    double reliability_scale = 100.0;
    bool reuse_table = false;
    std::optional<std::uint64_t> seed;
};

class qlearning_router {
public:
    explicit qlearning_router(qlearning_params params = {})
        : params_(std::move(params)) {}

    [[nodiscard]] qlearning_params const& params() const noexcept { return params_; }

    /// Clear the Q-table.
    void reset() noexcept { table_.clear(); }

    [[nodiscard]] std::size_t table_size() const noexcept { return table_.size(); }

    [[nodiscard]] double q_value(graph::node_id s, graph::node_id a) const {
        auto const it = table_.find(key(s, a));
        return it == table_.end() ? 0.0 : it->second;
    }

    /// Exploration rate used in the given episode.
    [[nodiscard]] double epsilon_at(std::size_t episode) const noexcept {
        if (params_.episodes == 0) return params_.epsilon_end;
        auto const decay = (params_.epsilon_start - params_.epsilon_end) /
                           static_cast<double>(params_.episodes);
        return std::max(params_.epsilon_end,
                        params_.epsilon_start - static_cast<double>(episode) * decay);
    }

    [[nodiscard]] search_result search(graph::qos_network const& g,
                                       route_query const& q,
                                       qos_weights const& weights,
                                       cancel_token const* cancel = nullptr);

private:
    struct episode_outcome {
        graph::path route;
        double reward = 0.0;
        bool reached = false;
        bool violated = false;
    };

    [[nodiscard]] static std::uint64_t key(graph::node_id s, graph::node_id a) noexcept {
        return (static_cast<std::uint64_t>(s.value) << 16) | a.value;
    }

    [[nodiscard]] double max_q(graph::qos_network const& g, graph::node_id s) const {
        auto const nbrs = g.out_neighbors(s);
        if (nbrs.empty()) return 0.0;
        double m = -std::numeric_limits<double>::infinity();
        for (auto a : nbrs) m = std::max(m, q_value(s, a));
        return m;
    }

    [[nodiscard]] graph::node_id
    choose_action(graph::qos_network const& g, graph::node_id s,
                  graph::node_id target, std::vector<bool> const& visited,
                  double epsilon, random_engine& rng) const
    {
        std::vector<graph::node_id> open;
        for (auto a : g.out_neighbors(s)) {
            if (!visited[graph::to_index(a)]) open.push_back(a);
        }
        if (open.empty()) return graph::invalid_node;

        if (std::find(open.begin(), open.end(), target) != open.end() &&
            uniform01(rng) > epsilon / 2.0)
            return target;

        if (uniform01(rng) < epsilon) return pick(rng, open);

        auto best = open.front();
        auto best_q = q_value(s, best);
        for (auto a : open) {
            auto const v = q_value(s, a);
            if (v > best_q) {
                best = a;
                best_q = v;
            }
        }
        return best;
    }

    [[nodiscard]] double terminal_reward(route_cost_model const& model,
                                         graph::path const& route,
                                         bool violated) const
    {
        if (violated) return params_.bandwidth_violation_reward;
        auto const cost = model.fitness(route);
        if (cost == std::numeric_limits<double>::infinity())
            return params_.unreached_reward;
        return params_.reward_scale / (1.0 + cost) -
               params_.length_penalty * static_cast<double>(route.size());
    }

    episode_outcome run_episode(graph::qos_network const& g, route_query const& q,
                                route_cost_model const& model, double epsilon,
                                random_engine& rng, search_stats& stats)
    {
        episode_outcome out;
        out.route.push_back(q.source);
        std::vector<bool> visited(g.node_count(), false);
        visited[graph::to_index(q.source)] = true;
        auto state = q.source;

        for (std::size_t step = 0; step < params_.max_steps; ++step) {
            auto const action = choose_action(g, state, q.target, visited, epsilon, rng);
            if (action == graph::invalid_node) break;
            stats.candidates_total++;

            auto const e = g.find_edge(state, action);
            if (g.link(e).bandwidth < q.bandwidth_demand) out.violated = true;
            out.route.push_back(action);
            visited[graph::to_index(action)] = true;

            auto& entry = table_[key(state, action)];
            if (action == q.target) {
                out.reached = true;
                out.reward = terminal_reward(model, out.route, out.violated);
                stats.candidates_evaluated++;
                entry += params_.learning_rate * (out.reward - entry);
                break;
            }
            auto const target_q = params_.step_reward + params_.discount * max_q(g, action);
            entry += params_.learning_rate * (target_q - entry);
            state = action;
        }

        if (!out.reached) out.reward = params_.unreached_reward;
        return out;
    }

    qlearning_params params_;
    std::unordered_map<std::uint64_t, double> table_;
};

inline search_result
qlearning_router::search(graph::qos_network const& g, route_query const& q,
                         qos_weights const& weights, cancel_token const* cancel)
{
    constexpr auto cat = log_category::qlearning;
    constexpr double inf = std::numeric_limits<double>::infinity();

    if (!(params_.learning_rate > 0.0 && params_.learning_rate <= 1.0) ||
        !(params_.discount >= 0.0 && params_.discount <= 1.0))
        return make_failure(search_status::invalid_input,
            "q-learning needs learning_rate in (0, 1] and discount in [0, 1]");

    auto setup = prepare_search(g, q, cat);
    if (setup.failure) return std::move(*setup.failure);

    if (!params_.reuse_table) reset();

    // Rewards are scored on the full network; eligibility of the best
    // route is decided by the violation flag.
    route_cost_model const model(g, weights, params_.reliability_scale);
    auto rng = make_engine(params_.seed);
    search_stats stats{};

    graph::path best_route;
    double best_reward = -inf;
    double best_fitness = inf;
    std::vector<double> convergence;
    convergence.reserve(std::min<std::size_t>(params_.episodes, 4096));

    log_debug(cat, "start: {} episodes, max {} steps", params_.episodes,
              params_.max_steps);

    bool cancelled = false;
    for (std::size_t ep = 0; ep < params_.episodes; ++ep) {
        if (is_cancelled(cancel)) {
            cancelled = true;
            break;
        }

        auto outcome = run_episode(g, q, model, epsilon_at(ep), rng, stats);
        stats.iterations++;

        if (outcome.reached) {
            stats.successful_episodes++;
            if (outcome.violated) {
                stats.candidates_rejected++;
            } else if (outcome.reward > best_reward) {
                best_reward = outcome.reward;
                best_fitness = model.fitness(outcome.route);
                best_route = std::move(outcome.route);
                stats.improvements++;
            }
        }
        convergence.push_back(best_fitness);
    }

    if (best_route.empty()) {
        if (cancelled)
            return make_failure(search_status::cancelled,
                                "cancelled before any episode reached the target",
                                stats);
        log_info(cat, "no episode reached the target within bandwidth ({} of {} reached)",
                 stats.successful_episodes, stats.iterations);
        return make_failure(search_status::no_path_found,
                            "no episode reached the target", stats);
    }

    auto cost = model.evaluate(best_route);
    if (!cost)
        return make_failure(search_status::internal_error,
                            "best route failed re-evaluation", stats);

    log_debug(cat, "done: {} episodes, success rate {:.3f}, best reward {:.4f}{}",
              stats.iterations, stats.success_rate(), best_reward,
              cancelled ? " (cancelled)" : "");

    auto result = make_success(std::move(best_route), *cost, stats);
    result.convergence = std::move(convergence);
    return result;
}

/// One-shot Q-learning search with a fresh table.
[[nodiscard]] inline search_result
qlearning_search(graph::qos_network const& g, route_query const& q,
                 qos_weights const& weights, qlearning_params const& params = {},
                 cancel_token const* cancel = nullptr)
{
    auto p = params;
    p.reuse_table = false;
    qlearning_router router(std::move(p));
    return router.search(g, q, weights, cancel);
}

} // namespace qosroute

#endif // QOSROUTE_SOLVER_ALGORITHMS_QLEARNING_H
