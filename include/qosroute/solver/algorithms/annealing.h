// qosroute/solver/algorithms/annealing.h
// QoS route search library - Solver
// Simulated annealing with two-phase cooling, tabu memory and restart.
//
// Phases:
//   init     minimum-hop route on the bandwidth-filtered network
//   cooling  while T > final_temperature: markov_length proposals at T,
//            then T <- T * alpha, alpha = alpha_phase1 for the first
//            phase_threshold cooling steps and alpha_phase2 after
//   restart  at the end of a cooling step, if more than max_no_improve
//            accepted moves have not improved the best route and restarts
//            remain, T is reheated to reheat_fraction * T0 and the search
//            resumes from the best route
//
// Neighbour strategy by temperature ratio T/T0:
//   > swap_threshold     swap two interior nodes
//   > two_opt_threshold  reverse an interior segment
//   otherwise            segment re-route: drop the arcs of a sub-segment
//                        and join its endpoints by a minimum-hop detour;
//                        when no detour exists a 2-opt is tried instead
// With probability strategy_mix_probability the strategy is drawn
// uniformly instead.  A candidate must be a simple path with finite cost.
// A candidate found in the tabu memory is discarded with probability
// tabu_rejection_probability.  After neighbour_attempts failures a single
// 2-opt is tried, and failing that the current route is proposed again.
//
// Acceptance is Metropolis: delta < 0 always, otherwise with probability
// exp(-delta / T), so delta == 0 is always accepted.
//
// Stats field semantics:
//   iterations            cooling steps completed
//   candidates_total      proposals (markov_length per cooling step)
//   candidates_evaluated  cost model calls, including failed attempts
//   candidates_rejected   attempts discarded (invalid, infeasible, tabu)
//   moves_accepted        Metropolis acceptances
//   improvements          best-so-far updates
//   restarts              reheats

#ifndef QOSROUTE_SOLVER_ALGORITHMS_ANNEALING_H
#define QOSROUTE_SOLVER_ALGORITHMS_ANNEALING_H

#include "../search_result.h"
#include "../search_setup.h"
#include "../../core/cancel_token.h"
#include "../../core/log.h"
#include "../../core/random.h"
#include "../../cost/cost_model.h"
#include "../../graph/network.h"
#include "../../graph/path.h"
#include "../../graph/shortest_path.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <initializer_list>
#include <limits>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace qosroute {

struct annealing_params {
    double initial_temperature = 300.0;
    double final_temperature = 1.0;
    double alpha_phase1 = 0.85;
    double alpha_phase2 = 0.80;
    std::size_t phase_threshold = 15;
    std::size_t markov_length = 50;

    std::size_t tabu_size = 10;
    double tabu_rejection_probability = 0.5;

    bool enable_restart = true;
    std::size_t max_no_improve = 50;
    std::size_t max_restarts = 3;
    double reheat_fraction = 0.7;

    std::size_t neighbour_attempts = 5;
    double strategy_mix_probability = 0.1;
    double swap_threshold = 0.6;
    double two_opt_threshold = 0.3;

    double reliability_scale = 1.0;
    std::optional<std::uint64_t> seed;
};

enum class neighbour_strategy : std::uint8_t {
    swap,
    two_opt,
    segment_reroute,
    fallback_two_opt,
    unchanged,
};

inline constexpr std::size_t neighbour_strategy_count = 5;

[[nodiscard]] constexpr std::string_view to_string(neighbour_strategy s) noexcept {
    switch (s) {
        case neighbour_strategy::swap:             return "swap";
        case neighbour_strategy::two_opt:          return "two_opt";
        case neighbour_strategy::segment_reroute:  return "segment_reroute";
        case neighbour_strategy::fallback_two_opt: return "fallback_two_opt";
        case neighbour_strategy::unchanged:        return "unchanged";
    }
    return "unknown";
}

/// Per-cooling-step diagnostics.
struct annealing_history {
    std::vector<double> best_cost;
    std::vector<double> acceptance_rate;
    std::vector<double> temperature;

    /// Proposals by the move that produced them, indexed by
    /// neighbour_strategy.  fallback_two_opt counts 2-opt moves standing in
    /// for a failed segment re-route as well as the post-attempt 2-opt.
    std::array<std::size_t, neighbour_strategy_count> strategy_usage{};
    std::size_t restarts = 0;

    [[nodiscard]] std::size_t cooling_steps() const noexcept { return best_cost.size(); }

    [[nodiscard]] std::size_t usage(neighbour_strategy s) const noexcept {
        return strategy_usage[static_cast<std::size_t>(s)];
    }
};

// =============================================================================
// Acceptance and tabu memory
// =============================================================================

/// Metropolis criterion.  Consumes one draw only when delta >= 0.
[[nodiscard]] inline bool
metropolis_accept(double delta, double temperature, random_engine& rng) {
    if (delta < 0.0) return true;
    if (!(temperature > 0.0)) return false;
    return uniform01(rng) < std::exp(-delta / temperature);
}

/// Bounded most-recently-used set of path signatures.
class tabu_memory {
public:
    explicit tabu_memory(std::size_t capacity) : capacity_(capacity) {}

    [[nodiscard]] bool contains(std::uint64_t sig) const {
        return std::find(entries_.begin(), entries_.end(), sig) != entries_.end();
    }

    void record(std::uint64_t sig) {
        if (capacity_ == 0) return;
        auto const it = std::find(entries_.begin(), entries_.end(), sig);
        if (it != entries_.end()) entries_.erase(it);
        entries_.push_back(sig);
        if (entries_.size() > capacity_) entries_.pop_front();
    }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

private:
    std::size_t capacity_;
    std::deque<std::uint64_t> entries_;
};

// =============================================================================
// Neighbourhood moves
// =============================================================================

/// Exchange two interior nodes.  Needs at least two interior nodes.
[[nodiscard]] inline std::optional<graph::path>
swap_move(graph::path const& p, random_engine& rng) {
    if (p.size() < 4) return std::nullopt;
    auto const i = uniform_index(rng, 1, p.size() - 2);
    auto j = uniform_index(rng, 1, p.size() - 3);
    if (j >= i) ++j;
    auto out = p;
    std::swap(out[i], out[j]);
    return out;
}

/// Reverse the interior segment [i, j].
[[nodiscard]] inline std::optional<graph::path>
two_opt_move(graph::path const& p, random_engine& rng) {
    if (p.size() < 4) return std::nullopt;
    auto const i = uniform_index(rng, 1, p.size() - 3);
    auto const j = uniform_index(rng, i + 1, p.size() - 2);
    auto out = p;
    std::reverse(out.begin() + static_cast<std::ptrdiff_t>(i),
                 out.begin() + static_cast<std::ptrdiff_t>(j) + 1);
    return out;
}

/// Replace the sub-segment p[i..j] by a minimum-hop detour that avoids
/// its arcs (in both directions).  nullopt if no detour exists.
[[nodiscard]] inline std::optional<graph::path>
segment_reroute_move(graph::qos_network const& g, graph::path const& p,
                     random_engine& rng) {
    if (p.size() < 2) return std::nullopt;
    auto const i = uniform_index(rng, 0, p.size() - 2);
    auto const j = uniform_index(rng, i + 1, p.size() - 1);

    std::vector<graph::edge_id> banned;
    for (auto k = i; k < j; ++k) {
        for (auto e : {g.find_edge(p[k], p[k + 1]), g.find_edge(p[k + 1], p[k])}) {
            if (e != graph::invalid_edge) banned.push_back(e);
        }
    }
    auto const detour = graph::min_hop_path(g, p[i], p[j], [&](graph::edge_id e) {
        return std::find(banned.begin(), banned.end(), e) != banned.end();
    });
    if (!detour) return std::nullopt;

    graph::path out(p.begin(), p.begin() + static_cast<std::ptrdiff_t>(i));
    out.insert(out.end(), detour->begin(), detour->end());
    out.insert(out.end(), p.begin() + static_cast<std::ptrdiff_t>(j) + 1, p.end());
    return graph::remove_cycles(out);
}

// =============================================================================
// annealing_search
// =============================================================================

namespace detail {

struct annealing_state {
    graph::qos_network const& net;
    route_cost_model const& model;
    annealing_params const& params;
    random_engine& rng;
    tabu_memory& tabu;
    search_stats& stats;
    annealing_history& history;
};

struct proposal {
    graph::path route;
    double fitness;
};

[[nodiscard]] inline neighbour_strategy
pick_strategy(annealing_state& s, double temperature_ratio) {
    if (uniform01(s.rng) < s.params.strategy_mix_probability) {
        return static_cast<neighbour_strategy>(uniform_index(s.rng, 0, 2));
    }
    if (temperature_ratio > s.params.swap_threshold) return neighbour_strategy::swap;
    if (temperature_ratio > s.params.two_opt_threshold) return neighbour_strategy::two_opt;
    return neighbour_strategy::segment_reroute;
}

/// Score a candidate; nullopt if it is not a simple finite-cost route.
[[nodiscard]] inline std::optional<double>
score(annealing_state& s, graph::path const& candidate) {
    if (!graph::is_simple_path(candidate)) return std::nullopt;
    s.stats.candidates_evaluated++;
    auto const f = s.model.fitness(candidate);
    if (f == std::numeric_limits<double>::infinity()) return std::nullopt;
    return f;
}

[[nodiscard]] inline proposal
propose(annealing_state& s, proposal const& current, double temperature_ratio) {
    auto const strategy = pick_strategy(s, temperature_ratio);

    for (std::size_t attempt = 0; attempt < s.params.neighbour_attempts; ++attempt) {
        std::optional<graph::path> cand;
        auto used = strategy;
        switch (strategy) {
            case neighbour_strategy::swap:
                cand = swap_move(current.route, s.rng);
                break;
            case neighbour_strategy::two_opt:
                cand = two_opt_move(current.route, s.rng);
                break;
            default:
                cand = segment_reroute_move(s.net, current.route, s.rng);
                if (!cand) {
                    cand = two_opt_move(current.route, s.rng);
                    used = neighbour_strategy::fallback_two_opt;
                }
                break;
        }
        if (!cand) {
            s.stats.candidates_rejected++;
            continue;
        }
        if (s.tabu.contains(graph::path_signature(*cand)) &&
            uniform01(s.rng) < s.params.tabu_rejection_probability) {
            s.stats.candidates_rejected++;
            continue;
        }
        if (auto f = score(s, *cand)) {
            s.history.strategy_usage[static_cast<std::size_t>(used)]++;
            return proposal{std::move(*cand), *f};
        }
        s.stats.candidates_rejected++;
    }

    if (auto cand = two_opt_move(current.route, s.rng)) {
        if (auto f = score(s, *cand)) {
            s.history.strategy_usage[static_cast<std::size_t>(
                neighbour_strategy::fallback_two_opt)]++;
            return proposal{std::move(*cand), *f};
        }
        s.stats.candidates_rejected++;
    }

    s.history.strategy_usage[static_cast<std::size_t>(neighbour_strategy::unchanged)]++;
    return current;
}

} // namespace detail

/// Simulated annealing route search.  When history is non-null it receives
/// the per-cooling-step trace of this run.
[[nodiscard]] inline search_result
annealing_search(graph::qos_network const& g, route_query const& q,
                 qos_weights const& weights, annealing_params const& params = {},
                 cancel_token const* cancel = nullptr,
                 annealing_history* history = nullptr)
{
    constexpr auto cat = log_category::annealing;

    if (!(params.final_temperature > 0.0) ||
        !(params.initial_temperature > params.final_temperature))
        return make_failure(search_status::invalid_input,
            "annealing needs initial_temperature > final_temperature > 0");
    auto alpha_ok = [](double a) { return a > 0.0 && a < 1.0; };
    if (!alpha_ok(params.alpha_phase1) || !alpha_ok(params.alpha_phase2))
        return make_failure(search_status::invalid_input,
            "annealing cooling coefficients must lie in (0, 1)");
    if (params.markov_length == 0)
        return make_failure(search_status::invalid_input,
            "annealing needs a non-empty markov block");

    auto setup = prepare_search(g, q, cat);
    if (setup.failure) return std::move(*setup.failure);

    auto const& net = setup.filtered;
    route_cost_model const model(net, weights, params.reliability_scale);
    auto rng = make_engine(params.seed);
    search_stats stats{};
    tabu_memory tabu(params.tabu_size);
    annealing_history local_history;
    auto& trace = history ? *history : local_history;
    trace = annealing_history{};

    auto init = graph::min_hop_path(net, q.source, q.target);
    if (!init)
        return make_failure(search_status::infeasible_demand,
                            "no initial route", stats);

    detail::annealing_state state{net, model, params, rng, tabu, stats, trace};

    stats.candidates_evaluated++;
    detail::proposal current{std::move(*init), 0.0};
    current.fitness = model.fitness(current.route);
    if (current.fitness == std::numeric_limits<double>::infinity())
        return make_failure(search_status::internal_error,
                            "initial route has no finite cost", stats);

    auto best = current;
    std::size_t no_improve = 0;
    double temperature = params.initial_temperature;
    std::vector<double> convergence;

    log_debug(cat, "start: T0 {} Tf {} markov {} initial fitness {:.6f}",
              params.initial_temperature, params.final_temperature,
              params.markov_length, current.fitness);

    bool cancelled = false;
    std::size_t step = 0;
    while (temperature > params.final_temperature) {
        if (is_cancelled(cancel)) {
            cancelled = true;
            break;
        }
        ++step;
        auto const alpha = step <= params.phase_threshold ? params.alpha_phase1
                                                          : params.alpha_phase2;

        std::size_t accepted = 0;
        for (std::size_t k = 0; k < params.markov_length; ++k) {
            stats.candidates_total++;
            auto cand = detail::propose(state, current,
                                        temperature / params.initial_temperature);
            auto const delta = cand.fitness - current.fitness;
            if (!metropolis_accept(delta, temperature, rng)) continue;

            current = std::move(cand);
            ++accepted;
            stats.moves_accepted++;
            tabu.record(graph::path_signature(current.route));

            if (current.fitness < best.fitness) {
                best = current;
                no_improve = 0;
                stats.improvements++;
            } else {
                ++no_improve;
            }
        }

        stats.iterations++;
        trace.best_cost.push_back(best.fitness);
        trace.acceptance_rate.push_back(
            static_cast<double>(accepted) / static_cast<double>(params.markov_length));
        trace.temperature.push_back(temperature);
        convergence.push_back(best.fitness);

        if (params.enable_restart && no_improve > params.max_no_improve &&
            trace.restarts < params.max_restarts) {
            trace.restarts++;
            stats.restarts++;
            temperature = params.initial_temperature * params.reheat_fraction;
            no_improve = 0;
            current = best;
            log_trace(cat, "restart {} at step {}", trace.restarts, step);
        }

        temperature *= alpha;
    }

    auto cost = model.evaluate(best.route);
    if (!cost)
        return make_failure(search_status::internal_error,
                            "best route failed re-evaluation", stats);

    log_debug(cat, "done: {} cooling steps, {} restarts, best fitness {:.6f}{}",
              stats.iterations, stats.restarts, cost->fitness,
              cancelled ? " (cancelled)" : "");

    auto result = make_success(std::move(best.route), *cost, stats);
    result.convergence = std::move(convergence);
    return result;
}

} // namespace qosroute

#endif // QOSROUTE_SOLVER_ALGORITHMS_ANNEALING_H
