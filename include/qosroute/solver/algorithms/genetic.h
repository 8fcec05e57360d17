// qosroute/solver/algorithms/genetic.h
// QoS route search library - Solver
// Genetic search over random source -> target walks.
//
// Population members are simple paths of the bandwidth-filtered network.
//
//   seeding    randomised depth-first walks (shuffled neighbour order,
//              bounded length, no revisits) until population_size unique
//              routes are collected or population_size * seed_attempt_factor
//              walks have been tried
//   selection  tournament of tournament_size distinct individuals
//   elitism    the elite_count fittest survive unchanged
//   crossover  splice parent1 up to a shared interior node with parent2
//              after it; without a shared node the fitter parent is copied
//   mutation   replace an interior node by a fresh walk between its two
//              neighbours; unchanged if no walk is found
//
// Splices can revisit a node.  remove_cycles() repairs the offspring so
// every individual stays a simple path.  The best individual seen in any
// generation is returned, since the population best is not monotone when
// elite_count is 0.
//
// Stats field semantics:
//   iterations            generations completed
//   candidates_total      seeding walks + offspring produced
//   candidates_evaluated  cost model calls
//   candidates_rejected   failed or duplicate walks, infeasible offspring
//   improvements          best-so-far updates after seeding
//
// convergence[g] is the fittest member of the population after
// generation g.

#ifndef QOSROUTE_SOLVER_ALGORITHMS_GENETIC_H
#define QOSROUTE_SOLVER_ALGORITHMS_GENETIC_H

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
#include <numeric>
#include <optional>
#include <utility>
#include <vector>

namespace qosroute {

struct genetic_params {
    std::size_t population_size = 50;
    std::size_t generations = 200;
    double crossover_rate = 0.8;
    double mutation_rate = 0.08;
    std::size_t elite_count = 2;
    std::size_t tournament_size = 3;

    /// Upper bound on walk length in nodes, endpoints included.
    std::size_t max_walk_nodes = 30;
    std::size_t seed_attempt_factor = 20;

    /// Stack pops allowed per walk before it gives up.
    std::size_t walk_expansion_limit = 20000;

    double reliability_scale = 1.0;
    std::optional<std::uint64_t> seed;
};

struct individual {
    graph::path route;
    double fitness = std::numeric_limits<double>::infinity();
};

// =============================================================================
// Walk and variation operators
// =============================================================================

/// Randomised depth-first walk from `from` to `to`.  Neighbours are pushed
/// in shuffled order; nodes already on the current branch are skipped.
[[nodiscard]] inline std::optional<graph::path>
random_simple_walk(graph::qos_network const& g, graph::node_id from,
                   graph::node_id to, std::size_t max_nodes,
                   std::size_t expansion_limit, random_engine& rng)
{
    if (from == to) return std::nullopt;

    std::vector<graph::path> stack;
    stack.push_back(graph::path{from});
    std::vector<graph::node_id> nbrs;
    std::size_t expansions = 0;

    while (!stack.empty() && expansions < expansion_limit) {
        auto branch = std::move(stack.back());
        stack.pop_back();
        ++expansions;

        if (branch.back() == to) return branch;
        if (branch.size() >= max_nodes) continue;

        auto const adj = g.out_neighbors(branch.back());
        nbrs.assign(adj.begin(), adj.end());
        std::shuffle(nbrs.begin(), nbrs.end(), rng);
        for (auto v : nbrs) {
            if (std::find(branch.begin(), branch.end(), v) != branch.end()) continue;
            auto next = branch;
            next.push_back(v);
            stack.push_back(std::move(next));
        }
    }
    return std::nullopt;
}

/// One-point crossover at a shared interior node.  nullopt if the parents
/// share no interior node.
[[nodiscard]] inline std::optional<graph::path>
splice_crossover(graph::path const& p1, graph::path const& p2, random_engine& rng)
{
    if (p1.size() < 3 || p2.size() < 3) return std::nullopt;

    std::vector<graph::node_id> common;
    for (std::size_t i = 1; i + 1 < p1.size(); ++i) {
        if (std::find(p2.begin() + 1, p2.end() - 1, p1[i]) != p2.end() - 1)
            common.push_back(p1[i]);
    }
    if (common.empty()) return std::nullopt;

    auto const cut = pick(rng, common);
    auto const i1 = std::find(p1.begin(), p1.end(), cut);
    auto const i2 = std::find(p2.begin(), p2.end(), cut);

    graph::path child(p1.begin(), i1 + 1);
    child.insert(child.end(), i2 + 1, p2.end());
    return graph::remove_cycles(child);
}

/// Re-route around one interior node.  Returns p unchanged when it has no
/// interior node or no alternative walk is found.
[[nodiscard]] inline graph::path
reroute_mutation(graph::qos_network const& g, graph::path const& p,
                 genetic_params const& params, random_engine& rng)
{
    if (p.size() < 3) return p;
    auto const idx = uniform_index(rng, 1, p.size() - 2);
    auto const sub = random_simple_walk(g, p[idx - 1], p[idx + 1],
                                        params.max_walk_nodes,
                                        params.walk_expansion_limit, rng);
    if (!sub) return p;

    graph::path out(p.begin(), p.begin() + static_cast<std::ptrdiff_t>(idx));
    out.insert(out.end(), sub->begin() + 1, sub->end() - 1);
    out.insert(out.end(), p.begin() + static_cast<std::ptrdiff_t>(idx) + 1, p.end());
    return graph::remove_cycles(out);
}

/// Index of the fittest of tournament_size distinct random members.
[[nodiscard]] inline std::size_t
tournament_select(std::vector<individual> const& pop, std::size_t tournament_size,
                  random_engine& rng)
{
    auto const k = std::min(std::max<std::size_t>(tournament_size, 1), pop.size());
    std::vector<std::size_t> idx(pop.size());
    std::iota(idx.begin(), idx.end(), std::size_t{0});

    std::size_t winner = 0;
    double best = std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < k; ++i) {
        auto const j = uniform_index(rng, i, idx.size() - 1);
        std::swap(idx[i], idx[j]);
        if (i == 0 || pop[idx[i]].fitness < best) {
            best = pop[idx[i]].fitness;
            winner = idx[i];
        }
    }
    return winner;
}

// =============================================================================
// genetic_search
// =============================================================================

[[nodiscard]] inline search_result
genetic_search(graph::qos_network const& g, route_query const& q,
               qos_weights const& weights, genetic_params const& params = {},
               cancel_token const* cancel = nullptr)
{
    constexpr auto cat = log_category::genetic;

    if (params.population_size == 0 || params.tournament_size == 0)
        return make_failure(search_status::invalid_input,
            "genetic search needs a non-empty population and tournament");

    auto setup = prepare_search(g, q, cat);
    if (setup.failure) return std::move(*setup.failure);

    if (is_cancelled(cancel))
        return make_failure(search_status::cancelled, "cancelled before seeding");

    auto const& net = setup.filtered;
    route_cost_model const model(net, weights, params.reliability_scale);
    auto rng = make_engine(params.seed);
    search_stats stats{};

    log_debug(cat, "start: population {} generations {}",
              params.population_size, params.generations);

    // --- Seeding ---

    std::vector<individual> population;
    population.reserve(params.population_size);
    auto const attempt_budget = params.population_size * params.seed_attempt_factor;

    for (std::size_t attempt = 0;
         attempt < attempt_budget && population.size() < params.population_size;
         ++attempt) {
        stats.candidates_total++;
        auto walk = random_simple_walk(net, q.source, q.target,
                                       params.max_walk_nodes,
                                       params.walk_expansion_limit, rng);
        if (!walk) {
            stats.candidates_rejected++;
            continue;
        }
        auto const dup = std::find_if(population.begin(), population.end(),
            [&](individual const& m) { return m.route == *walk; });
        if (dup != population.end()) {
            stats.candidates_rejected++;
            continue;
        }
        auto const f = model.fitness(*walk);
        stats.candidates_evaluated++;
        if (f == std::numeric_limits<double>::infinity()) {
            stats.candidates_rejected++;
            continue;
        }
        population.push_back(individual{std::move(*walk), f});
    }

    if (population.empty()) {
        log_info(cat, "no feasible population after {} walks", attempt_budget);
        return make_failure(search_status::no_path_found,
                            "no feasible population", stats);
    }

    auto by_fitness = [](individual const& a, individual const& b) {
        return a.fitness < b.fitness;
    };

    individual best = *std::min_element(population.begin(), population.end(),
                                        by_fitness);
    std::vector<double> convergence;
    convergence.reserve(params.generations);

    // --- Generational loop ---

    bool cancelled = false;
    for (std::size_t gen = 0; gen < params.generations; ++gen) {
        if (is_cancelled(cancel)) {
            cancelled = true;
            break;
        }

        std::stable_sort(population.begin(), population.end(), by_fitness);

        std::vector<individual> next;
        next.reserve(params.population_size);
        auto const elites = std::min(params.elite_count, population.size());
        next.insert(next.end(), population.begin(),
                    population.begin() + static_cast<std::ptrdiff_t>(elites));

        while (next.size() < params.population_size) {
            auto const& p1 = population[tournament_select(population, params.tournament_size, rng)];
            auto const& p2 = population[tournament_select(population, params.tournament_size, rng)];
            auto const& fitter = p1.fitness <= p2.fitness ? p1 : p2;

            graph::path child;
            if (uniform01(rng) < params.crossover_rate) {
                auto x = splice_crossover(p1.route, p2.route, rng);
                child = x ? std::move(*x) : fitter.route;
            } else {
                child = fitter.route;
            }
            if (uniform01(rng) < params.mutation_rate) {
                child = reroute_mutation(net, child, params, rng);
            }

            stats.candidates_total++;
            auto const f = model.fitness(child);
            stats.candidates_evaluated++;
            if (f == std::numeric_limits<double>::infinity()) {
                stats.candidates_rejected++;
                next.push_back(fitter);
                continue;
            }
            next.push_back(individual{std::move(child), f});
        }

        population = std::move(next);
        stats.iterations++;

        auto const& gen_best = *std::min_element(population.begin(),
                                                 population.end(), by_fitness);
        convergence.push_back(gen_best.fitness);
        if (gen_best.fitness < best.fitness) {
            best = gen_best;
            stats.improvements++;
            log_trace(cat, "generation {} improved best to {:.6f}", gen, best.fitness);
        }
    }

    auto cost = model.evaluate(best.route);
    if (!cost)
        return make_failure(search_status::internal_error,
                            "best individual failed re-evaluation", stats);

    log_debug(cat, "done: {} generations, best fitness {:.6f}, {} hops{}",
              stats.iterations, cost->fitness, graph::hop_count(best.route),
              cancelled ? " (cancelled)" : "");

    auto result = make_success(std::move(best.route), *cost, stats);
    result.convergence = std::move(convergence);
    return result;
}

} // namespace qosroute

#endif // QOSROUTE_SOLVER_ALGORITHMS_GENETIC_H
