// core/search_stats.h - Counters collected during a route search
// Part of the QoS route search library (C++20)
//
// DESIGN RATIONALE:
// search_stats is a plain aggregate so it can be copied into results,
// summed across runs, and compared in tests.  Each solver populates the
// subset of fields that applies to it:
//
//   field                  genetic      swarm       annealing    qlearning
//   iterations             generations  iterations  cool steps   episodes
//   candidates_total       offspring    particles   proposals    steps
//   candidates_evaluated   cost calls   cost calls  cost calls   terminals
//   candidates_rejected    infeasible   no route    invalid      violations
//   moves_accepted         -            -           accepted     -
//   improvements           best updates (all solvers)
//   restarts               -            -           reheats      -
//   successful_episodes    -            -           -            reached

#ifndef QOSROUTE_CORE_SEARCH_STATS_H
#define QOSROUTE_CORE_SEARCH_STATS_H

#include <cstddef>

namespace qosroute {

struct search_stats {
    // =============================================================================
    // Loop Metrics
    // =============================================================================

    /// Outer iterations actually executed (may stop early on cancellation).
    std::size_t iterations = 0;

    // =============================================================================
    // Candidate Metrics
    // =============================================================================

    /// Candidate routes or moves generated.
    std::size_t candidates_total = 0;

    /// Candidates scored by the cost model.
    std::size_t candidates_evaluated = 0;

    /// Candidates discarded as infeasible or invalid.
    std::size_t candidates_rejected = 0;

    // =============================================================================
    // Search-Specific Metrics
    // =============================================================================

    /// Metropolis-accepted moves (annealing).
    std::size_t moves_accepted = 0;

    /// Times the best-known route improved.
    std::size_t improvements = 0;

    /// Reheats performed (annealing).
    std::size_t restarts = 0;

    /// Episodes that reached the target (Q-learning).
    std::size_t successful_episodes = 0;

    // =============================================================================
    // Aggregation Operations
    // =============================================================================

    constexpr search_stats operator+(search_stats const& other) const {
        return search_stats{
            .iterations = iterations + other.iterations,
            .candidates_total = candidates_total + other.candidates_total,
            .candidates_evaluated = candidates_evaluated + other.candidates_evaluated,
            .candidates_rejected = candidates_rejected + other.candidates_rejected,
            .moves_accepted = moves_accepted + other.moves_accepted,
            .improvements = improvements + other.improvements,
            .restarts = restarts + other.restarts,
            .successful_episodes = successful_episodes + other.successful_episodes,
        };
    }

    constexpr search_stats& operator+=(search_stats const& other) {
        *this = *this + other;
        return *this;
    }

    // =============================================================================
    // Derived Metrics
    // =============================================================================

    /// Fraction of evaluated candidates accepted (0.0 if none evaluated).
    [[nodiscard]] constexpr double acceptance_rate() const {
        if (candidates_evaluated == 0) return 0.0;
        return static_cast<double>(moves_accepted) /
               static_cast<double>(candidates_evaluated);
    }

    /// Fraction of generated candidates rejected.
    [[nodiscard]] constexpr double rejection_rate() const {
        if (candidates_total == 0) return 0.0;
        return static_cast<double>(candidates_rejected) /
               static_cast<double>(candidates_total);
    }

    /// Fraction of outer iterations that ended successfully (Q-learning).
    [[nodiscard]] constexpr double success_rate() const {
        if (iterations == 0) return 0.0;
        return static_cast<double>(successful_episodes) /
               static_cast<double>(iterations);
    }

    constexpr bool operator==(search_stats const& other) const = default;
};

} // namespace qosroute

#endif // QOSROUTE_CORE_SEARCH_STATS_H
