// core/random.h - Solver-owned pseudo-random source
// Part of the QoS route search library (C++20)
//
// Every solver call constructs its own engine from an optional seed.
// With a seed the search is reproducible; without one the engine is
// seeded from std::random_device.  Nothing here is global.

#ifndef QOSROUTE_CORE_RANDOM_H
#define QOSROUTE_CORE_RANDOM_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <stdexcept>
#include <vector>

namespace qosroute {

using random_engine = std::mt19937_64;

[[nodiscard]] inline random_engine make_engine(std::optional<std::uint64_t> seed) {
    if (seed) return random_engine{*seed};
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    return random_engine{seq};
}

/// Uniform draw in [0, 1).
[[nodiscard]] inline double uniform01(random_engine& rng) {
    return std::uniform_real_distribution<double>(0.0, 1.0)(rng);
}

/// Uniform draw in [lo, hi).
[[nodiscard]] inline double uniform_real(random_engine& rng, double lo, double hi) {
    return std::uniform_real_distribution<double>(lo, hi)(rng);
}

/// Uniform integer in [lo, hi] (inclusive).
[[nodiscard]] inline std::size_t uniform_index(random_engine& rng,
                                               std::size_t lo, std::size_t hi) {
    return std::uniform_int_distribution<std::size_t>(lo, hi)(rng);
}

/// Uniformly chosen element of a non-empty vector.
template<typename T>
[[nodiscard]] T const& pick(random_engine& rng, std::vector<T> const& items) {
    if (items.empty())
        throw std::invalid_argument("pick: empty candidate set");
    return items[uniform_index(rng, 0, items.size() - 1)];
}

} // namespace qosroute

#endif // QOSROUTE_CORE_RANDOM_H
