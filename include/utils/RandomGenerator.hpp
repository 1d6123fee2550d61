/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RANDOM_GENERATOR_HPP
#define RANDOM_GENERATOR_HPP

#include <cstddef>
#include <cstdint>
#include <random>

namespace DinerEngine {

/**
 * @brief Seedable pseudo-random source owned by the game world.
 *
 * Every random decision in the simulation (customer archetype, order,
 * seat choice) goes through one instance so a fixed seed replays the same
 * game.
 */
class RandomGenerator {
public:
    explicit RandomGenerator(uint32_t seed = 0) : m_rng(seed) {}

    void reseed(uint32_t seed) { m_rng.seed(seed); }

    // Uniform integer in [min, max]
    int rangeInt(int min, int max) {
        std::uniform_int_distribution<int> dist(min, max);
        return dist(m_rng);
    }

    /**
     * @brief Picks an index with probability proportional to its weight
     */
    template <typename It>
    size_t weightedIndex(It first, It last) {
        std::discrete_distribution<size_t> dist(first, last);
        return dist(m_rng);
    }

    std::mt19937& engine() { return m_rng; }

private:
    std::mt19937 m_rng;
};

} // namespace DinerEngine

#endif // RANDOM_GENERATOR_HPP
