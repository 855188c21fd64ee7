/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RANDOM_SOURCE_HPP
#define RANDOM_SOURCE_HPP

#include "utils/Vector3D.hpp"
#include <cstdint>
#include <random>

namespace Ember {

/**
 * @brief Seeded pseudo-random stream used by every stochastic particle
 * operation
 *
 * Wraps std::mt19937, whose output sequence is fixed by the standard. Floats
 * are built from the top 24 bits of each draw instead of going through
 * std::uniform_real_distribution, so a seed produces the same stream with any
 * standard library. Never shared through global state: each ParticleSystem
 * owns one and passes it down explicitly.
 */
class RandomSource {
public:
  explicit RandomSource(uint32_t seed = 5489u);

  /**
   * @brief Restarts the stream from a new seed
   */
  void reseed(uint32_t seed);

  uint32_t getSeed() const { return m_seed; }

  /**
   * @brief Uniform float in [0, 1)
   */
  float nextFloat();

  /**
   * @brief Uniform float in [lo, hi); returns lo when lo == hi
   */
  float nextRange(float lo, float hi);

  /**
   * @brief Uniform integer in [0, bound); 0 when bound is 0
   */
  uint32_t nextUInt(uint32_t bound);

  /**
   * @brief Uniformly distributed direction on the unit sphere
   */
  Vector3D nextUnitVector();

  /**
   * @brief Uniformly distributed point inside the unit ball
   */
  Vector3D nextInsideUnitSphere();

private:
  std::mt19937 m_engine;
  uint32_t m_seed;
};

} // namespace Ember

#endif // RANDOM_SOURCE_HPP
