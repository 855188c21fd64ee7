/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/RandomSource.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <cmath>

namespace Ember {

RandomSource::RandomSource(uint32_t seed) : m_engine(seed), m_seed(seed) {}

void RandomSource::reseed(uint32_t seed) {
  m_seed = seed;
  m_engine.seed(seed);
}

float RandomSource::nextFloat() {
  // 24 significant bits fit exactly in a float mantissa, so the result is
  // strictly below 1.0
  return static_cast<float>(m_engine() >> 8) * (1.0f / 16777216.0f);
}

float RandomSource::nextRange(float lo, float hi) {
  return lo + (hi - lo) * nextFloat();
}

uint32_t RandomSource::nextUInt(uint32_t bound) {
  if (bound == 0) {
    return 0;
  }
  // Lemire's multiply-shift; the tiny bias is irrelevant for visual sampling
  return static_cast<uint32_t>(
      (static_cast<uint64_t>(m_engine()) * static_cast<uint64_t>(bound)) >> 32);
}

Vector3D RandomSource::nextUnitVector() {
  // Archimedes: uniform z and azimuth give a uniform point on the sphere
  const float z = nextRange(-1.0f, 1.0f);
  const float phi = nextFloat() * 2.0f * SDL_PI_F;
  const float r = std::sqrt(std::max(0.0f, 1.0f - z * z));
  return Vector3D(r * std::cos(phi), r * std::sin(phi), z);
}

Vector3D RandomSource::nextInsideUnitSphere() {
  const Vector3D dir = nextUnitVector();
  return dir * std::cbrt(nextFloat());
}

} // namespace Ember
