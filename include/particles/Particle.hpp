/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PARTICLE_HPP
#define PARTICLE_HPP

#include "utils/Vector3D.hpp"
#include <SDL3/SDL.h>
#include <cstdint>

namespace Ember {

/**
 * @brief Fixed-layout particle record stored by value in a ParticlePool
 *
 * Only the emitter writes a freshly allocated particle and only the modifier
 * pipeline mutates it afterwards. While alive, age stays within [0, lifetime];
 * a particle whose age passed its lifetime is reaped at the end of the frame.
 */
struct Particle {
  Vector3D position;
  Vector3D velocity;
  SDL_FColor color{1.0f, 1.0f, 1.0f, 1.0f};
  float size{1.0f};
  float age{0.0f};      // Seconds since spawn
  float lifetime{1.0f}; // Fixed at spawn, always > 0
  float rotation{0.0f};        // Radians, billboard orientation hint
  float angularVelocity{0.0f}; // Radians per second
  uint32_t generation{0};      // Bumped every time the slot is reused
  bool alive{false};

  /**
   * @brief Age as a fraction of lifetime, clamped to [0,1]
   */
  float normalizedAge() const {
    const float t = age / lifetime;
    return t < 0.0f ? 0.0f : (t > 1.0f ? 1.0f : t);
  }

  bool isExpired() const { return age > lifetime; }
};

} // namespace Ember

#endif // PARTICLE_HPP
