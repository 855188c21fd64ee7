/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PARTICLE_SYSTEM_HPP
#define PARTICLE_SYSTEM_HPP

/**
 * @file ParticleSystem.hpp
 * @brief One emitter, its particle pool and modifier pipeline
 *
 * A frame is strictly ordered: the emitter spawns, then every live particle
 * ages by dt and runs the modifier pipeline in ascending slot order, then
 * expired particles are reaped. Particles spawned this frame are simulated in
 * the same frame. extractGeometry() is a read-only pass the host calls after
 * update() to get something to draw.
 *
 * Systems are independent and single-threaded; run several with different
 * seeds for several effects.
 */

#include "particles/CurveSet.hpp"
#include "particles/Emitter.hpp"
#include "particles/GeometryBuffer.hpp"
#include "particles/Modifier.hpp"
#include "particles/ParticleErrors.hpp"
#include "particles/ParticlePool.hpp"
#include "particles/RandomSource.hpp"
#include <boost/container/small_vector.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Ember {

struct ParticleSystemConfig {
  size_t capacity{1000};   // Pool size, > 0
  uint32_t seed{5489u};    // RandomSource seed
  GeometryLayout geometryLayout{GeometryLayout::Quads};
};

/**
 * @brief Timing and throughput counters for one system
 */
struct ParticlePerformanceStats {
  double totalUpdateTime{0.0};  // Milliseconds
  double totalExtractTime{0.0}; // Milliseconds
  uint64_t updateCount{0};
  uint64_t extractCount{0};
  size_t activeParticles{0};
  size_t maxParticles{0};
  double particlesPerSecond{0.0};
  uint64_t spawnedTotal{0};
  uint64_t droppedSpawns{0};
  uint64_t reapedTotal{0};

  void addUpdateSample(double timeMs, size_t particleCount) {
    totalUpdateTime += timeMs;
    updateCount++;
    activeParticles = particleCount;
    if (particleCount > maxParticles) {
      maxParticles = particleCount;
    }
    if (totalUpdateTime > 0) {
      particlesPerSecond =
          (activeParticles * updateCount * 1000.0) / totalUpdateTime;
    }
  }

  void addExtractSample(double timeMs) {
    totalExtractTime += timeMs;
    extractCount++;
  }

  double averageUpdateTime() const {
    return updateCount > 0 ? totalUpdateTime / updateCount : 0.0;
  }

  double averageExtractTime() const {
    return extractCount > 0 ? totalExtractTime / extractCount : 0.0;
  }

  void reset() { *this = ParticlePerformanceStats{}; }
};

class ParticleSystem {
public:
  static constexpr size_t INLINE_MODIFIERS = 8;
  using ModifierList = boost::container::small_vector<Modifier, INLINE_MODIFIERS>;

  /**
   * @brief Builds a complete system or throws
   *
   * Appends a PositionIntegrator after the configured modifiers when none is
   * present.
   *
   * @throws ConfigError for zero capacity, an invalid emitter or shape, an
   * invalid modifier, or a curve handle missing from curves
   */
  ParticleSystem(const ParticleSystemConfig &config, EmitterConfig emitter,
                 std::vector<Modifier> modifiers, CurveSet curves);

  ParticleSystem(const ParticleSystem &) = delete;
  ParticleSystem &operator=(const ParticleSystem &) = delete;
  ParticleSystem(ParticleSystem &&) = default;
  ParticleSystem &operator=(ParticleSystem &&) = default;

  /**
   * @brief Advances the simulation by dt seconds
   * @return InvalidTimestep, with all state untouched, if dt is negative or
   * non-finite; Ok otherwise
   */
  UpdateStatus update(float dt);

  /**
   * @brief Snapshot of the live particles in the configured layout
   */
  GeometryBuffer extractGeometry() const;

  /**
   * @brief Rebuilds out in place, reusing its storage
   */
  void extractGeometry(GeometryBuffer &out) const;

  /**
   * @brief Frees every particle, stops the emitter, rewinds the clock and
   * reseeds the random stream
   */
  void reset();

  void start() { m_emitter.start(); }
  void stop() { m_emitter.stop(); }
  void pause() { m_emitter.pause(); }
  void resume() { m_emitter.resume(); }
  void triggerBurst(uint32_t count) { m_emitter.triggerBurst(count); }

  size_t liveCount() const { return m_pool.liveCount(); }
  size_t capacity() const { return m_pool.capacity(); }
  EmitterState emitterState() const { return m_emitter.getState(); }
  double elapsedTime() const { return m_elapsedTime; }

  const ParticlePool &pool() const { return m_pool; }
  const Emitter &emitter() const { return m_emitter; }
  const ModifierList &modifiers() const { return m_modifiers; }
  const CurveSet &curves() const { return m_curves; }
  const ParticleSystemConfig &config() const { return m_config; }
  const ParticlePerformanceStats &performanceStats() const { return m_stats; }
  void resetPerformanceStats() { m_stats.reset(); }

private:
  ParticleSystemConfig m_config;
  CurveSet m_curves;
  RandomSource m_rng;
  ParticlePool m_pool;
  Emitter m_emitter;
  ModifierList m_modifiers;
  double m_elapsedTime{0.0};
  mutable ParticlePerformanceStats m_stats;
};

} // namespace Ember

#endif // PARTICLE_SYSTEM_HPP
