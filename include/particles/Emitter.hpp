/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EMITTER_HPP
#define EMITTER_HPP

/**
 * @file Emitter.hpp
 * @brief Spawn scheduling and initial conditions for new particles
 *
 * The emitter turns elapsed time into a whole number of spawns per frame:
 * continuous emission goes through a fractional accumulator so no particle is
 * lost to rounding, and bursts fire when their scheduled time falls in the
 * frame's half-open window [t, t + dt).
 */

#include "particles/CurveSet.hpp"
#include "particles/SpawnShape.hpp"
#include "utils/Vector3D.hpp"
#include <SDL3/SDL.h>
#include <boost/container/small_vector.hpp>
#include <cstddef>
#include <cstdint>

namespace Ember {

class ParticlePool;
class RandomSource;
struct Particle;

enum class EmitterState : uint8_t {
  Stopped = 0,  // No spawning, clock at zero
  Emitting = 1, // Clock advances and particles spawn
  Paused = 2    // Clock frozen, accumulator kept; manual bursts still spawn
};

/**
 * @brief Scheduled burst: count particles at time, repeated cycles times
 * every interval seconds
 */
struct Burst {
  float time{0.0f};
  uint32_t count{0};
  uint32_t cycles{1};    // >= 1
  float interval{0.0f};  // Must be > 0 when cycles > 1
};

struct FloatRange {
  float min{0.0f};
  float max{0.0f};
};

struct EmitterConfig {
  float rate{10.0f};             // Particles per second, >= 0
  ScalarCurveId rateCurve{};     // Optional scale over duration progress
  float duration{0.0f};          // Seconds per cycle, <= 0 for infinite
  bool looping{true};            // Wrap the clock at duration, else stop
  bool playOnCreate{true};       // Start emitting on construction
  bool resetOnStart{false};      // start() from Paused restarts the clock
  boost::container::small_vector<Burst, 4> bursts;

  SpawnShape shape;
  Vector3D position; // Added to every sampled spawn position

  FloatRange speed{1.0f, 1.0f};
  FloatRange size{1.0f, 1.0f};
  FloatRange lifetime{1.0f, 1.0f}; // Seconds, min > 0
  FloatRange rotation{0.0f, 0.0f};
  FloatRange angularVelocity{0.0f, 0.0f};
  SDL_FColor colorMin{1.0f, 1.0f, 1.0f, 1.0f};
  SDL_FColor colorMax{1.0f, 1.0f, 1.0f, 1.0f};
};

struct SpawnResult {
  size_t requested{0}; // Spawns due this frame
  size_t spawned{0};   // Particles actually created
  size_t dropped{0};   // Spawns denied by a full pool
};

class Emitter {
public:
  /**
   * @throws ConfigError for negative or non-finite rate, a lifetime range
   * that is not strictly positive or is inverted, inverted or non-finite
   * ranges, invalid bursts, or a rate curve missing from curves
   */
  Emitter(EmitterConfig config, const CurveSet &curves);

  /**
   * @brief Stopped or Paused to Emitting
   *
   * From Stopped the clock starts at zero. From Paused the clock and
   * accumulator carry on unless resetOnStart is set.
   */
  void start();

  /**
   * @brief Any state to Stopped; clears the clock, accumulator, spread
   * cursor and any pending manual burst
   */
  void stop();

  void pause();
  void resume();

  /**
   * @brief Queues count extra particles for the next update
   *
   * Ignored while Stopped. The queue saturates at UINT32_MAX.
   */
  void triggerBurst(uint32_t count);

  /**
   * @brief Advances the emitter clock by dt and spawns the particles due
   *
   * Spawning stops at the first allocation the pool denies; the remainder is
   * reported as dropped and not carried over. Any finite dt is handled in
   * constant time, however many duration cycles it spans.
   */
  SpawnResult update(float dt, ParticlePool &pool, RandomSource &rng,
                     const CurveSet &curves);

  EmitterState getState() const { return m_state; }
  bool isEmitting() const { return m_state == EmitterState::Emitting; }
  double getClock() const { return m_clock; }
  double getAccumulator() const { return m_accumulator; }
  uint32_t getPendingBurst() const { return m_pendingBurst; }
  const EmitterConfig &getConfig() const { return m_config; }

private:
  bool hasFiniteDuration() const { return m_config.duration > 0.0f; }

  // Accumulates rate and burst spawns for [start, start + span)
  void accumulateSegment(double start, double span, const CurveSet &curves,
                         double &burstSpawns);

  // Spawns due over the next dt, wrapping or finishing a finite duration
  double advanceClock(float dt, const CurveSet &curves, bool &finished);
  void initializeParticle(Particle &p, RandomSource &rng);

  EmitterConfig m_config;
  EmitterState m_state{EmitterState::Stopped};
  double m_clock{0.0};
  double m_accumulator{0.0};
  uint32_t m_pendingBurst{0};
  SpreadCursor m_spreadCursor{};
};

} // namespace Ember

#endif // EMITTER_HPP
