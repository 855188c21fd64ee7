/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/Emitter.hpp"
#include "core/Logger.hpp"
#include "particles/ParticleErrors.hpp"
#include "particles/ParticlePool.hpp"
#include "particles/RandomSource.hpp"
#include "utils/ColorUtils.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <utility>

namespace Ember {

namespace {

void requireRange(const FloatRange &range, const char *what) {
  if (!std::isfinite(range.min) || !std::isfinite(range.max) ||
      range.min > range.max) {
    throw ConfigError(std::format(
        "Emitter {} range must be finite with min <= max: [{}, {}]", what,
        range.min, range.max));
  }
}

void validateBurst(const Burst &burst, size_t index) {
  if (!std::isfinite(burst.time) || burst.time < 0.0f) {
    throw ConfigError(std::format(
        "Burst {} time must be finite and >= 0: {}", index, burst.time));
  }
  if (burst.cycles == 0) {
    throw ConfigError(std::format("Burst {} needs at least one cycle", index));
  }
  if (!std::isfinite(burst.interval) || burst.interval < 0.0f) {
    throw ConfigError(std::format(
        "Burst {} interval must be finite and >= 0: {}", index,
        burst.interval));
  }
  if (burst.cycles > 1 && burst.interval <= 0.0f) {
    throw ConfigError(std::format(
        "Burst {} repeats {} times but has no interval", index, burst.cycles));
  }
}

// Index of the first occurrence of a burst at or after bound, in
// [0, cycles]. The division only estimates; exact comparisons settle it.
uint64_t firstOccurrenceFrom(const Burst &burst, double bound) {
  const auto timeOf = [&burst](uint64_t k) {
    return static_cast<double>(burst.time) +
           static_cast<double>(k) * burst.interval;
  };

  const double estimate = std::ceil((bound - burst.time) / burst.interval);
  uint64_t k = 0;
  if (estimate >= static_cast<double>(burst.cycles)) {
    k = burst.cycles;
  } else if (estimate > 0.0) {
    k = static_cast<uint64_t>(estimate);
  }

  while (k > 0 && timeOf(k - 1) >= bound) {
    --k;
  }
  while (k < burst.cycles && timeOf(k) < bound) {
    ++k;
  }
  return k;
}

// Occurrences of a burst whose time lies in [start, end)
uint64_t burstOccurrences(const Burst &burst, double start, double end) {
  if (end <= start) {
    return 0;
  }
  if (burst.cycles == 1) {
    const double t = burst.time;
    return (t >= start && t < end) ? 1 : 0;
  }
  return firstOccurrenceFrom(burst, end) - firstOccurrenceFrom(burst, start);
}

// Converts a spawn count to size_t, saturating far beyond any pool size
size_t saturatingCount(double count) {
  constexpr double LIMIT = static_cast<double>(SIZE_MAX / 2);
  if (!(count > 0.0)) {
    return 0;
  }
  return count >= LIMIT ? static_cast<size_t>(LIMIT)
                        : static_cast<size_t>(count);
}

} // namespace

Emitter::Emitter(EmitterConfig config, const CurveSet &curves)
    : m_config(std::move(config)) {
  if (!std::isfinite(m_config.rate) || m_config.rate < 0.0f) {
    throw ConfigError(std::format(
        "Emitter rate must be finite and >= 0: {}", m_config.rate));
  }
  if (m_config.rateCurve.isValid() && !curves.contains(m_config.rateCurve)) {
    throw ConfigError(std::format("Emitter references missing rate curve {}",
                                  m_config.rateCurve.index));
  }
  if (!std::isfinite(m_config.duration)) {
    throw ConfigError("Emitter duration must be finite");
  }
  if (!m_config.position.isFinite()) {
    throw ConfigError("Emitter position must be finite");
  }

  requireRange(m_config.lifetime, "lifetime");
  if (m_config.lifetime.min <= 0.0f) {
    throw ConfigError(std::format("Emitter lifetime must be > 0: min {}",
                                  m_config.lifetime.min));
  }
  requireRange(m_config.speed, "speed");
  requireRange(m_config.size, "size");
  if (m_config.size.min < 0.0f) {
    throw ConfigError(
        std::format("Emitter size must be >= 0: min {}", m_config.size.min));
  }
  requireRange(m_config.rotation, "rotation");
  requireRange(m_config.angularVelocity, "angular velocity");

  if (!isFiniteColor(m_config.colorMin) || !isFiniteColor(m_config.colorMax)) {
    throw ConfigError("Emitter colors must be finite");
  }

  for (size_t i = 0; i < m_config.bursts.size(); ++i) {
    validateBurst(m_config.bursts[i], i);
  }

  if (m_config.playOnCreate) {
    m_state = EmitterState::Emitting;
  }

  EMITTER_DEBUG(std::format("Emitter created: rate {}/s, {} bursts, duration {}",
                            m_config.rate, m_config.bursts.size(),
                            m_config.duration));
}

void Emitter::start() {
  switch (m_state) {
  case EmitterState::Stopped:
    m_clock = 0.0;
    m_accumulator = 0.0;
    m_state = EmitterState::Emitting;
    break;
  case EmitterState::Paused:
    if (m_config.resetOnStart) {
      m_clock = 0.0;
      m_accumulator = 0.0;
      m_spreadCursor = SpreadCursor{};
    }
    m_state = EmitterState::Emitting;
    break;
  case EmitterState::Emitting:
    break;
  }
}

void Emitter::stop() {
  m_state = EmitterState::Stopped;
  m_clock = 0.0;
  m_accumulator = 0.0;
  m_pendingBurst = 0;
  m_spreadCursor = SpreadCursor{};
}

void Emitter::pause() {
  if (m_state == EmitterState::Emitting) {
    m_state = EmitterState::Paused;
  }
}

void Emitter::resume() {
  if (m_state == EmitterState::Paused) {
    m_state = EmitterState::Emitting;
  }
}

void Emitter::triggerBurst(uint32_t count) {
  if (m_state == EmitterState::Stopped) {
    EMITTER_DEBUG(std::format("Ignoring burst of {} on stopped emitter", count));
    return;
  }
  m_pendingBurst = count > UINT32_MAX - m_pendingBurst ? UINT32_MAX
                                                       : m_pendingBurst + count;
}

void Emitter::accumulateSegment(double start, double span,
                                const CurveSet &curves, double &burstSpawns) {
  double rate = m_config.rate;
  if (m_config.rateCurve.isValid() && hasFiniteDuration()) {
    const float progress = static_cast<float>(start / m_config.duration);
    rate *= curves.scalar(m_config.rateCurve).evaluate(progress);
  }
  m_accumulator += std::max(0.0, rate) * span;

  for (const auto &burst : m_config.bursts) {
    burstSpawns += static_cast<double>(
                       burstOccurrences(burst, start, start + span)) *
                   burst.count;
  }
}

double Emitter::advanceClock(float dt, const CurveSet &curves,
                             bool &finished) {
  double burstSpawns = 0.0;
  const double t = m_clock;
  double remaining = dt;

  if (!hasFiniteDuration()) {
    accumulateSegment(t, remaining, curves, burstSpawns);
    m_clock = t + remaining;
  } else if (t + remaining < m_config.duration) {
    accumulateSegment(t, remaining, curves, burstSpawns);
    m_clock = t + remaining;
  } else {
    // Cycle ends inside this frame
    const double duration = m_config.duration;
    accumulateSegment(t, duration - t, curves, burstSpawns);
    remaining = std::max(0.0, remaining - (duration - t));

    if (!m_config.looping) {
      m_clock = duration;
      finished = true;
    } else {
      // Whole cycles all spawn the same amount, so add them in one step
      const double wholeCycles = std::floor(remaining / duration);
      if (wholeCycles > 0.0) {
        const double accumulatorBefore = m_accumulator;
        double cycleBursts = 0.0;
        accumulateSegment(0.0, duration, curves, cycleBursts);
        const double cycleRate = m_accumulator - accumulatorBefore;
        m_accumulator = accumulatorBefore + cycleRate * wholeCycles;
        burstSpawns += cycleBursts * wholeCycles;
      }

      const double tail = std::fmod(remaining, duration);
      accumulateSegment(0.0, tail, curves, burstSpawns);
      m_clock = tail;
    }
  }

  const double whole = std::floor(m_accumulator);
  m_accumulator -= whole;
  return whole + burstSpawns;
}

void Emitter::initializeParticle(Particle &p, RandomSource &rng) {
  const SpawnShape &shape = m_config.shape;
  const EmittedParticle emitted =
      shape.getEmissionMode() == EmissionMode::Spread
          ? shape.emitAt(rng, m_spreadCursor.advance(shape.getSpread()))
          : shape.emit(rng);

  const float speed = rng.nextRange(m_config.speed.min, m_config.speed.max);
  p.position = m_config.position + emitted.position;
  p.velocity = emitted.direction * speed;
  p.size = rng.nextRange(m_config.size.min, m_config.size.max);
  p.color = lerpColor(m_config.colorMin, m_config.colorMax, rng.nextFloat());
  p.lifetime = rng.nextRange(m_config.lifetime.min, m_config.lifetime.max);
  p.rotation = rng.nextRange(m_config.rotation.min, m_config.rotation.max);
  p.angularVelocity = rng.nextRange(m_config.angularVelocity.min,
                                    m_config.angularVelocity.max);
  p.age = 0.0f;
}

SpawnResult Emitter::update(float dt, ParticlePool &pool, RandomSource &rng,
                            const CurveSet &curves) {
  SpawnResult result;
  if (m_state == EmitterState::Stopped) {
    return result;
  }

  bool finished = false;
  double due = m_pendingBurst;
  if (m_state == EmitterState::Emitting) {
    due += advanceClock(dt, curves, finished);
  }
  m_pendingBurst = 0;
  result.requested = saturatingCount(due);

  for (size_t i = 0; i < result.requested; ++i) {
    auto handle = pool.allocate();
    if (!handle) {
      result.dropped = result.requested - i;
      EMITTER_DEBUG(std::format("Pool full, dropped {} spawns",
                                result.dropped));
      break;
    }
    initializeParticle(*pool.get(*handle), rng);
    ++result.spawned;
  }

  if (finished) {
    EMITTER_DEBUG("Emitter reached end of its duration");
    stop();
  }
  return result;
}

} // namespace Ember
