/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/ParticleSystem.hpp"
#include "core/Logger.hpp"
#include <chrono>
#include <cmath>
#include <format>
#include <utility>

namespace Ember {

ParticleSystem::ParticleSystem(const ParticleSystemConfig &config,
                               EmitterConfig emitter,
                               std::vector<Modifier> modifiers, CurveSet curves)
    : m_config(config), m_curves(std::move(curves)), m_rng(config.seed),
      m_pool(config.capacity), m_emitter(std::move(emitter), m_curves) {
  m_curves.validate();

  bool hasIntegrator = false;
  m_modifiers.reserve(modifiers.size() + 1);
  for (auto &modifier : modifiers) {
    validateModifier(modifier, m_curves);
    hasIntegrator = hasIntegrator || isPositionIntegrator(modifier);
    m_modifiers.push_back(std::move(modifier));
  }
  if (!hasIntegrator) {
    m_modifiers.emplace_back(PositionIntegrator{});
  }

  PARTICLE_SYSTEM_INFO(std::format(
      "ParticleSystem created: capacity {}, seed {}, {} modifiers",
      m_pool.capacity(), m_config.seed, m_modifiers.size()));
}

UpdateStatus ParticleSystem::update(float dt) {
  if (!std::isfinite(dt) || dt < 0.0f) {
    PARTICLE_SYSTEM_WARN(std::format("Rejected invalid timestep: {}", dt));
    return UpdateStatus::InvalidTimestep;
  }

  auto startTime = std::chrono::high_resolution_clock::now();

  const SpawnResult spawn = m_emitter.update(dt, m_pool, m_rng, m_curves);
  m_stats.spawnedTotal += spawn.spawned;
  m_stats.droppedSpawns += spawn.dropped;

  m_elapsedTime += dt;
  const ModifierContext ctx{static_cast<float>(m_elapsedTime), m_curves,
                            m_rng};

  for (Particle &p : m_pool.live()) {
    p.age += dt;
    for (const Modifier &modifier : m_modifiers) {
      applyModifier(modifier, p, dt, ctx);
    }
  }

  m_stats.reapedTotal += m_pool.reapExpired();

  auto endTime = std::chrono::high_resolution_clock::now();
  double timeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();
  m_stats.addUpdateSample(timeMs, m_pool.liveCount());

  return UpdateStatus::Ok;
}

GeometryBuffer ParticleSystem::extractGeometry() const {
  GeometryBuffer out(m_config.geometryLayout);
  extractGeometry(out);
  return out;
}

void ParticleSystem::extractGeometry(GeometryBuffer &out) const {
  auto startTime = std::chrono::high_resolution_clock::now();

  out.setLayout(m_config.geometryLayout);
  out.build(m_pool);

  auto endTime = std::chrono::high_resolution_clock::now();
  m_stats.addExtractSample(
      std::chrono::duration<double, std::milli>(endTime - startTime).count());
}

void ParticleSystem::reset() {
  m_pool.clear();
  m_emitter.stop();
  m_elapsedTime = 0.0;
  m_rng.reseed(m_config.seed);
  m_stats.reset();
  PARTICLE_SYSTEM_DEBUG("ParticleSystem reset");
}

} // namespace Ember
