/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PARTICLE_PRESETS_HPP
#define PARTICLE_PRESETS_HPP

/**
 * @file ParticlePresets.hpp
 * @brief Built-in effect configurations
 *
 * Each preset is a complete, valid configuration: hosts either build a system
 * from it directly or tweak the fields first. Units are world units with +Y
 * up, the emitter at the origin.
 */

#include "particles/CurveSet.hpp"
#include "particles/Emitter.hpp"
#include "particles/Modifier.hpp"
#include "particles/ParticleSystem.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Ember {

enum class ParticleEffectType : uint8_t {
  Fire = 0,
  Smoke = 1,
  Sparks = 2,
  Rain = 3,
  Snow = 4,
  Magic = 5,
  COUNT = 6
};

struct ParticleEffectPreset {
  std::string name;
  ParticleEffectType type{ParticleEffectType::Fire};
  ParticleSystemConfig system;
  EmitterConfig emitter;
  std::vector<Modifier> modifiers;
  CurveSet curves;

  /**
   * @brief Builds a system from a copy of this preset
   * @throws ConfigError if the preset was edited into an invalid state
   */
  ParticleSystem createSystem() const;
};

ParticleEffectPreset createFireEffect(uint32_t seed = 5489u);
ParticleEffectPreset createSmokeEffect(uint32_t seed = 5489u);
ParticleEffectPreset createSparksEffect(uint32_t seed = 5489u);
ParticleEffectPreset createRainEffect(uint32_t seed = 5489u);
ParticleEffectPreset createSnowEffect(uint32_t seed = 5489u);
ParticleEffectPreset createMagicEffect(uint32_t seed = 5489u);

ParticleEffectPreset createPreset(ParticleEffectType type,
                                  uint32_t seed = 5489u);

const char *effectTypeToString(ParticleEffectType type);

/**
 * @brief Case-sensitive lookup by the names effectTypeToString returns
 */
std::optional<ParticleEffectType> effectTypeFromString(std::string_view name);

} // namespace Ember

#endif // PARTICLE_PRESETS_HPP
