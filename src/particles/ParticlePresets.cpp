/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/ParticlePresets.hpp"
#include "core/Logger.hpp"
#include "utils/ColorUtils.hpp"
#include <format>

namespace Ember {

ParticleSystem ParticleEffectPreset::createSystem() const {
  PRESET_INFO(std::format("Creating {} effect system", name));
  return ParticleSystem(system, emitter, modifiers, curves);
}

ParticleEffectPreset createFireEffect(uint32_t seed) {
  ParticleEffectPreset fire;
  fire.name = "Fire";
  fire.type = ParticleEffectType::Fire;
  fire.system.capacity = 600;
  fire.system.seed = seed;

  // Narrow upward cone for a controlled flame
  fire.emitter.shape = SpawnShape(ConeShape{0.35f, 0.1f});
  fire.emitter.rate = 100.0f;
  fire.emitter.duration = 0.8f;
  fire.emitter.looping = true;
  // Flicker: a burst every 0.08s across each cycle
  fire.emitter.bursts.push_back(Burst{0.0f, 15, 10, 0.08f});
  fire.emitter.speed = {0.2f, 1.1f};
  fire.emitter.lifetime = {0.2f, 1.8f};
  fire.emitter.size = {0.04f, 0.14f};
  fire.emitter.colorMin = colorFromRGBA(0xFFD700FF); // Bright gold core
  fire.emitter.colorMax = colorFromRGBA(0xFF450088); // Orange-red edge
  fire.emitter.angularVelocity = {-1.0f, 1.0f};

  const GradientId color = fire.curves.addGradient(
      ColorGradient{{0.0f, colorFromRGBA(0xFFD700FF)},
                    {0.4f, colorFromRGBA(0xFF4500CC)},
                    {1.0f, colorFromRGBA(0x2A0A0000)}});
  const ScalarCurveId size = fire.curves.addScalar(ScalarCurve(
      {{0.0f, 0.12f}, {1.0f, 0.02f}}, CurveInterpolation::SmoothStep));

  NoiseFieldConfig turbulence;
  turbulence.seed = seed ^ 0x5F3759DFu;
  turbulence.frequency = 2.0f;

  fire.modifiers.push_back(GravityModifier{Vector3D(0.0f, 0.45f, 0.0f)});
  fire.modifiers.push_back(NoiseForceModifier{NoiseField(turbulence), 0.6f});
  fire.modifiers.push_back(DragModifier{0.8f});
  fire.modifiers.push_back(PositionIntegrator{});
  fire.modifiers.push_back(SizeOverLifeModifier{size});
  fire.modifiers.push_back(ColorOverLifeModifier{color});
  return fire;
}

ParticleEffectPreset createSmokeEffect(uint32_t seed) {
  ParticleEffectPreset smoke;
  smoke.name = "Smoke";
  smoke.type = ParticleEffectType::Smoke;
  smoke.system.capacity = 800;
  smoke.system.seed = seed;

  DirectionParams upward;
  upward.baseMode = DirectionMode::Fixed;
  upward.fixedDirection = Vector3D(0.0f, 1.0f, 0.0f);
  upward.randomizeDirection = 0.3f;
  smoke.emitter.shape = SpawnShape(SphereShape{0.1f}, 1.0f, upward);
  smoke.emitter.rate = 75.0f;
  smoke.emitter.duration = 1.0f;
  smoke.emitter.looping = true;
  // Puffs
  smoke.emitter.bursts.push_back(Burst{0.0f, 5, 4, 0.25f});
  smoke.emitter.speed = {0.15f, 0.6f};
  smoke.emitter.lifetime = {2.0f, 6.0f};
  smoke.emitter.size = {0.05f, 0.2f};
  smoke.emitter.colorMin = colorFromRGBA(0x333333DD); // Dense core
  smoke.emitter.colorMax = colorFromRGBA(0x80808044); // Thin grey
  smoke.emitter.rotation = {0.0f, 6.283185f};
  smoke.emitter.angularVelocity = {-0.5f, 0.5f};

  const ScalarCurveId size = smoke.curves.addScalar(
      ScalarCurve{{0.0f, 0.1f}, {1.0f, 0.6f}});
  const ScalarCurveId opacity = smoke.curves.addScalar(
      ScalarCurve{{0.0f, 0.85f}, {0.3f, 0.6f}, {1.0f, 0.0f}});

  NoiseFieldConfig drift;
  drift.seed = seed ^ 0x2545F491u;
  drift.frequency = 0.8f;
  drift.timeScale = 0.5f;

  smoke.modifiers.push_back(GravityModifier{Vector3D(0.0f, 0.3f, 0.0f)});
  smoke.modifiers.push_back(NoiseForceModifier{NoiseField(drift), 0.3f});
  smoke.modifiers.push_back(DragModifier{0.4f});
  smoke.modifiers.push_back(PositionIntegrator{});
  smoke.modifiers.push_back(SizeOverLifeModifier{size});
  smoke.modifiers.push_back(OpacityOverLifeModifier{opacity});
  return smoke;
}

ParticleEffectPreset createSparksEffect(uint32_t seed) {
  ParticleEffectPreset sparks;
  sparks.name = "Sparks";
  sparks.type = ParticleEffectType::Sparks;
  sparks.system.capacity = 400;
  sparks.system.seed = seed;

  // Wide cone from a single point for an explosive pattern
  sparks.emitter.shape = SpawnShape(ConeShape{1.4f, 0.0f});
  sparks.emitter.rate = 50.0f;
  sparks.emitter.duration = 2.0f; // Short burst effect
  sparks.emitter.looping = false;
  sparks.emitter.bursts.push_back(Burst{0.0f, 38, 1, 0.0f});
  sparks.emitter.speed = {0.8f, 2.0f};
  sparks.emitter.lifetime = {0.3f, 1.2f};
  sparks.emitter.size = {0.01f, 0.03f};
  sparks.emitter.colorMin = colorFromRGBA(0xFFFF00FF); // Bright yellow
  sparks.emitter.colorMax = colorFromRGBA(0xFF8C00FF); // Orange

  const ScalarCurveId fade = sparks.curves.addScalar(
      ScalarCurve{{0.0f, 1.0f}, {0.7f, 1.0f}, {1.0f, 0.0f}});

  sparks.modifiers.push_back(GravityModifier{Vector3D(0.0f, -1.2f, 0.0f)});
  sparks.modifiers.push_back(DragModifier{1.5f});
  sparks.modifiers.push_back(PositionIntegrator{});
  sparks.modifiers.push_back(OpacityOverLifeModifier{fade});
  return sparks;
}

ParticleEffectPreset createRainEffect(uint32_t seed) {
  ParticleEffectPreset rain;
  rain.name = "Rain";
  rain.type = ParticleEffectType::Rain;
  rain.system.capacity = 2000;
  rain.system.seed = seed;
  rain.system.geometryLayout = GeometryLayout::Instanced;

  DirectionParams falling;
  falling.baseMode = DirectionMode::Fixed;
  falling.fixedDirection = Vector3D(0.01f, -1.0f, 0.0f);
  // Thin slab above the play area
  rain.emitter.shape =
      SpawnShape(BoxShape{Vector3D(5.0f, 0.05f, 5.0f)}, 1.0f, falling);
  rain.emitter.position = Vector3D(0.0f, 8.0f, 0.0f);
  rain.emitter.rate = 300.0f;
  rain.emitter.speed = {4.0f, 6.0f};
  rain.emitter.lifetime = {1.5f, 2.5f};
  rain.emitter.size = {0.03f, 0.035f};
  rain.emitter.colorMin = colorFromRGBA(0x1E3A8AFF); // Dark blue
  rain.emitter.colorMax = colorFromRGBA(0x3B82F6FF); // Medium blue

  // Gravity with a light crosswind
  rain.modifiers.push_back(GravityModifier{Vector3D(0.05f, -4.0f, 0.0f)});
  rain.modifiers.push_back(PositionIntegrator{});
  return rain;
}

ParticleEffectPreset createSnowEffect(uint32_t seed) {
  ParticleEffectPreset snow;
  snow.name = "Snow";
  snow.type = ParticleEffectType::Snow;
  snow.system.capacity = 2000;
  snow.system.seed = seed;
  snow.system.geometryLayout = GeometryLayout::Instanced;

  DirectionParams falling;
  falling.baseMode = DirectionMode::Fixed;
  falling.fixedDirection = Vector3D(0.0f, -1.0f, 0.0f);
  falling.randomizeDirection = 0.2f;
  snow.emitter.shape =
      SpawnShape(BoxShape{Vector3D(5.0f, 0.05f, 5.0f)}, 1.0f, falling);
  snow.emitter.position = Vector3D(0.0f, 6.0f, 0.0f);
  snow.emitter.rate = 180.0f;
  snow.emitter.speed = {0.15f, 0.5f};
  snow.emitter.lifetime = {8.0f, 15.0f};
  snow.emitter.size = {0.08f, 0.16f};
  snow.emitter.colorMin = colorFromRGBA(0xFFFAFAFF); // White
  snow.emitter.colorMax = colorFromRGBA(0xE6E6EAFF); // Light grey
  snow.emitter.rotation = {0.0f, 6.283185f};
  snow.emitter.angularVelocity = {-0.8f, 0.8f};

  NoiseFieldConfig flutter;
  flutter.seed = seed ^ 0x9E3779B9u;
  flutter.frequency = 0.5f;
  flutter.octaves = 2;

  // Drag caps the fall speed so flakes drift instead of accelerating
  snow.modifiers.push_back(GravityModifier{Vector3D(-0.02f, -0.6f, 0.0f)});
  snow.modifiers.push_back(NoiseForceModifier{NoiseField(flutter), 0.2f});
  snow.modifiers.push_back(DragModifier{0.8f});
  snow.modifiers.push_back(PositionIntegrator{});
  return snow;
}

ParticleEffectPreset createMagicEffect(uint32_t seed) {
  ParticleEffectPreset magic;
  magic.name = "Magic";
  magic.type = ParticleEffectType::Magic;
  magic.system.capacity = 500;
  magic.system.seed = seed;

  // Ring that is swept back and forth rather than sampled at random
  magic.emitter.shape = SpawnShape(
      CircleShape{0.5f}, 0.0f, DirectionParams{}, EmissionMode::Spread,
      EmissionSpread{0.05f, SpreadLoopMode::PingPong});
  magic.emitter.rate = 60.0f;
  magic.emitter.speed = {0.1f, 0.3f};
  magic.emitter.lifetime = {1.0f, 2.0f};
  magic.emitter.size = {0.03f, 0.06f};
  magic.emitter.colorMin = colorFromRGBA(0x9B59FFFF); // Violet
  magic.emitter.colorMax = colorFromRGBA(0x4FC3F7FF); // Cyan

  const GradientId color = magic.curves.addGradient(
      ColorGradient{{0.0f, colorFromRGBA(0x9B59FFFF)},
                    {0.5f, colorFromRGBA(0x4FC3F7FF)},
                    {1.0f, colorFromRGBA(0x4FC3F700)}});
  const ScalarCurveId size = magic.curves.addScalar(
      ScalarCurve{{0.0f, 0.02f}, {0.2f, 0.06f}, {1.0f, 0.0f}});
  const ScalarCurveId swirl = magic.curves.addScalar(
      ScalarCurve{{0.0f, 0.2f}, {1.0f, 1.0f}});

  NoiseFieldConfig sparkle;
  sparkle.seed = seed ^ 0x68E31DA4u;
  sparkle.frequency = 1.5f;

  magic.modifiers.push_back(GravityModifier{Vector3D(0.0f, 0.2f, 0.0f)});
  magic.modifiers.push_back(
      NoiseForceModifier{NoiseField(sparkle), 0.8f, swirl});
  magic.modifiers.push_back(DragModifier{0.5f});
  magic.modifiers.push_back(PositionIntegrator{});
  magic.modifiers.push_back(SizeOverLifeModifier{size});
  magic.modifiers.push_back(ColorOverLifeModifier{color});
  return magic;
}

ParticleEffectPreset createPreset(ParticleEffectType type, uint32_t seed) {
  switch (type) {
  case ParticleEffectType::Fire:
    return createFireEffect(seed);
  case ParticleEffectType::Smoke:
    return createSmokeEffect(seed);
  case ParticleEffectType::Sparks:
    return createSparksEffect(seed);
  case ParticleEffectType::Rain:
    return createRainEffect(seed);
  case ParticleEffectType::Snow:
    return createSnowEffect(seed);
  case ParticleEffectType::Magic:
    return createMagicEffect(seed);
  case ParticleEffectType::COUNT:
    break;
  }
  PRESET_WARN(std::format("Unknown effect type {}, using Fire",
                          static_cast<int>(type)));
  return createFireEffect(seed);
}

const char *effectTypeToString(ParticleEffectType type) {
  switch (type) {
  case ParticleEffectType::Fire:
    return "Fire";
  case ParticleEffectType::Smoke:
    return "Smoke";
  case ParticleEffectType::Sparks:
    return "Sparks";
  case ParticleEffectType::Rain:
    return "Rain";
  case ParticleEffectType::Snow:
    return "Snow";
  case ParticleEffectType::Magic:
    return "Magic";
  case ParticleEffectType::COUNT:
    break;
  }
  return "Unknown";
}

std::optional<ParticleEffectType> effectTypeFromString(std::string_view name) {
  for (uint8_t i = 0; i < static_cast<uint8_t>(ParticleEffectType::COUNT);
       ++i) {
    const auto type = static_cast<ParticleEffectType>(i);
    if (name == effectTypeToString(type)) {
      return type;
    }
  }
  return std::nullopt;
}

} // namespace Ember
