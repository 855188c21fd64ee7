/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MODIFIER_HPP
#define MODIFIER_HPP

/**
 * @file Modifier.hpp
 * @brief Per-particle, per-frame transforms
 *
 * Modifiers are a closed set held in a std::variant and run in the order the
 * host configured them. Writers of the same field compose by that order: a
 * SizeOverLifeModifier placed last always wins, a GravityModifier placed
 * after the PositionIntegrator only affects the next frame's motion.
 */

#include "particles/CurveSet.hpp"
#include "particles/NoiseField.hpp"
#include "particles/Particle.hpp"
#include "utils/Vector3D.hpp"
#include <variant>

namespace Ember {

class RandomSource;

/**
 * @brief Read-only frame state shared by every modifier call in a frame
 */
struct ModifierContext {
  float time;              // Seconds since the system was created or reset
  const CurveSet &curves;  // Curves referenced by modifier handles
  RandomSource &rng;       // System random stream
};

struct GravityModifier {
  Vector3D gravity{0.0f, -9.81f, 0.0f};

  void apply(Particle &p, float dt, const ModifierContext &ctx) const;
};

// Linear drag, velocity scaled by clamp(1 - coefficient * dt, 0, 1) so a
// large step stops the particle instead of reversing it
struct DragModifier {
  float coefficient{0.5f};

  void apply(Particle &p, float dt, const ModifierContext &ctx) const;
};

struct NoiseForceModifier {
  NoiseField field{};
  float strength{1.0f};
  ScalarCurveId strengthCurve{}; // Optional scale over normalized age

  void apply(Particle &p, float dt, const ModifierContext &ctx) const;
};

struct SizeOverLifeModifier {
  ScalarCurveId curve;

  void apply(Particle &p, float dt, const ModifierContext &ctx) const;
};

struct ColorOverLifeModifier {
  GradientId gradient;

  void apply(Particle &p, float dt, const ModifierContext &ctx) const;
};

// Writes alpha only, so it can follow a ColorOverLifeModifier
struct OpacityOverLifeModifier {
  ScalarCurveId curve;

  void apply(Particle &p, float dt, const ModifierContext &ctx) const;
};

/**
 * @brief Explicit Euler step for position and rotation
 *
 * Accurate enough for visual particles at frame-rate steps. A pipeline with
 * no integrator gets one appended after the configured modifiers.
 */
struct PositionIntegrator {
  void apply(Particle &p, float dt, const ModifierContext &ctx) const;
};

using Modifier =
    std::variant<GravityModifier, DragModifier, NoiseForceModifier,
                 SizeOverLifeModifier, ColorOverLifeModifier,
                 OpacityOverLifeModifier, PositionIntegrator>;

inline void applyModifier(const Modifier &modifier, Particle &p, float dt,
                          const ModifierContext &ctx) {
  std::visit([&](const auto &m) { m.apply(p, dt, ctx); }, modifier);
}

/**
 * @brief Checks a modifier's parameters and curve handles
 * @throws ConfigError for non-finite or negative parameters, or a curve
 * handle missing from curves
 */
void validateModifier(const Modifier &modifier, const CurveSet &curves);

inline bool isPositionIntegrator(const Modifier &modifier) {
  return std::holds_alternative<PositionIntegrator>(modifier);
}

const char *modifierName(const Modifier &modifier);

} // namespace Ember

#endif // MODIFIER_HPP
