/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/Modifier.hpp"
#include "particles/ParticleErrors.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace Ember {

namespace {

template <class... Ts> struct Overloaded : Ts... {
  using Ts::operator()...;
};

void requireCurve(const CurveSet &curves, ScalarCurveId id, const char *who) {
  if (!curves.contains(id)) {
    throw ConfigError(
        std::format("{} references missing scalar curve {}", who, id.index));
  }
}

} // namespace

void GravityModifier::apply(Particle &p, float dt,
                            const ModifierContext &) const {
  p.velocity += gravity * dt;
}

void DragModifier::apply(Particle &p, float dt, const ModifierContext &) const {
  p.velocity *= std::clamp(1.0f - coefficient * dt, 0.0f, 1.0f);
}

void NoiseForceModifier::apply(Particle &p, float dt,
                               const ModifierContext &ctx) const {
  float scale = strength;
  if (strengthCurve.isValid()) {
    scale *= ctx.curves.scalar(strengthCurve).evaluate(p.normalizedAge());
  }
  p.velocity += field.sample(p.position, ctx.time) * (scale * dt);
}

void SizeOverLifeModifier::apply(Particle &p, float,
                                 const ModifierContext &ctx) const {
  p.size = ctx.curves.scalar(curve).evaluate(p.normalizedAge());
}

void ColorOverLifeModifier::apply(Particle &p, float,
                                  const ModifierContext &ctx) const {
  p.color = ctx.curves.gradient(gradient).evaluate(p.normalizedAge());
}

void OpacityOverLifeModifier::apply(Particle &p, float,
                                    const ModifierContext &ctx) const {
  p.color.a = ctx.curves.scalar(curve).evaluate(p.normalizedAge());
}

void PositionIntegrator::apply(Particle &p, float dt,
                               const ModifierContext &) const {
  p.position += p.velocity * dt;
  p.rotation += p.angularVelocity * dt;
}

void validateModifier(const Modifier &modifier, const CurveSet &curves) {
  std::visit(
      Overloaded{
          [](const GravityModifier &m) {
            if (!m.gravity.isFinite()) {
              throw ConfigError("GravityModifier gravity must be finite");
            }
          },
          [](const DragModifier &m) {
            if (!std::isfinite(m.coefficient) || m.coefficient < 0.0f) {
              throw ConfigError(std::format(
                  "DragModifier coefficient must be finite and >= 0: {}",
                  m.coefficient));
            }
          },
          [&](const NoiseForceModifier &m) {
            if (!std::isfinite(m.strength)) {
              throw ConfigError("NoiseForceModifier strength must be finite");
            }
            if (m.strengthCurve.isValid()) {
              requireCurve(curves, m.strengthCurve, "NoiseForceModifier");
            }
          },
          [&](const SizeOverLifeModifier &m) {
            requireCurve(curves, m.curve, "SizeOverLifeModifier");
          },
          [&](const ColorOverLifeModifier &m) {
            if (!curves.contains(m.gradient)) {
              throw ConfigError(std::format(
                  "ColorOverLifeModifier references missing gradient {}",
                  m.gradient.index));
            }
          },
          [&](const OpacityOverLifeModifier &m) {
            requireCurve(curves, m.curve, "OpacityOverLifeModifier");
          },
          [](const PositionIntegrator &) {}},
      modifier);
}

const char *modifierName(const Modifier &modifier) {
  switch (modifier.index()) {
  case 0:
    return "Gravity";
  case 1:
    return "Drag";
  case 2:
    return "NoiseForce";
  case 3:
    return "SizeOverLife";
  case 4:
    return "ColorOverLife";
  case 5:
    return "OpacityOverLife";
  case 6:
    return "PositionIntegrator";
  default:
    return "Unknown";
  }
}

} // namespace Ember
