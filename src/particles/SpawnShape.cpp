/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/SpawnShape.hpp"
#include "core/Logger.hpp"
#include "particles/ParticleErrors.hpp"
#include "particles/RandomSource.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <cmath>
#include <format>
#include <utility>

namespace Ember {

namespace {

template <class... Ts> struct Overloaded : Ts... {
  using Ts::operator()...;
};

constexpr float TWO_PI = 2.0f * SDL_PI_F;

void requireNonNegative(float value, const char *what) {
  if (!std::isfinite(value) || value < 0.0f) {
    SHAPE_ERROR(std::format("Invalid {}: {}", what, value));
    throw ConfigError(
        std::format("SpawnShape {} must be finite and >= 0: {}", what, value));
  }
}

void requireUnit(float value, const char *what) {
  if (!std::isfinite(value) || value < 0.0f || value > 1.0f) {
    throw ConfigError(
        std::format("SpawnShape {} must be in [0, 1]: {}", what, value));
  }
}

// Radius fraction for uniform sampling of a disc annulus (dim 2) or spherical
// shell (dim 3) whose inner radius is `inner` of the outer one
float shellRadius(float inner, float u, int dim) {
  if (dim == 2) {
    const float i2 = inner * inner;
    return std::sqrt(i2 + (1.0f - i2) * u);
  }
  const float i3 = inner * inner * inner;
  return std::cbrt(i3 + (1.0f - i3) * u);
}

} // namespace

float SpreadCursor::advance(const EmissionSpread &spread) {
  const float previous = index;
  index += upwards ? spread.amount : -spread.amount;

  switch (spread.loopMode) {
  case SpreadLoopMode::Loop:
    // Every cycle restarts at 0 so all cycles emit the same parameters
    if (index > 1.0f) {
      index = 0.0f;
    }
    break;
  case SpreadLoopMode::PingPong:
    // Reflect off the end so the end value is emitted once per pass
    if (index > 1.0f) {
      upwards = false;
      index = std::max(0.0f, previous - spread.amount);
    } else if (index < 0.0f) {
      upwards = true;
      index = std::min(1.0f, previous + spread.amount);
    }
    break;
  }
  return std::clamp(previous, 0.0f, 1.0f);
}

SpawnShape::SpawnShape(ShapeVariant shape, float thickness,
                       DirectionParams direction, EmissionMode mode,
                       EmissionSpread spread)
    : m_shape(std::move(shape)), m_thickness(thickness),
      m_direction(direction), m_mode(mode), m_spread(spread) {
  std::visit(
      Overloaded{
          [](const PointShape &) {},
          [](const SphereShape &s) { requireNonNegative(s.radius, "radius"); },
          [](const BoxShape &b) {
            requireNonNegative(b.halfExtents.getX(), "half extent X");
            requireNonNegative(b.halfExtents.getY(), "half extent Y");
            requireNonNegative(b.halfExtents.getZ(), "half extent Z");
          },
          [](const ConeShape &c) {
            requireNonNegative(c.height, "height");
            if (!std::isfinite(c.angle) || c.angle < 0.0f ||
                c.angle >= SDL_PI_F * 0.5f) {
              throw ConfigError(std::format(
                  "SpawnShape cone angle must be in [0, pi/2): {}", c.angle));
            }
          },
          [](const CircleShape &c) { requireNonNegative(c.radius, "radius"); },
          [](const MeshShape &m) {
            if (m.vertices.empty()) {
              SHAPE_ERROR("Rejected mesh shape without vertices");
              throw ConfigError("SpawnShape mesh needs at least one vertex");
            }
            for (size_t i = 0; i < m.vertices.size(); ++i) {
              if (!m.vertices[i].isFinite()) {
                throw ConfigError(std::format(
                    "SpawnShape mesh vertex {} is not finite", i));
              }
            }
            if (!m.nominalCenter.isFinite()) {
              throw ConfigError("SpawnShape mesh center must be finite");
            }
          }},
      m_shape);

  requireUnit(m_thickness, "thickness");
  requireUnit(m_direction.randomizeDirection, "randomize direction");
  requireUnit(m_direction.spherizeDirection, "spherize direction");

  if (m_direction.baseMode == DirectionMode::Fixed &&
      (!m_direction.fixedDirection.isFinite() ||
       m_direction.fixedDirection.lengthSquared() < 1e-12f)) {
    throw ConfigError("SpawnShape fixed direction must be a finite non-zero "
                      "vector");
  }

  if (m_mode == EmissionMode::Spread &&
      (!std::isfinite(m_spread.amount) || m_spread.amount <= 0.0f ||
       m_spread.amount > 1.0f)) {
    throw ConfigError(std::format(
        "SpawnShape spread amount must be in (0, 1]: {}", m_spread.amount));
  }
}

EmittedParticle SpawnShape::sampleBase(RandomSource &rng,
                                       float primary) const {
  const float inner = 1.0f - m_thickness;

  return std::visit(
      Overloaded{
          [&](const PointShape &) {
            return EmittedParticle{Vector3D(), rng.nextUnitVector()};
          },
          [&](const SphereShape &s) {
            // Uniform z with the azimuth as primary parameter
            const float z = rng.nextRange(-1.0f, 1.0f);
            const float phi = primary * TWO_PI;
            const float ring = std::sqrt(std::max(0.0f, 1.0f - z * z));
            const Vector3D dir(ring * std::cos(phi), z, ring * std::sin(phi));
            const float r = s.radius * shellRadius(inner, rng.nextFloat(), 3);
            return EmittedParticle{dir * r, dir};
          },
          [&](const BoxShape &b) {
            const Vector3D &h = b.halfExtents;
            const Vector3D pos(-h.getX() + 2.0f * h.getX() * primary,
                               rng.nextRange(-h.getY(), h.getY()),
                               rng.nextRange(-h.getZ(), h.getZ()));
            return EmittedParticle{pos, pos.normalized()};
          },
          [&](const ConeShape &c) {
            const float phi = primary * TWO_PI;
            const float cosPhi = std::cos(phi);
            const float sinPhi = std::sin(phi);

            // Volume of the cone up to height y grows with y^3
            const float y = c.height * std::cbrt(rng.nextFloat());
            const float maxRadius = y * std::tan(c.angle);
            const float r = maxRadius * shellRadius(inner, rng.nextFloat(), 2);
            const Vector3D pos(r * cosPhi, y, r * sinPhi);

            // Uniform over the spherical cap of the cone's solid angle
            const float cosTheta =
                1.0f - rng.nextFloat() * (1.0f - std::cos(c.angle));
            const float sinTheta =
                std::sqrt(std::max(0.0f, 1.0f - cosTheta * cosTheta));
            const Vector3D dir(sinTheta * cosPhi, cosTheta, sinTheta * sinPhi);
            return EmittedParticle{pos, dir};
          },
          [&](const CircleShape &c) {
            const float phi = primary * TWO_PI;
            const Vector3D radial(std::cos(phi), 0.0f, std::sin(phi));
            const float r = c.radius * shellRadius(inner, rng.nextFloat(), 2);
            return EmittedParticle{radial * r, radial};
          },
          [&](const MeshShape &m) {
            const size_t count = m.vertices.size();
            const size_t index = std::min(
                count - 1, static_cast<size_t>(primary * static_cast<float>(
                                                             count)));
            const Vector3D &vertex = m.vertices[index];
            const float scale = rng.nextRange(inner, 1.0f);
            return EmittedParticle{vertex * scale,
                                   (vertex - m.nominalCenter).normalized()};
          }},
      m_shape);
}

void SpawnShape::applyDirectionParams(EmittedParticle &particle,
                                      RandomSource &rng) const {
  if (m_direction.baseMode == DirectionMode::Fixed) {
    particle.direction = m_direction.fixedDirection.normalized();
  }

  const float randomize = m_direction.randomizeDirection;
  if (randomize > 0.0f) {
    const Vector3D randomDir = rng.nextUnitVector();
    particle.direction =
        (randomDir * randomize + particle.direction * (1.0f - randomize))
            .normalized();
  }

  const float spherize = m_direction.spherizeDirection;
  if (spherize > 0.0f) {
    particle.direction = (particle.position * spherize +
                          particle.direction * (1.0f - spherize))
                             .normalized();
  }
}

EmittedParticle SpawnShape::emit(RandomSource &rng) const {
  EmittedParticle particle = sampleBase(rng, rng.nextFloat());
  applyDirectionParams(particle, rng);
  return particle;
}

EmittedParticle SpawnShape::emitAt(RandomSource &rng, float spreadParam) const {
  EmittedParticle particle =
      sampleBase(rng, std::clamp(spreadParam, 0.0f, 1.0f));
  applyDirectionParams(particle, rng);
  return particle;
}

Vector3D SpawnShape::samplePosition(RandomSource &rng) const {
  return emit(rng).position;
}

Vector3D SpawnShape::sampleDirection(RandomSource &rng) const {
  return emit(rng).direction;
}

} // namespace Ember
