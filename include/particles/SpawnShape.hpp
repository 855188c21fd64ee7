/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPAWN_SHAPE_HPP
#define SPAWN_SHAPE_HPP

/**
 * @file SpawnShape.hpp
 * @brief Initial position and direction sampling for new particles
 *
 * Shapes are a closed set held in a std::variant and dispatched with
 * std::visit, so the spawn loop never goes through a virtual call. All
 * entropy comes from the RandomSource passed in; a shape has no mutable state
 * and can be shared read-only between systems.
 *
 * Local frame: +Y is up. Circles lie in the XZ plane and cones open along +Y
 * from their apex at the origin.
 */

#include "utils/Vector3D.hpp"
#include <cstdint>
#include <variant>
#include <vector>

namespace Ember {

class RandomSource;

struct PointShape {};

struct SphereShape {
  float radius{1.0f};
};

struct BoxShape {
  Vector3D halfExtents{0.5f, 0.5f, 0.5f};
};

struct ConeShape {
  float angle{0.436332f}; // Half-angle in radians, [0, pi/2)
  float height{1.0f};     // Apex-to-base distance, 0 emits from the apex
};

struct CircleShape {
  float radius{1.0f};
};

/**
 * @brief Emits from the vertices of a convex mesh
 *
 * Each spawn picks a vertex and scales it toward the origin by a random
 * factor in [1 - thickness, 1]. The automatic direction points from
 * nominalCenter through the chosen vertex.
 */
struct MeshShape {
  std::vector<Vector3D> vertices; // Non-empty, finite
  Vector3D nominalCenter;
};

using ShapeVariant = std::variant<PointShape, SphereShape, BoxShape, ConeShape,
                                  CircleShape, MeshShape>;

enum class DirectionMode : uint8_t {
  Automatic = 0, // Direction comes from the shape
  Fixed = 1      // Every particle uses fixedDirection
};

struct DirectionParams {
  DirectionMode baseMode{DirectionMode::Automatic};
  Vector3D fixedDirection{0.0f, 1.0f, 0.0f};
  float randomizeDirection{0.0f}; // Blend toward a random direction, [0,1]
  float spherizeDirection{0.0f};  // Blend toward the spawn position, [0,1]
};

enum class EmissionMode : uint8_t {
  Random = 0, // Particles are placed randomly in the shape
  Spread = 1  // The shape's primary parameter advances in discrete steps
};

enum class SpreadLoopMode : uint8_t {
  Loop = 0,    // Wraps back to the start after each cycle
  PingPong = 1 // Reverses direction at each end
};

struct EmissionSpread {
  float amount{0.1f}; // Step size in (0, 1]; 0.1 spawns at 10% intervals
  SpreadLoopMode loopMode{SpreadLoopMode::Loop};
};

/**
 * @brief Position of the spread cycle; owned by the emitter, not the shape
 */
struct SpreadCursor {
  float index{0.0f};
  bool upwards{true};

  /**
   * @brief Steps the cursor and returns the parameter to emit at, in [0,1]
   */
  float advance(const EmissionSpread &spread);
};

struct EmittedParticle {
  Vector3D position;
  Vector3D direction{0.0f, 1.0f, 0.0f};
};

class SpawnShape {
public:
  SpawnShape() = default;

  /**
   * @param shape Region to sample
   * @param thickness Emitting proportion of the volume: 0 samples the outer
   * surface only, 1 the whole volume. Used by sphere, circle, cone and mesh;
   * boxes always sample their volume.
   * @throws ConfigError for negative or non-finite dimensions, a cone angle
   * outside [0, pi/2), a mesh without vertices or with non-finite ones,
   * blend factors or thickness outside [0,1], a zero fixed direction, or a
   * spread amount outside (0,1]
   */
  explicit SpawnShape(ShapeVariant shape, float thickness = 1.0f,
                      DirectionParams direction = DirectionParams{},
                      EmissionMode mode = EmissionMode::Random,
                      EmissionSpread spread = EmissionSpread{});

  /**
   * @brief Samples position and direction with a random primary parameter
   */
  EmittedParticle emit(RandomSource &rng) const;

  /**
   * @brief Samples with the primary parameter fixed (spread emission)
   *
   * The primary parameter is the azimuth for sphere, circle and cone, the
   * X coordinate for boxes and the vertex position in the list for meshes.
   * Points ignore it.
   */
  EmittedParticle emitAt(RandomSource &rng, float spreadParam) const;

  Vector3D samplePosition(RandomSource &rng) const;
  Vector3D sampleDirection(RandomSource &rng) const;

  const ShapeVariant &getShape() const { return m_shape; }
  float getThickness() const { return m_thickness; }
  const DirectionParams &getDirectionParams() const { return m_direction; }
  EmissionMode getEmissionMode() const { return m_mode; }
  const EmissionSpread &getSpread() const { return m_spread; }

private:
  EmittedParticle sampleBase(RandomSource &rng, float primary) const;
  void applyDirectionParams(EmittedParticle &particle,
                            RandomSource &rng) const;

  ShapeVariant m_shape{PointShape{}};
  float m_thickness{1.0f};
  DirectionParams m_direction{};
  EmissionMode m_mode{EmissionMode::Random};
  EmissionSpread m_spread{};
};

} // namespace Ember

#endif // SPAWN_SHAPE_HPP
