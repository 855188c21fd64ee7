/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GEOMETRY_BUFFER_HPP
#define GEOMETRY_BUFFER_HPP

#include <SDL3/SDL.h>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Ember {

class ParticlePool;

enum class GeometryLayout : uint8_t {
  Quads = 0,    // 4 vertices and 6 indices per particle
  Instanced = 1 // 1 instance record per particle, no indices
};

/**
 * Billboard quad vertex. All four vertices of a particle carry its center;
 * the UV identifies the corner so the vertex shader can expand the quad by
 * size and rotation facing the camera.
 */
struct ParticleVertex {
  float x, y, z;     // Particle center (12 bytes)
  float u, v;        // Corner (8 bytes)
  SDL_FColor color;  // RGBA (16 bytes)
  float size;        // (4 bytes)
  float rotation;    // Radians (4 bytes)
  // Total: 44 bytes per vertex
};

static_assert(sizeof(ParticleVertex) == 44, "ParticleVertex must be 44 bytes");
static_assert(offsetof(ParticleVertex, u) == 12,
              "ParticleVertex::u must be at offset 12");
static_assert(offsetof(ParticleVertex, color) == 20,
              "ParticleVertex::color must be at offset 20");
static_assert(offsetof(ParticleVertex, size) == 36,
              "ParticleVertex::size must be at offset 36");
static_assert(offsetof(ParticleVertex, rotation) == 40,
              "ParticleVertex::rotation must be at offset 40");

/**
 * Per-instance record for instanced drawing of a shared quad.
 */
struct ParticleInstance {
  float x, y, z;     // (12 bytes)
  SDL_FColor color;  // (16 bytes)
  float size;        // (4 bytes)
  float rotation;    // (4 bytes)
  // Total: 36 bytes per instance
};

static_assert(sizeof(ParticleInstance) == 36,
              "ParticleInstance must be 36 bytes");
static_assert(offsetof(ParticleInstance, color) == 12,
              "ParticleInstance::color must be at offset 12");
static_assert(offsetof(ParticleInstance, size) == 28,
              "ParticleInstance::size must be at offset 28");

/**
 * @brief Renderable snapshot of a pool's live particles
 *
 * Rebuilt from scratch on every build() in ascending slot order. Storage is
 * kept between builds, so a buffer reused every frame stops allocating once it
 * has seen the peak particle count.
 */
class GeometryBuffer {
public:
  static constexpr size_t VERTICES_PER_QUAD = 4;
  static constexpr size_t INDICES_PER_QUAD = 6;

  explicit GeometryBuffer(GeometryLayout layout = GeometryLayout::Quads)
      : m_layout(layout) {}

  /**
   * @brief Replaces the contents with the pool's live particles
   */
  void build(const ParticlePool &pool);

  /**
   * @brief Empties the buffer, keeping its storage
   */
  void clear();

  /**
   * @brief Switches layout; takes effect on the next build()
   */
  void setLayout(GeometryLayout layout);
  GeometryLayout getLayout() const { return m_layout; }

  // Vertices for Quads, instance records for Instanced
  size_t getVertexCount() const {
    return m_layout == GeometryLayout::Quads ? m_vertices.size()
                                             : m_instances.size();
  }
  size_t getIndexCount() const { return m_indices.size(); }
  size_t getParticleCount() const { return m_particleCount; }
  bool isEmpty() const { return m_particleCount == 0; }

  const std::vector<ParticleVertex> &getVertices() const { return m_vertices; }
  const std::vector<uint32_t> &getIndices() const { return m_indices; }
  const std::vector<ParticleInstance> &getInstances() const {
    return m_instances;
  }

  size_t getVertexStride() const {
    return m_layout == GeometryLayout::Quads ? sizeof(ParticleVertex)
                                             : sizeof(ParticleInstance);
  }

private:
  GeometryLayout m_layout;
  std::vector<ParticleVertex> m_vertices;
  std::vector<uint32_t> m_indices;
  std::vector<ParticleInstance> m_instances;
  size_t m_particleCount{0};
};

} // namespace Ember

#endif // GEOMETRY_BUFFER_HPP
