/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/GeometryBuffer.hpp"
#include "particles/ParticlePool.hpp"

namespace Ember {

namespace {

constexpr float CORNER_U[GeometryBuffer::VERTICES_PER_QUAD] = {0.0f, 1.0f,
                                                               1.0f, 0.0f};
constexpr float CORNER_V[GeometryBuffer::VERTICES_PER_QUAD] = {0.0f, 0.0f,
                                                               1.0f, 1.0f};
constexpr uint32_t QUAD_INDICES[GeometryBuffer::INDICES_PER_QUAD] = {
    0, 1, 2, 2, 3, 0};

static_assert(ParticlePool::MAX_CAPACITY * GeometryBuffer::VERTICES_PER_QUAD <=
                  UINT32_MAX,
              "Quad indices of a full pool must fit in uint32_t");

} // namespace

void GeometryBuffer::build(const ParticlePool &pool) {
  clear();
  const size_t liveCount = pool.liveCount();

  if (m_layout == GeometryLayout::Quads) {
    m_vertices.reserve(liveCount * VERTICES_PER_QUAD);
    m_indices.reserve(liveCount * INDICES_PER_QUAD);

    uint32_t base = 0;
    for (const Particle &p : pool.live()) {
      for (size_t c = 0; c < VERTICES_PER_QUAD; ++c) {
        m_vertices.push_back(ParticleVertex{
            p.position.getX(), p.position.getY(), p.position.getZ(),
            CORNER_U[c], CORNER_V[c], p.color, p.size, p.rotation});
      }
      for (uint32_t index : QUAD_INDICES) {
        m_indices.push_back(base + index);
      }
      base += static_cast<uint32_t>(VERTICES_PER_QUAD);
      ++m_particleCount;
    }
  } else {
    m_instances.reserve(liveCount);
    for (const Particle &p : pool.live()) {
      m_instances.push_back(ParticleInstance{p.position.getX(),
                                             p.position.getY(),
                                             p.position.getZ(), p.color,
                                             p.size, p.rotation});
      ++m_particleCount;
    }
  }
}

void GeometryBuffer::clear() {
  m_vertices.clear();
  m_indices.clear();
  m_instances.clear();
  m_particleCount = 0;
}

void GeometryBuffer::setLayout(GeometryLayout layout) {
  if (layout != m_layout) {
    clear();
    m_layout = layout;
  }
}

} // namespace Ember
