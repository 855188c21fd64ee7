/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/ParticlePool.hpp"
#include "core/Logger.hpp"
#include "particles/ParticleErrors.hpp"
#include <format>

namespace Ember {

ParticlePool::ParticlePool(size_t capacity) {
  if (capacity == 0) {
    POOL_ERROR("Particle pool capacity must be greater than zero");
    throw ConfigError("ParticlePool capacity must be greater than zero");
  }
  if (capacity > MAX_CAPACITY) {
    throw ConfigError(std::format(
        "ParticlePool capacity {} exceeds the maximum of {}", capacity,
        MAX_CAPACITY));
  }

  m_slots.resize(capacity);
  m_freeSlots.reserve(capacity);
  // Highest index at the bottom so slot 0 is handed out first
  for (size_t i = capacity; i > 0; --i) {
    m_freeSlots.push_back(static_cast<uint32_t>(i - 1));
  }

  POOL_DEBUG(std::format("Particle pool created with {} slots", capacity));
}

std::optional<SlotHandle> ParticlePool::allocate() {
  if (m_freeSlots.empty()) {
    return std::nullopt;
  }

  const uint32_t index = m_freeSlots.back();
  m_freeSlots.pop_back();

  Particle &slot = m_slots[index];
  const uint32_t generation = slot.generation + 1;
  slot = Particle{};
  slot.generation = generation;
  slot.alive = true;
  ++m_liveCount;

  return SlotHandle{index, generation};
}

Particle *ParticlePool::get(SlotHandle handle) {
  if (handle.index >= m_slots.size()) {
    return nullptr;
  }
  Particle &slot = m_slots[handle.index];
  if (!slot.alive || slot.generation != handle.generation) {
    return nullptr;
  }
  return &slot;
}

const Particle *ParticlePool::get(SlotHandle handle) const {
  if (handle.index >= m_slots.size()) {
    return nullptr;
  }
  const Particle &slot = m_slots[handle.index];
  if (!slot.alive || slot.generation != handle.generation) {
    return nullptr;
  }
  return &slot;
}

void ParticlePool::release(uint32_t index) {
  m_slots[index].alive = false;
  m_freeSlots.push_back(index);
  --m_liveCount;
}

size_t ParticlePool::reapExpired() {
  size_t reaped = 0;
  for (size_t i = 0; i < m_slots.size(); ++i) {
    if (m_slots[i].alive && m_slots[i].isExpired()) {
      release(static_cast<uint32_t>(i));
      ++reaped;
    }
  }
  return reaped;
}

void ParticlePool::clear() {
  m_freeSlots.clear();
  for (size_t i = m_slots.size(); i > 0; --i) {
    m_slots[i - 1].alive = false;
    m_freeSlots.push_back(static_cast<uint32_t>(i - 1));
  }
  m_liveCount = 0;
}

} // namespace Ember
