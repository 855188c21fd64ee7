/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PARTICLE_POOL_HPP
#define PARTICLE_POOL_HPP

/**
 * @file ParticlePool.hpp
 * @brief Fixed-capacity particle arena with slot reuse
 *
 * All slots are allocated once at construction and the pool never grows.
 * Freed slots go on a LIFO stack so recently used (cache-warm) slots are
 * handed out first. Particles are only released by reapExpired() and clear(),
 * which keeps double frees unreachable from outside the pool.
 */

#include "particles/Particle.hpp"
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <type_traits>
#include <vector>

namespace Ember {

/**
 * @brief Names one particle slot at one generation
 *
 * A handle goes stale as soon as its particle is reaped; get() then returns
 * nullptr even if the slot was reused.
 */
struct SlotHandle {
  uint32_t index{0};
  uint32_t generation{0};
  bool operator==(const SlotHandle &) const = default;
};

class ParticlePool {
public:
  /**
   * @brief Forward iterator over live slots in ascending index order
   */
  template <bool Const> class LiveIterator {
  public:
    using SlotVector =
        std::conditional_t<Const, const std::vector<Particle>,
                           std::vector<Particle>>;
    using iterator_category = std::forward_iterator_tag;
    using value_type = Particle;
    using difference_type = std::ptrdiff_t;
    using pointer = std::conditional_t<Const, const Particle *, Particle *>;
    using reference = std::conditional_t<Const, const Particle &, Particle &>;

    LiveIterator() = default;
    LiveIterator(SlotVector *slots, size_t index)
        : m_slots(slots), m_index(index) {
      skipDead();
    }

    reference operator*() const { return (*m_slots)[m_index]; }
    pointer operator->() const { return &(*m_slots)[m_index]; }

    LiveIterator &operator++() {
      ++m_index;
      skipDead();
      return *this;
    }
    LiveIterator operator++(int) {
      LiveIterator tmp = *this;
      ++(*this);
      return tmp;
    }

    bool operator==(const LiveIterator &other) const {
      return m_index == other.m_index;
    }

    size_t slotIndex() const { return m_index; }

  private:
    void skipDead() {
      while (m_index < m_slots->size() && !(*m_slots)[m_index].alive) {
        ++m_index;
      }
    }

    SlotVector *m_slots{nullptr};
    size_t m_index{0};
  };

  template <bool Const> class LiveRange {
  public:
    using iterator = LiveIterator<Const>;
    LiveRange(typename iterator::SlotVector *slots) : m_slots(slots) {}
    iterator begin() const { return iterator(m_slots, 0); }
    iterator end() const { return iterator(m_slots, m_slots->size()); }

  private:
    typename iterator::SlotVector *m_slots;
  };

  // Largest pool whose quad geometry still fits 32-bit vertex indices
  static constexpr size_t MAX_CAPACITY = UINT32_MAX / 4;

  /**
   * @throws ConfigError if capacity is 0 or above MAX_CAPACITY
   */
  explicit ParticlePool(size_t capacity);

  ParticlePool(const ParticlePool &) = delete;
  ParticlePool &operator=(const ParticlePool &) = delete;
  ParticlePool(ParticlePool &&) = default;
  ParticlePool &operator=(ParticlePool &&) = default;

  /**
   * @brief Claims a free slot, reset to a default live particle
   * @return Handle to the slot, or std::nullopt when the pool is full
   */
  std::optional<SlotHandle> allocate();

  /**
   * @brief Resolves a handle; nullptr if it is out of range or stale
   */
  Particle *get(SlotHandle handle);
  const Particle *get(SlotHandle handle) const;

  /**
   * @brief Frees every live particle whose age exceeds its lifetime
   * @return Number of particles freed
   */
  size_t reapExpired();

  /**
   * @brief Frees every slot; all outstanding handles become stale
   */
  void clear();

  /**
   * @brief Lazy range over live particles; invalidated by allocate/reap/clear
   */
  LiveRange<false> live() { return LiveRange<false>(&m_slots); }
  LiveRange<true> live() const { return LiveRange<true>(&m_slots); }

  size_t liveCount() const { return m_liveCount; }
  size_t capacity() const { return m_slots.size(); }
  bool isFull() const { return m_freeSlots.empty(); }
  bool isEmpty() const { return m_liveCount == 0; }

private:
  void release(uint32_t index);

  std::vector<Particle> m_slots;
  std::vector<uint32_t> m_freeSlots; // Stack; back() is the next slot out
  size_t m_liveCount{0};
};

} // namespace Ember

#endif // PARTICLE_POOL_HPP
