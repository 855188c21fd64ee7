/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ParticlePoolTests
#include <boost/test/unit_test.hpp>

#include "particles/ParticleErrors.hpp"
#include "particles/ParticlePool.hpp"
#include <vector>

using namespace Ember;

namespace {

std::vector<SlotHandle> fill(ParticlePool &pool, size_t count) {
  std::vector<SlotHandle> handles;
  for (size_t i = 0; i < count; ++i) {
    auto handle = pool.allocate();
    BOOST_REQUIRE(handle.has_value());
    handles.push_back(*handle);
  }
  return handles;
}

void expire(ParticlePool &pool, SlotHandle handle) {
  Particle *p = pool.get(handle);
  BOOST_REQUIRE(p != nullptr);
  p->age = p->lifetime + 0.01f;
}

} // namespace

BOOST_AUTO_TEST_SUITE(ParticlePoolAllocationTests)

BOOST_AUTO_TEST_CASE(TestZeroCapacityRejected) {
  BOOST_CHECK_THROW(ParticlePool(0), ConfigError);
}

BOOST_AUTO_TEST_CASE(TestCapacityLimitedByQuadIndexRange) {
  // A full pool's last quad index must still fit in 32 bits
  BOOST_CHECK_LE(ParticlePool::MAX_CAPACITY * 4 - 1, size_t{UINT32_MAX});
  BOOST_CHECK_THROW(ParticlePool(ParticlePool::MAX_CAPACITY + 1), ConfigError);
  BOOST_CHECK_THROW(ParticlePool(size_t{UINT32_MAX}), ConfigError);
}

BOOST_AUTO_TEST_CASE(TestNewPoolIsEmpty) {
  ParticlePool pool(16);
  BOOST_CHECK_EQUAL(pool.capacity(), 16u);
  BOOST_CHECK_EQUAL(pool.liveCount(), 0u);
  BOOST_CHECK(pool.isEmpty());
  BOOST_CHECK(!pool.isFull());
  BOOST_CHECK(pool.live().begin() == pool.live().end());
}

BOOST_AUTO_TEST_CASE(TestAllocatesLowestSlotsFirst) {
  ParticlePool pool(8);
  auto handles = fill(pool, 3);
  BOOST_CHECK_EQUAL(handles[0].index, 0u);
  BOOST_CHECK_EQUAL(handles[1].index, 1u);
  BOOST_CHECK_EQUAL(handles[2].index, 2u);

  Particle *p = pool.get(handles[1]);
  BOOST_REQUIRE(p != nullptr);
  BOOST_CHECK(p->alive);
  BOOST_CHECK_EQUAL(p->age, 0.0f);
}

BOOST_AUTO_TEST_CASE(TestSaturationReturnsNullopt) {
  ParticlePool pool(4);
  fill(pool, 4);
  BOOST_CHECK(pool.isFull());
  BOOST_CHECK_EQUAL(pool.liveCount(), 4u);

  for (int i = 0; i < 10; ++i) {
    BOOST_CHECK(!pool.allocate().has_value());
  }
  BOOST_CHECK_EQUAL(pool.liveCount(), 4u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ParticlePoolReapTests)

BOOST_AUTO_TEST_CASE(TestReapOnlyExpired) {
  ParticlePool pool(8);
  auto handles = fill(pool, 4);

  pool.get(handles[0])->age = 1.0f; // Exactly at lifetime, still alive
  expire(pool, handles[2]);

  BOOST_CHECK_EQUAL(pool.reapExpired(), 1u);
  BOOST_CHECK_EQUAL(pool.liveCount(), 3u);
  BOOST_CHECK(pool.get(handles[0]) != nullptr);
  BOOST_CHECK(pool.get(handles[2]) == nullptr);
}

BOOST_AUTO_TEST_CASE(TestStaleHandleAfterReuse) {
  ParticlePool pool(2);
  auto handles = fill(pool, 2);
  expire(pool, handles[0]);
  pool.reapExpired();

  auto reused = pool.allocate();
  BOOST_REQUIRE(reused.has_value());
  BOOST_CHECK_EQUAL(reused->index, handles[0].index);
  BOOST_CHECK_NE(reused->generation, handles[0].generation);

  BOOST_CHECK(pool.get(handles[0]) == nullptr);
  BOOST_CHECK(pool.get(*reused) != nullptr);
}

BOOST_AUTO_TEST_CASE(TestFreedSlotsReusedLastInFirstOut) {
  ParticlePool pool(8);
  auto handles = fill(pool, 8);
  expire(pool, handles[2]);
  expire(pool, handles[5]);
  BOOST_CHECK_EQUAL(pool.reapExpired(), 2u);

  auto first = pool.allocate();
  auto second = pool.allocate();
  BOOST_REQUIRE(first.has_value() && second.has_value());
  BOOST_CHECK_EQUAL(first->index, 5u);
  BOOST_CHECK_EQUAL(second->index, 2u);
  BOOST_CHECK(pool.isFull());
}

BOOST_AUTO_TEST_CASE(TestOutOfRangeHandle) {
  ParticlePool pool(4);
  BOOST_CHECK(pool.get(SlotHandle{17, 1}) == nullptr);
  BOOST_CHECK(pool.get(SlotHandle{0, 1}) == nullptr);
}

BOOST_AUTO_TEST_CASE(TestClearFreesEverything) {
  ParticlePool pool(6);
  auto handles = fill(pool, 6);
  pool.clear();

  BOOST_CHECK_EQUAL(pool.liveCount(), 0u);
  BOOST_CHECK(pool.isEmpty());
  for (const auto &handle : handles) {
    BOOST_CHECK(pool.get(handle) == nullptr);
  }

  auto handle = pool.allocate();
  BOOST_REQUIRE(handle.has_value());
  BOOST_CHECK_EQUAL(handle->index, 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ParticlePoolIterationTests)

BOOST_AUTO_TEST_CASE(TestLiveRangeAscendingAndSkipsFree) {
  ParticlePool pool(10);
  auto handles = fill(pool, 10);
  for (size_t i = 0; i < handles.size(); i += 3) {
    expire(pool, handles[i]); // Slots 0, 3, 6, 9
  }
  pool.reapExpired();

  std::vector<size_t> visited;
  const ParticlePool &constPool = pool;
  for (auto it = constPool.live().begin(); it != constPool.live().end(); ++it) {
    BOOST_CHECK(it->alive);
    visited.push_back(it.slotIndex());
  }

  const std::vector<size_t> expected = {1, 2, 4, 5, 7, 8};
  BOOST_CHECK_EQUAL_COLLECTIONS(visited.begin(), visited.end(),
                                expected.begin(), expected.end());
  BOOST_CHECK_EQUAL(visited.size(), pool.liveCount());
}

BOOST_AUTO_TEST_CASE(TestLiveRangeAllowsMutation) {
  ParticlePool pool(5);
  fill(pool, 5);
  for (Particle &p : pool.live()) {
    p.size = 4.0f;
  }
  for (const Particle &p : pool.live()) {
    BOOST_CHECK_EQUAL(p.size, 4.0f);
  }
}

BOOST_AUTO_TEST_SUITE_END()
