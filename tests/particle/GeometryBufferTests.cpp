/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE GeometryBufferTests
#include <boost/test/unit_test.hpp>

#include "particles/GeometryBuffer.hpp"
#include "particles/ParticlePool.hpp"
#include <cstddef>
#include <vector>

using namespace Ember;

struct GeometryFixture {
  GeometryFixture() : pool(8) {}

  Particle &spawn(const Vector3D &position, float size, float rotation) {
    auto handle = pool.allocate();
    BOOST_REQUIRE(handle.has_value());
    Particle &p = *pool.get(*handle);
    p.position = position;
    p.size = size;
    p.rotation = rotation;
    p.color = SDL_FColor{0.1f, 0.2f, 0.3f, 0.4f};
    return p;
  }

  ParticlePool pool;
};

BOOST_AUTO_TEST_SUITE(GeometryLayoutTests)

BOOST_AUTO_TEST_CASE(TestVertexLayout) {
  BOOST_CHECK_EQUAL(sizeof(ParticleVertex), 44u);
  BOOST_CHECK_EQUAL(offsetof(ParticleVertex, x), 0u);
  BOOST_CHECK_EQUAL(offsetof(ParticleVertex, u), 12u);
  BOOST_CHECK_EQUAL(offsetof(ParticleVertex, color), 20u);
  BOOST_CHECK_EQUAL(offsetof(ParticleVertex, size), 36u);
  BOOST_CHECK_EQUAL(offsetof(ParticleVertex, rotation), 40u);
}

BOOST_AUTO_TEST_CASE(TestInstanceLayout) {
  BOOST_CHECK_EQUAL(sizeof(ParticleInstance), 36u);
  BOOST_CHECK_EQUAL(offsetof(ParticleInstance, color), 12u);
  BOOST_CHECK_EQUAL(offsetof(ParticleInstance, size), 28u);
  BOOST_CHECK_EQUAL(offsetof(ParticleInstance, rotation), 32u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(GeometryQuadTests, GeometryFixture)

BOOST_AUTO_TEST_CASE(TestEmptyPool) {
  GeometryBuffer buffer;
  buffer.build(pool);
  BOOST_CHECK(buffer.isEmpty());
  BOOST_CHECK_EQUAL(buffer.getVertexCount(), 0u);
  BOOST_CHECK_EQUAL(buffer.getIndexCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestQuadVertices) {
  spawn(Vector3D(1.0f, 2.0f, 3.0f), 0.5f, 0.25f);
  GeometryBuffer buffer;
  buffer.build(pool);

  BOOST_REQUIRE_EQUAL(buffer.getVertexCount(), 4u);
  BOOST_REQUIRE_EQUAL(buffer.getIndexCount(), 6u);
  BOOST_CHECK_EQUAL(buffer.getParticleCount(), 1u);
  BOOST_CHECK_EQUAL(buffer.getVertexStride(), sizeof(ParticleVertex));

  const float expectedU[] = {0.0f, 1.0f, 1.0f, 0.0f};
  const float expectedV[] = {0.0f, 0.0f, 1.0f, 1.0f};
  const auto &vertices = buffer.getVertices();
  for (size_t i = 0; i < 4; ++i) {
    BOOST_CHECK_EQUAL(vertices[i].x, 1.0f);
    BOOST_CHECK_EQUAL(vertices[i].y, 2.0f);
    BOOST_CHECK_EQUAL(vertices[i].z, 3.0f);
    BOOST_CHECK_EQUAL(vertices[i].u, expectedU[i]);
    BOOST_CHECK_EQUAL(vertices[i].v, expectedV[i]);
    BOOST_CHECK_EQUAL(vertices[i].size, 0.5f);
    BOOST_CHECK_EQUAL(vertices[i].rotation, 0.25f);
    BOOST_CHECK_EQUAL(vertices[i].color.a, 0.4f);
  }
}

BOOST_AUTO_TEST_CASE(TestQuadIndicesOffsetPerParticle) {
  spawn(Vector3D(), 1.0f, 0.0f);
  spawn(Vector3D(), 1.0f, 0.0f);
  spawn(Vector3D(), 1.0f, 0.0f);
  GeometryBuffer buffer;
  buffer.build(pool);

  const std::vector<uint32_t> expected = {0, 1, 2, 2,  3,  0, 4, 5, 6,
                                          6, 7, 4, 8, 9, 10, 10, 11, 8};
  const auto &indices = buffer.getIndices();
  BOOST_CHECK_EQUAL_COLLECTIONS(indices.begin(), indices.end(),
                                expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(TestAscendingSlotOrder) {
  spawn(Vector3D(0.0f, 0.0f, 0.0f), 1.0f, 0.0f);
  spawn(Vector3D(1.0f, 0.0f, 0.0f), 1.0f, 0.0f);
  Particle &third = spawn(Vector3D(2.0f, 0.0f, 0.0f), 1.0f, 0.0f);
  third.age = third.lifetime + 1.0f;
  pool.reapExpired();
  spawn(Vector3D(3.0f, 0.0f, 0.0f), 1.0f, 0.0f); // Reuses slot 2

  GeometryBuffer buffer;
  buffer.build(pool);
  const auto &vertices = buffer.getVertices();
  BOOST_REQUIRE_EQUAL(vertices.size(), 12u);
  BOOST_CHECK_EQUAL(vertices[0].x, 0.0f);
  BOOST_CHECK_EQUAL(vertices[4].x, 1.0f);
  BOOST_CHECK_EQUAL(vertices[8].x, 3.0f);
}

BOOST_AUTO_TEST_CASE(TestRebuildReplacesContents) {
  spawn(Vector3D(), 1.0f, 0.0f);
  spawn(Vector3D(), 1.0f, 0.0f);
  GeometryBuffer buffer;
  buffer.build(pool);
  const size_t reserved = buffer.getVertices().capacity();

  pool.clear();
  spawn(Vector3D(), 1.0f, 0.0f);
  buffer.build(pool);
  BOOST_CHECK_EQUAL(buffer.getVertexCount(), 4u);
  BOOST_CHECK_EQUAL(buffer.getIndexCount(), 6u);
  BOOST_CHECK_GE(buffer.getVertices().capacity(), reserved);

  buffer.clear();
  BOOST_CHECK(buffer.isEmpty());
  BOOST_CHECK_EQUAL(buffer.getVertexCount(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(GeometryInstancedTests, GeometryFixture)

BOOST_AUTO_TEST_CASE(TestInstanceRecords) {
  spawn(Vector3D(4.0f, 5.0f, 6.0f), 2.0f, 1.5f);
  spawn(Vector3D(7.0f, 8.0f, 9.0f), 3.0f, 0.5f);
  GeometryBuffer buffer(GeometryLayout::Instanced);
  buffer.build(pool);

  BOOST_CHECK_EQUAL(buffer.getVertexCount(), 2u);
  BOOST_CHECK_EQUAL(buffer.getIndexCount(), 0u);
  BOOST_CHECK(buffer.getVertices().empty());
  BOOST_CHECK_EQUAL(buffer.getVertexStride(), sizeof(ParticleInstance));

  const auto &instances = buffer.getInstances();
  BOOST_REQUIRE_EQUAL(instances.size(), 2u);
  BOOST_CHECK_EQUAL(instances[0].x, 4.0f);
  BOOST_CHECK_EQUAL(instances[0].size, 2.0f);
  BOOST_CHECK_EQUAL(instances[1].z, 9.0f);
  BOOST_CHECK_EQUAL(instances[1].rotation, 0.5f);
  BOOST_CHECK_EQUAL(instances[1].color.g, 0.2f);
}

BOOST_AUTO_TEST_CASE(TestLayoutSwitch) {
  spawn(Vector3D(), 1.0f, 0.0f);
  GeometryBuffer buffer;
  buffer.build(pool);
  BOOST_CHECK_EQUAL(buffer.getVertexCount(), 4u);

  buffer.setLayout(GeometryLayout::Instanced);
  BOOST_CHECK(buffer.getLayout() == GeometryLayout::Instanced);
  BOOST_CHECK(buffer.isEmpty());
  buffer.build(pool);
  BOOST_CHECK_EQUAL(buffer.getVertexCount(), 1u);
  BOOST_CHECK_EQUAL(buffer.getIndexCount(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()
