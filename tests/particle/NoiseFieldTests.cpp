/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE NoiseFieldTests
#include <boost/test/unit_test.hpp>

#include "particles/NoiseField.hpp"
#include "particles/ParticleErrors.hpp"
#include "particles/RandomSource.hpp"
#include <cmath>
#include <limits>

using namespace Ember;

namespace {

bool inUnitBox(const Vector3D &v) {
  return std::abs(v.getX()) <= 1.0f && std::abs(v.getY()) <= 1.0f &&
         std::abs(v.getZ()) <= 1.0f;
}

} // namespace

BOOST_AUTO_TEST_SUITE(NoiseFieldSamplingTests)

BOOST_AUTO_TEST_CASE(TestDeterministicForSameConfig) {
  NoiseFieldConfig config;
  config.seed = 99;
  NoiseField a(config);
  NoiseField b(config);

  RandomSource rng(1);
  for (int i = 0; i < 200; ++i) {
    Vector3D p(rng.nextRange(-20.0f, 20.0f), rng.nextRange(-20.0f, 20.0f),
               rng.nextRange(-20.0f, 20.0f));
    float t = rng.nextRange(0.0f, 10.0f);
    BOOST_REQUIRE(a.sample(p, t) == b.sample(p, t));
  }
}

BOOST_AUTO_TEST_CASE(TestSeedChangesField) {
  NoiseFieldConfig configA;
  configA.seed = 1;
  NoiseFieldConfig configB;
  configB.seed = 2;
  NoiseField a(configA);
  NoiseField b(configB);

  int differences = 0;
  for (int i = 0; i < 50; ++i) {
    Vector3D p(i * 0.37f + 0.1f, i * 0.11f + 0.2f, i * 0.23f + 0.3f);
    if (!(a.sample(p, 0.0f) == b.sample(p, 0.0f))) {
      differences++;
    }
  }
  BOOST_CHECK_GT(differences, 40);
}

BOOST_AUTO_TEST_CASE(TestOutputBounded) {
  NoiseFieldConfig config;
  config.octaves = 6;
  config.persistence = 1.0f;
  NoiseField field(config);

  RandomSource rng(5);
  for (int i = 0; i < 5000; ++i) {
    Vector3D p(rng.nextRange(-100.0f, 100.0f), rng.nextRange(-100.0f, 100.0f),
               rng.nextRange(-100.0f, 100.0f));
    BOOST_REQUIRE(inUnitBox(field.sample(p, rng.nextRange(0.0f, 100.0f))));
  }
}

BOOST_AUTO_TEST_CASE(TestZeroAtLatticePoints) {
  NoiseField field;
  BOOST_CHECK_SMALL(field.noise(3.0f, 7.0f, 11.0f), 1e-6f);
  BOOST_CHECK_SMALL(field.noise(-4.0f, 0.0f, 250.0f), 1e-6f);
}

BOOST_AUTO_TEST_CASE(TestFieldIsContinuous) {
  NoiseField field;
  RandomSource rng(8);
  for (int i = 0; i < 500; ++i) {
    Vector3D p(rng.nextRange(-10.0f, 10.0f), rng.nextRange(-10.0f, 10.0f),
               rng.nextRange(-10.0f, 10.0f));
    Vector3D q = p + Vector3D(1e-3f, 1e-3f, 1e-3f);
    BOOST_REQUIRE_LT((field.sample(p, 1.0f) - field.sample(q, 1.0f)).length(),
                     0.1f);
  }
}

BOOST_AUTO_TEST_CASE(TestTimeAnimatesField) {
  NoiseField field;
  int differences = 0;
  for (int i = 0; i < 20; ++i) {
    Vector3D p(i * 0.5f + 0.25f, 0.3f, -0.7f);
    if (!(field.sample(p, 0.0f) == field.sample(p, 0.75f))) {
      differences++;
    }
  }
  BOOST_CHECK_GT(differences, 15);
}

BOOST_AUTO_TEST_CASE(TestZeroTimeScaleFreezesField) {
  NoiseFieldConfig config;
  config.timeScale = 0.0f;
  NoiseField field(config);
  Vector3D p(1.3f, -2.1f, 0.4f);
  BOOST_CHECK(field.sample(p, 0.0f) == field.sample(p, 42.0f));
}

BOOST_AUTO_TEST_CASE(TestFarPositionsStayFinite) {
  NoiseField field;
  Vector3D far(1.0e6f, -3.5e6f, 7.25e5f);
  Vector3D v = field.sample(far, 1.0e5f);
  BOOST_CHECK(v.isFinite());
  BOOST_CHECK(inUnitBox(v));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(NoiseFieldValidationTests)

BOOST_AUTO_TEST_CASE(TestInvalidConfigRejected) {
  NoiseFieldConfig config;

  config.frequency = 0.0f;
  BOOST_CHECK_THROW(NoiseField{config}, ConfigError);
  config = NoiseFieldConfig{};
  config.octaves = 0;
  BOOST_CHECK_THROW(NoiseField{config}, ConfigError);
  config.octaves = NoiseField::MAX_OCTAVES + 1;
  BOOST_CHECK_THROW(NoiseField{config}, ConfigError);
  config = NoiseFieldConfig{};
  config.lacunarity = -2.0f;
  BOOST_CHECK_THROW(NoiseField{config}, ConfigError);
  config = NoiseFieldConfig{};
  config.persistence = 0.0f;
  BOOST_CHECK_THROW(NoiseField{config}, ConfigError);
  config.persistence = 1.5f;
  BOOST_CHECK_THROW(NoiseField{config}, ConfigError);
  config = NoiseFieldConfig{};
  config.timeScale = std::numeric_limits<float>::infinity();
  BOOST_CHECK_THROW(NoiseField{config}, ConfigError);
}

BOOST_AUTO_TEST_CASE(TestValidConfigAccepted) {
  NoiseFieldConfig config;
  config.octaves = NoiseField::MAX_OCTAVES;
  config.persistence = 1.0f;
  BOOST_CHECK_NO_THROW(NoiseField{config});
}

BOOST_AUTO_TEST_SUITE_END()
