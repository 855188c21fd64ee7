/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE LoggerTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "particles/ParticleErrors.hpp"
#include "particles/ParticleSystem.hpp"
#include "particles/SpawnShape.hpp"
#include <string>
#include <vector>

using namespace Ember;

namespace {

struct CapturedLine {
  std::string level;
  std::string system;
  std::string message;
};

std::vector<CapturedLine> g_captured;

void captureSink(const char *level, const char *system, const char *message) {
  g_captured.push_back({level, system, message});
}

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

struct LoggerFixture {
  LoggerFixture() {
    g_captured.clear();
    EMBER_DISABLE_BENCHMARK_MODE();
    EMBER_SET_LOG_SINK(&captureSink);
  }

  ~LoggerFixture() {
    EMBER_SET_LOG_SINK(nullptr);
    g_captured.clear();
  }
};

BOOST_FIXTURE_TEST_SUITE(LoggerSinkTests, LoggerFixture)

BOOST_AUTO_TEST_CASE(TestErrorReachesSink) {
  EMBER_ERROR("Emitter", std::string("bad burst"));

  BOOST_REQUIRE_EQUAL(g_captured.size(), 1u);
  BOOST_CHECK_EQUAL(g_captured[0].level, "ERROR");
  BOOST_CHECK_EQUAL(g_captured[0].system, "Emitter");
  BOOST_CHECK_EQUAL(g_captured[0].message, "bad burst");
}

BOOST_AUTO_TEST_CASE(TestCriticalReachesSink) {
  POOL_CRITICAL("out of slots");

  BOOST_REQUIRE_EQUAL(g_captured.size(), 1u);
  BOOST_CHECK_EQUAL(g_captured[0].level, "CRITICAL");
  BOOST_CHECK_EQUAL(g_captured[0].system, "ParticlePool");
}

BOOST_AUTO_TEST_CASE(TestBenchmarkModeSilencesSink) {
  EMBER_ENABLE_BENCHMARK_MODE();
  BOOST_CHECK(Logger::IsBenchmarkMode());
  EMBER_ERROR("Emitter", "dropped");
  EMBER_DISABLE_BENCHMARK_MODE();

  BOOST_CHECK(g_captured.empty());
}

BOOST_AUTO_TEST_CASE(TestShapeValidationLogsError) {
  BOOST_CHECK_THROW(SpawnShape shape(SphereShape{-1.0f}), ConfigError);

  BOOST_REQUIRE_EQUAL(g_captured.size(), 1u);
  BOOST_CHECK_EQUAL(g_captured[0].system, "SpawnShape");
  BOOST_CHECK(g_captured[0].message.find("radius") != std::string::npos);
}

#ifdef DEBUG
// WARN and below only exist in debug builds
BOOST_AUTO_TEST_CASE(TestInvalidTimestepWarns) {
  EmitterConfig emitter;
  emitter.rate = 0.0f;
  ParticleSystem system(ParticleSystemConfig{}, emitter, {}, CurveSet{});
  g_captured.clear();

  BOOST_CHECK(system.update(-1.0f) == UpdateStatus::InvalidTimestep);

  BOOST_REQUIRE_EQUAL(g_captured.size(), 1u);
  BOOST_CHECK_EQUAL(g_captured[0].level, "WARNING");
  BOOST_CHECK_EQUAL(g_captured[0].system, "ParticleSystem");
}
#endif

BOOST_AUTO_TEST_SUITE_END()
