/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - cstdint: Required for uint8_t type
// - mutex: Required for thread-safe logging
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace Ember {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release for crashes)
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

/**
 * @brief Host-provided log destination
 *
 * Receives the level name ("CRITICAL", "ERROR", ...), the subsystem and the
 * message. Installed with Logger::SetSink; nullptr restores the default
 * destination (stdout in debug builds, a log file in release builds).
 */
using LogSink = void (*)(const char *level, const char *system,
                         const char *message);

#ifdef DEBUG
// Full console logging in debug builds
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::atomic<LogSink> s_sink;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void SetSink(LogSink sink) {
    s_sink.store(sink, std::memory_order_release);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    if (LogSink sink = s_sink.load(std::memory_order_acquire)) {
      sink(getLevelString(level), system, message);
      return;
    }
    printf("Ember Particles - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

#define EMBER_CRITICAL(system, msg)                                            \
  Ember::Logger::Log(Ember::LogLevel::CRITICAL, system, msg)
#define EMBER_ERROR(system, msg)                                               \
  Ember::Logger::Log(Ember::LogLevel::ERROR_LEVEL, system, msg)
#define EMBER_WARN(system, msg)                                                \
  Ember::Logger::Log(Ember::LogLevel::WARNING, system, msg)
#define EMBER_INFO(system, msg)                                                \
  Ember::Logger::Log(Ember::LogLevel::INFO, system, msg)
#define EMBER_DEBUG(system, msg)                                               \
  Ember::Logger::Log(Ember::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - CRITICAL/ERROR go to the sink or a log file, everything
// else compiles out
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::atomic<LogSink> s_sink;

public:
  static std::mutex s_logMutex; // Public for macro access

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void SetSink(LogSink sink) {
    s_sink.store(sink, std::memory_order_release);
  }

  // Implemented in Logger.cpp
  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define EMBER_CRITICAL(system, msg) Ember::Logger::Log("CRITICAL", system, msg)

#define EMBER_ERROR(system, msg) Ember::Logger::Log("ERROR", system, msg)

#define EMBER_WARN(system, msg) ((void)0)  // Zero overhead
#define EMBER_INFO(system, msg) ((void)0)  // Zero overhead
#define EMBER_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::atomic<LogSink> Logger::s_sink{nullptr};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each particle subsystem

#define PARTICLE_SYSTEM_CRITICAL(msg) EMBER_CRITICAL("ParticleSystem", msg)
#define PARTICLE_SYSTEM_ERROR(msg) EMBER_ERROR("ParticleSystem", msg)
#define PARTICLE_SYSTEM_WARN(msg) EMBER_WARN("ParticleSystem", msg)
#define PARTICLE_SYSTEM_INFO(msg) EMBER_INFO("ParticleSystem", msg)
#define PARTICLE_SYSTEM_DEBUG(msg) EMBER_DEBUG("ParticleSystem", msg)

#define POOL_CRITICAL(msg) EMBER_CRITICAL("ParticlePool", msg)
#define POOL_ERROR(msg) EMBER_ERROR("ParticlePool", msg)
#define POOL_WARN(msg) EMBER_WARN("ParticlePool", msg)
#define POOL_INFO(msg) EMBER_INFO("ParticlePool", msg)
#define POOL_DEBUG(msg) EMBER_DEBUG("ParticlePool", msg)

#define EMITTER_CRITICAL(msg) EMBER_CRITICAL("Emitter", msg)
#define EMITTER_ERROR(msg) EMBER_ERROR("Emitter", msg)
#define EMITTER_WARN(msg) EMBER_WARN("Emitter", msg)
#define EMITTER_INFO(msg) EMBER_INFO("Emitter", msg)
#define EMITTER_DEBUG(msg) EMBER_DEBUG("Emitter", msg)

#define CURVE_ERROR(msg) EMBER_ERROR("Curve", msg)
#define CURVE_WARN(msg) EMBER_WARN("Curve", msg)
#define CURVE_DEBUG(msg) EMBER_DEBUG("Curve", msg)

#define NOISE_ERROR(msg) EMBER_ERROR("NoiseField", msg)
#define NOISE_WARN(msg) EMBER_WARN("NoiseField", msg)
#define NOISE_DEBUG(msg) EMBER_DEBUG("NoiseField", msg)

#define SHAPE_ERROR(msg) EMBER_ERROR("SpawnShape", msg)
#define SHAPE_WARN(msg) EMBER_WARN("SpawnShape", msg)
#define SHAPE_DEBUG(msg) EMBER_DEBUG("SpawnShape", msg)

#define GEOMETRY_ERROR(msg) EMBER_ERROR("GeometryBuffer", msg)
#define GEOMETRY_WARN(msg) EMBER_WARN("GeometryBuffer", msg)
#define GEOMETRY_DEBUG(msg) EMBER_DEBUG("GeometryBuffer", msg)

#define PRESET_WARN(msg) EMBER_WARN("ParticlePresets", msg)
#define PRESET_INFO(msg) EMBER_INFO("ParticlePresets", msg)

// Benchmark mode convenience macros
#define EMBER_ENABLE_BENCHMARK_MODE() Ember::Logger::SetBenchmarkMode(true)
#define EMBER_DISABLE_BENCHMARK_MODE() Ember::Logger::SetBenchmarkMode(false)

#define EMBER_SET_LOG_SINK(sink) Ember::Logger::SetSink(sink)

} // namespace Ember

#endif // LOGGER_HPP
