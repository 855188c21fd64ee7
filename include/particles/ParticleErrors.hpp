/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PARTICLE_ERRORS_HPP
#define PARTICLE_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace Ember {

/**
 * @brief Thrown at construction time for invalid particle configuration
 *
 * Covers empty or unsorted curve keyframes, zero pool capacity, negative shape
 * dimensions, invalid noise parameters, non-positive lifetimes and curve
 * handles that do not resolve. A constructor that throws leaves nothing
 * behind.
 */
class ConfigError : public std::invalid_argument {
public:
  explicit ConfigError(const std::string &message)
      : std::invalid_argument(message) {}
};

/**
 * @brief Result of a per-frame ParticleSystem::update call
 */
enum class UpdateStatus : uint8_t {
  Ok = 0,
  InvalidTimestep = 1 // dt negative or non-finite, frame rejected untouched
};

} // namespace Ember

#endif // PARTICLE_ERRORS_HPP
