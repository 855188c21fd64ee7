/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef NOISE_FIELD_HPP
#define NOISE_FIELD_HPP

#include "utils/Vector3D.hpp"
#include <array>
#include <cstdint>

namespace Ember {

struct NoiseFieldConfig {
  uint32_t seed{1337};     // Permutation seed
  float frequency{1.0f};   // Lattice cells per world unit, > 0
  uint32_t octaves{3};     // Fractal layers, 1..MAX_OCTAVES
  float lacunarity{2.0f};  // Frequency multiplier per octave, > 0
  float persistence{0.5f}; // Amplitude multiplier per octave, (0, 1]
  float timeScale{1.0f};   // How fast the field scrolls through time
};

/**
 * @brief Animated fractal Perlin noise producing a vector per point
 *
 * Each output axis samples the same 3D lattice at a fixed offset, and time
 * translates the sample point along the lattice diagonal. Octaves are
 * normalized by their amplitude sum and the result is clamped, so every
 * component lies in [-1, 1] before a modifier scales it. The permutation table
 * is built once from the seed; sampling is a pure function and safe to call
 * concurrently.
 */
class NoiseField {
public:
  static constexpr uint32_t MAX_OCTAVES = 8;

  /**
   * @throws ConfigError for non-positive frequency or lacunarity, persistence
   * outside (0, 1], octave count outside [1, MAX_OCTAVES] or a non-finite
   * time scale
   */
  explicit NoiseField(const NoiseFieldConfig &config = NoiseFieldConfig{});

  Vector3D sample(const Vector3D &position, float time) const;

  /**
   * @brief Single-octave improved Perlin noise in roughly [-1, 1]
   */
  float noise(float x, float y, float z) const;

  /**
   * @brief Fractal sum of noise() over the configured octaves, in [-1, 1]
   */
  float fractal(float x, float y, float z) const;

  const NoiseFieldConfig &getConfig() const { return m_config; }

private:
  static float fade(float t);
  static float lerp(float t, float a, float b);
  static float grad(int hash, float x, float y, float z);

  NoiseFieldConfig m_config;
  float m_amplitudeNorm{1.0f};
  std::array<uint8_t, 512> m_permutation{};
};

} // namespace Ember

#endif // NOISE_FIELD_HPP
