/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/NoiseField.hpp"
#include "core/Logger.hpp"
#include "particles/ParticleErrors.hpp"
#include "particles/RandomSource.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>
#include <utility>

namespace Ember {

namespace {

// Decorrelates the three output axes
const Vector3D AXIS_OFFSET_Y(31.416f, 47.853f, 12.793f);
const Vector3D AXIS_OFFSET_Z(-71.190f, 23.110f, 59.470f);

// Folds a coordinate into one lattice period so the int conversion below
// stays exact however far a particle drifts
inline float wrapLattice(float v) {
  return v - 256.0f * std::floor(v * (1.0f / 256.0f));
}

} // namespace

NoiseField::NoiseField(const NoiseFieldConfig &config) : m_config(config) {
  if (!std::isfinite(config.frequency) || config.frequency <= 0.0f) {
    throw ConfigError(std::format("NoiseField frequency must be positive: {}",
                                  config.frequency));
  }
  if (config.octaves < 1 || config.octaves > MAX_OCTAVES) {
    throw ConfigError(std::format("NoiseField octaves must be in [1, {}]: {}",
                                  MAX_OCTAVES, config.octaves));
  }
  if (!std::isfinite(config.lacunarity) || config.lacunarity <= 0.0f) {
    throw ConfigError(std::format("NoiseField lacunarity must be positive: {}",
                                  config.lacunarity));
  }
  if (!std::isfinite(config.persistence) || config.persistence <= 0.0f ||
      config.persistence > 1.0f) {
    throw ConfigError(std::format(
        "NoiseField persistence must be in (0, 1]: {}", config.persistence));
  }
  if (!std::isfinite(config.timeScale)) {
    throw ConfigError("NoiseField time scale must be finite");
  }

  // Fisher-Yates driven by RandomSource keeps the table identical across
  // standard libraries, unlike std::shuffle
  std::array<uint8_t, 256> base{};
  std::iota(base.begin(), base.end(), static_cast<uint8_t>(0));
  RandomSource rng(config.seed);
  for (uint32_t i = 255; i > 0; --i) {
    std::swap(base[i], base[rng.nextUInt(i + 1)]);
  }
  for (size_t i = 0; i < 512; ++i) {
    m_permutation[i] = base[i & 255];
  }

  float amplitude = 1.0f;
  float sum = 0.0f;
  for (uint32_t o = 0; o < config.octaves; ++o) {
    sum += amplitude;
    amplitude *= config.persistence;
  }
  m_amplitudeNorm = 1.0f / sum;

  NOISE_DEBUG(std::format("NoiseField ready: seed {}, frequency {}, {} octaves",
                          config.seed, config.frequency, config.octaves));
}

float NoiseField::fade(float t) {
  return t * t * t * (t * (t * 6 - 15) + 10);
}

float NoiseField::lerp(float t, float a, float b) { return a + t * (b - a); }

float NoiseField::grad(int hash, float x, float y, float z) {
  int h = hash & 15;
  float u = h < 8 ? x : y;
  float v = h < 4 ? y : h == 12 || h == 14 ? x : z;
  return ((h & 1) == 0 ? u : -u) + ((h & 2) == 0 ? v : -v);
}

float NoiseField::noise(float x, float y, float z) const {
  x = wrapLattice(x);
  y = wrapLattice(y);
  z = wrapLattice(z);

  int X = static_cast<int>(std::floor(x)) & 255;
  int Y = static_cast<int>(std::floor(y)) & 255;
  int Z = static_cast<int>(std::floor(z)) & 255;

  x -= std::floor(x);
  y -= std::floor(y);
  z -= std::floor(z);

  float u = fade(x);
  float v = fade(y);
  float w = fade(z);

  const auto &p = m_permutation;
  int A = p[X] + Y;
  int AA = p[A] + Z;
  int AB = p[A + 1] + Z;
  int B = p[X + 1] + Y;
  int BA = p[B] + Z;
  int BB = p[B + 1] + Z;

  return lerp(
      w,
      lerp(v, lerp(u, grad(p[AA], x, y, z), grad(p[BA], x - 1, y, z)),
           lerp(u, grad(p[AB], x, y - 1, z), grad(p[BB], x - 1, y - 1, z))),
      lerp(v,
           lerp(u, grad(p[AA + 1], x, y, z - 1),
                grad(p[BA + 1], x - 1, y, z - 1)),
           lerp(u, grad(p[AB + 1], x, y - 1, z - 1),
                grad(p[BB + 1], x - 1, y - 1, z - 1))));
}

float NoiseField::fractal(float x, float y, float z) const {
  float frequency = m_config.frequency;
  float amplitude = 1.0f;
  float sum = 0.0f;
  for (uint32_t o = 0; o < m_config.octaves; ++o) {
    sum += amplitude * noise(x * frequency, y * frequency, z * frequency);
    frequency *= m_config.lacunarity;
    amplitude *= m_config.persistence;
  }
  return std::clamp(sum * m_amplitudeNorm, -1.0f, 1.0f);
}

Vector3D NoiseField::sample(const Vector3D &position, float time) const {
  const float shift = time * m_config.timeScale;
  const Vector3D p = position + Vector3D(shift, shift, shift);
  const Vector3D py = p + AXIS_OFFSET_Y;
  const Vector3D pz = p + AXIS_OFFSET_Z;
  return Vector3D(fractal(p.getX(), p.getY(), p.getZ()),
                  fractal(py.getX(), py.getY(), py.getZ()),
                  fractal(pz.getX(), pz.getY(), pz.getZ()));
}

} // namespace Ember
